#include "logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>

namespace tickets {
namespace logging {

bool parse_log_level(const std::string& name, LogLevel& out_level) {
    if (name == "TRACE") { out_level = LogLevel::trace; return true; }
    if (name == "DEBUG") { out_level = LogLevel::debug; return true; }
    if (name == "INFO")  { out_level = LogLevel::info;  return true; }
    if (name == "WARN")  { out_level = LogLevel::warn;  return true; }
    if (name == "ERROR") { out_level = LogLevel::error; return true; }
    if (name == "FATAL") { out_level = LogLevel::fatal; return true; }
    return false;
}

std::string log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::trace: return "TRACE";
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info:  return "INFO";
        case LogLevel::warn:  return "WARN";
        case LogLevel::error: return "ERROR";
        case LogLevel::fatal: return "FATAL";
    }
    return "UNKNOWN";
}

Logger::Logger(LogLevel level, bool use_stdout, std::unique_ptr<std::ostream> sink)
    : level_(level), use_stdout_(use_stdout), sink_(std::move(sink)) {}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mut_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mut_);
    return level_;
}

void Logger::set_stdout_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mut_);
    use_stdout_ = enabled;
}

void Logger::set_sink(std::unique_ptr<std::ostream> sink) {
    std::lock_guard<std::mutex> lock(mut_);
    sink_ = std::move(sink);
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mut_);
    return level_ <= level;
}

// Timestamp with millisecond precision, always UTC so lines sort across hosts
void Logger::write_prefix(std::ostringstream& ss, LogLevel level) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&secs, &utc);
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << ms.count() << 'Z'
       << " [" << log_level_name(level) << "]";
}

void Logger::emit(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lock(mut_);
    if (level_ > level) return; // threshold may have changed since enabled()
    if (use_stdout_) {
        std::cout << line;
    }
    if (sink_) {
        *sink_ << line;
        sink_->flush();
    }
}

} // namespace logging
} // namespace tickets
