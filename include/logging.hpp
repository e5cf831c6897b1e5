#pragma once

#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

/**
 * @file logging.hpp
 * @brief Leveled, thread-safe logger used by the engine and the CLI.
 */

namespace tickets {
namespace logging {

/**
 * @brief Log severities, least to most severe.
 *
 * A logger prints messages at its threshold level or above.
 */
enum class LogLevel : std::uint8_t {
    trace,
    debug,
    info,
    warn,
    error,
    fatal
};

/**
 * @brief Parses an upper-case level name (TRACE, DEBUG, INFO, WARN, ERROR, FATAL).
 *
 * @param name Level name.
 * @param out_level Parsed level on success.
 * @return True if the name is a known level; false otherwise.
 */
bool parse_log_level(const std::string& name, LogLevel& out_level);

/**
 * @brief Returns the upper-case name of a level.
 */
std::string log_level_name(LogLevel level);

/**
 * @brief Writes log lines to stdout and/or an optional stream.
 *
 * @details
 * Every line is "<UTC timestamp> [LEVEL] arg1 arg2 ...". The line is fully
 * formatted before the stream mutex is taken, so concurrent callers never
 * interleave within a line.
 *
 * fatal() only logs. Deciding to terminate is left to the hosting process.
 */
class Logger {
public:
    /**
     * @brief Creates a logger.
     *
     * @param level Threshold level.
     * @param use_stdout Mirror output to std::cout.
     * @param sink Extra output stream (e.g. a log file); may be null.
     */
    explicit Logger(LogLevel level,
                    bool use_stdout = true,
                    std::unique_ptr<std::ostream> sink = nullptr);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level);
    LogLevel level() const;

    void set_stdout_enabled(bool enabled);

    /** @brief Replaces the extra output stream (null disables it). */
    void set_sink(std::unique_ptr<std::ostream> sink);

    template <typename... Args>
    void trace(Args&&... args) { write(LogLevel::trace, std::forward<Args>(args)...); }

    template <typename... Args>
    void debug(Args&&... args) { write(LogLevel::debug, std::forward<Args>(args)...); }

    template <typename... Args>
    void info(Args&&... args) { write(LogLevel::info, std::forward<Args>(args)...); }

    template <typename... Args>
    void warn(Args&&... args) { write(LogLevel::warn, std::forward<Args>(args)...); }

    template <typename... Args>
    void error(Args&&... args) { write(LogLevel::error, std::forward<Args>(args)...); }

    template <typename... Args>
    void fatal(Args&&... args) { write(LogLevel::fatal, std::forward<Args>(args)...); }

private:
    mutable std::mutex mut_;              /**< Guards level_, use_stdout_, sink_ and the output streams. */
    LogLevel level_;
    bool use_stdout_;
    std::unique_ptr<std::ostream> sink_;

    static void write_prefix(std::ostringstream& ss, LogLevel level);
    void emit(LogLevel level, const std::string& line);
    bool enabled(LogLevel level) const;

    template <typename... Args>
    void write(LogLevel level, Args&&... args) {
        if (!enabled(level)) return;
        std::ostringstream ss;
        write_prefix(ss, level);
        ((ss << ' ' << std::forward<Args>(args)), ...);
        ss << '\n';
        emit(level, ss.str());
    }
};

} // namespace logging
} // namespace tickets
