#include "engine_options.hpp"

#include <sstream>
#include <stdexcept>

namespace tickets {

bool try_parse_int(const std::string& text, int& out_value) {
    if (text.empty()) return false;
    try {
        std::size_t pos = 0;
        const int value = std::stoi(text, &pos);
        if (pos != text.size()) return false; // trailing junk, e.g. "12x"
        out_value = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parse_engine_options(int argc, const char* const* argv,
                          EngineOptions& out_options, std::string& out_error) {
    out_error.clear();

    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        if (flag == "--help") {
            out_options.show_help = true;
            continue;
        }

        int* target = nullptr;
        if (flag == "-c") target = &out_options.exchange_stock;
        else if (flag == "-m") target = &out_options.movies;
        else if (flag == "-h") target = &out_options.showings;
        else if (flag == "-e") target = &out_options.seats;
        else if (flag == "-w") target = &out_options.windows;
        else if (flag != "-l" && flag != "-f") {
            out_error = "Unknown option: " + flag;
            return false;
        }

        if (i + 1 >= argc) {
            out_error = "Missing value for " + flag;
            return false;
        }
        const std::string value = argv[++i];

        if (target) {
            if (!try_parse_int(value, *target)) {
                out_error = "Value for " + flag + " is not an integer: " + value;
                return false;
            }
        } else if (flag == "-l") {
            if (!logging::parse_log_level(value, out_options.log_level)) {
                out_error = "Unknown log level: " + value + " (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)";
                return false;
            }
        } else {
            out_options.log_file = value;
        }
    }
    return true;
}

std::string engine_options_usage(const std::string& program) {
    const EngineOptions defaults;
    std::ostringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "  -c <n>      goodie exchanges available (default " << defaults.exchange_stock << ")\n"
       << "  -m <n>      number of movies (default " << defaults.movies << ")\n"
       << "  -h <n>      showings per movie (default " << defaults.showings << ")\n"
       << "  -e <n>      seats per showing (default " << defaults.seats << ")\n"
       << "  -w <n>      ticket windows (default " << defaults.windows << ")\n"
       << "  -l <LEVEL>  log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default "
       << logging::log_level_name(defaults.log_level) << ")\n"
       << "  -f <file>   also write the log to <file>\n"
       << "  --help      show this text\n";
    return ss.str();
}

} // namespace tickets
