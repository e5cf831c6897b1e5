#pragma once

#include <string>

#include "logging.hpp"

/**
 * @file engine_options.hpp
 * @brief Startup options of the ticket CLI.
 */

namespace tickets {

/**
 * @brief Startup parameters, with the theatre's usual defaults.
 *
 * Range checks are left to InventoryEngine::initialize(), which reports
 * them as configuration errors.
 */
struct EngineOptions {
    int exchange_stock = 200;
    int movies = 5;
    int showings = 4;
    int seats = 100;
    int windows = 2;
    logging::LogLevel log_level = logging::LogLevel::info;
    std::string log_file;      /**< Empty: log to stdout only. */
    bool show_help = false;    /**< --help was given. */
};

/**
 * @brief Parses command-line flags into @p out_options.
 *
 * Flags: -c <stock> -m <movies> -h <showings> -e <seats> -w <windows>
 *        -l <LEVEL> -f <logfile> --help
 *
 * @param argc Argument count (as passed to main).
 * @param argv Argument vector (argv[0] is skipped).
 * @param out_options Updated in place; fields without a flag keep their value.
 * @param out_error Filled with the reason on failure; cleared on entry.
 * @return True on success; false on an unknown flag, a missing value or a
 *         value that is not a whole integer / known log level.
 */
bool parse_engine_options(int argc, const char* const* argv,
                          EngineOptions& out_options, std::string& out_error);

/**
 * @brief Usage text for the flags above.
 */
std::string engine_options_usage(const std::string& program);

/**
 * @brief Parses a whole decimal integer ("12", "-3"); rejects "12x", "" and overflow.
 */
bool try_parse_int(const std::string& text, int& out_value);

} // namespace tickets
