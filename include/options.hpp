#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <string>
#include <vector>
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file; ///< Empty uses default_log_path()
    size_t max_log_size = 1024 * 1024;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
};

/** How status event streams are rendered. */
enum class OutputStyle { Progress, Json, Verbose };

struct Options {
    std::string command;           ///< Subcommand, e.g. "upload"
    std::vector<std::string> args; ///< Positional arguments after the subcommand
    OutputStyle style = OutputStyle::Progress;
    bool short_status = false;
    bool content = false;
    bool show_help = false;
    bool print_version = false;
    std::vector<std::string> remotes; ///< --to, repeatable
    std::string message;
    unsigned max_count = 10;
    std::string revision; ///< --id
    std::string copy_to;
    std::string config_file;
    LoggingOptions logging;
};

/**
 * @brief Parse the command line into an Options structure.
 *
 * @throws std::runtime_error for unknown flags, invalid values and
 *         conflicting output styles.
 */
Options parse_options(int argc, char* argv[]);

/** @overload */
Options parse_options(const std::vector<std::string>& args);

/** @brief Names of all subcommands in help order. */
const std::vector<std::string>& command_names();

#endif // OPTIONS_HPP
