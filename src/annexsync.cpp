/**
 * @file annexsync.cpp
 * @brief CLI entry point driving git and git-annex for file synchronisation.
 *
 * Parses the command line, sets up logging and hands the selected command
 * to the handlers in cli_commands.cpp.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "config_utils.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "tool_versions.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return int Zero on success or when printing help/version; the command's
 *             exit code otherwise; 1 on unexpected errors.
 */
#ifndef ANNEXSYNC_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            ClientConfig cfg = load_client_config(opts.config_file);
            std::cout << "annexsync " << ANNEXSYNC_VERSION << "\n"
                      << versions::describe(cfg.tools) << "\n";
            return 0;
        }
        if (opts.command.empty()) {
            print_help(argv[0]);
            return 1;
        }
        const LoggingOptions& lo = opts.logging;
        std::string log_path = lo.log_file.empty() ? default_log_path() : lo.log_file;
        set_json_logging(lo.json_log);
        set_log_compression(lo.compress_logs);
        init_logger(log_path, lo.log_level, lo.max_log_size, lo.max_log_files);
        int rc = cli::run_command(opts);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        log_error(e.what());
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
#endif // ANNEXSYNC_NO_MAIN
