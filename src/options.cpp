#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

const std::vector<std::string>& command_names() {
    static const std::vector<std::string> names = {
        "init",       "clone",         "add",           "commit",
        "upload",     "download",      "sync",          "get-content",
        "remove-content", "lock",      "unlock",        "ls",
        "log",        "version",       "checkout-copies", "remotes",
        "add-remote", "remove-remote", "use-remote",    "tool-versions",
    };
    return names;
}

Options parse_options(const std::vector<std::string>& argv) {
    const std::set<std::string> known{"--json",         "--verbose",   "--short",
                                      "--content",      "--to",        "--message",
                                      "--max-count",    "--id",        "--copy-to",
                                      "--config",       "--log-level", "--log-file",
                                      "--json-log",     "--compress-logs",
                                      "--max-log-size", "--help",      "--version"};
    const std::set<std::string> values{"--to",        "--message",  "--max-count",
                                       "--id",        "--copy-to",  "--config",
                                       "--log-level", "--log-file", "--max-log-size"};
    const std::map<char, std::string> short_opts{{'m', "--message"}, {'n', "--max-count"},
                                                 {'s', "--short"},   {'h', "--help"},
                                                 {'V', "--version"}, {'v', "--verbose"}};
    ArgParser parser(argv, known, short_opts, values);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    bool verbose = parser.has_flag("--verbose");
    bool json = parser.has_flag("--json");
    if (verbose && json)
        throw std::runtime_error("--verbose and --json cannot be used together");
    if (verbose)
        opts.style = OutputStyle::Verbose;
    else if (json)
        opts.style = OutputStyle::Json;
    opts.short_status = parser.has_flag("--short");
    opts.content = parser.has_flag("--content");
    opts.remotes = parser.get_all_options("--to");
    opts.message = parser.get_option("--message");
    opts.revision = parser.get_option("--id");
    opts.copy_to = parser.get_option("--copy-to");
    opts.config_file = parser.get_option("--config");

    bool ok = false;
    if (parser.has_flag("--max-count")) {
        opts.max_count = parse_uint(parser, "--max-count", 0, 1000000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-count");
    }
    if (parser.has_flag("--log-level")) {
        if (!parse_log_level(parser.get_option("--log-level"), opts.logging.log_level))
            throw std::runtime_error("Invalid log level: " + parser.get_option("--log-level"));
    }
    opts.logging.log_file = parser.get_option("--log-file");
    opts.logging.json_log = parser.has_flag("--json-log");
    opts.logging.compress_logs = parser.has_flag("--compress-logs");
    if (parser.has_flag("--max-log-size")) {
        opts.logging.max_log_size =
            static_cast<size_t>(parse_bytes(parser, "--max-log-size", ok));
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }

    const auto& pos = parser.positional();
    if (!pos.empty()) {
        opts.command = pos.front();
        opts.args.assign(pos.begin() + 1, pos.end());
        const auto& names = command_names();
        if (std::find(names.begin(), names.end(), opts.command) == names.end())
            throw std::runtime_error("Unknown command: " + opts.command);
    }
    return opts;
}

Options parse_options(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);
    return parse_options(args);
}
