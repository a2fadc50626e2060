#include "test_common.hpp"
#include <stdexcept>

static Options parse(std::vector<std::string> args) { return parse_options(args); }

TEST_CASE("parse_options subcommand and paths") {
    Options opts = parse({"upload", "a.bin", "dir/b.bin"});
    REQUIRE(opts.command == "upload");
    REQUIRE(opts.args == std::vector<std::string>{"a.bin", "dir/b.bin"});
    REQUIRE(opts.style == OutputStyle::Progress);
}

TEST_CASE("parse_options flags before and after the subcommand") {
    Options opts = parse({"--json", "ls", "--short", "docs"});
    REQUIRE(opts.command == "ls");
    REQUIRE(opts.style == OutputStyle::Json);
    REQUIRE(opts.short_status);
    REQUIRE(opts.args == std::vector<std::string>{"docs"});
}

TEST_CASE("parse_options verbose and json conflict") {
    REQUIRE_THROWS_WITH(parse({"--json", "-v", "sync"}),
                        "--verbose and --json cannot be used together");
}

TEST_CASE("parse_options verbose style") {
    Options opts = parse({"sync", "--verbose", "--content"});
    REQUIRE(opts.style == OutputStyle::Verbose);
    REQUIRE(opts.content);
}

TEST_CASE("parse_options repeatable remotes") {
    Options opts = parse({"upload", "--to", "origin", "--to=backup"});
    REQUIRE(opts.remotes == std::vector<std::string>{"origin", "backup"});
}

TEST_CASE("parse_options commit message") {
    Options opts = parse({"commit", "-m", "Add figures", "fig.png"});
    REQUIRE(opts.message == "Add figures");
    REQUIRE(opts.args == std::vector<std::string>{"fig.png"});
}

TEST_CASE("parse_options version selection") {
    Options opts = parse({"version", "--id", "abc123", "--copy-to", "old", "-n", "5"});
    REQUIRE(opts.command == "version");
    REQUIRE(opts.revision == "abc123");
    REQUIRE(opts.copy_to == "old");
    REQUIRE(opts.max_count == 5);
}

TEST_CASE("parse_options max count default and validation") {
    REQUIRE(parse({"log"}).max_count == 10);
    REQUIRE_THROWS_WITH(parse({"log", "-n", "ten"}), "Invalid value for --max-count");
}

TEST_CASE("parse_options logging options") {
    Options opts = parse({"sync", "--log-level", "debug", "--log-file", "x.log", "--json-log",
                          "--compress-logs", "--max-log-size", "2M"});
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.logging.log_file == "x.log");
    REQUIRE(opts.logging.json_log);
    REQUIRE(opts.logging.compress_logs);
    REQUIRE(opts.logging.max_log_size == 2u * 1024 * 1024);
}

TEST_CASE("parse_options invalid log level") {
    REQUIRE_THROWS_WITH(parse({"sync", "--log-level", "loud"}), "Invalid log level: loud");
}

TEST_CASE("parse_options unknown option and command") {
    REQUIRE_THROWS_WITH(parse({"sync", "--frobnicate"}), "Unknown option: --frobnicate");
    REQUIRE_THROWS_WITH(parse({"frobnicate"}), "Unknown command: frobnicate");
}

TEST_CASE("parse_options help and version without command") {
    Options opts = parse({"-h"});
    REQUIRE(opts.show_help);
    REQUIRE(opts.command.empty());
    REQUIRE(parse({"--version"}).print_version);
}

TEST_CASE("command_names lists every subcommand once") {
    const auto& names = command_names();
    std::set<std::string> unique(names.begin(), names.end());
    REQUIRE(unique.size() == names.size());
    REQUIRE(unique.count("clone") == 1);
    REQUIRE(unique.count("checkout-copies") == 1);
}
