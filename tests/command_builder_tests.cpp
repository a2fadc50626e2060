#include "test_common.hpp"

TEST_CASE("ssh_env is empty without keys or known hosts") {
    cmd::ToolConfig cfg;
    REQUIRE(cmd::ssh_env(cfg, true).empty());
    REQUIRE(cmd::git_command(cfg, "/repo", {"status"}).env.empty());
}

TEST_CASE("ssh_env routes git and git-annex through the configured key") {
    cmd::ToolConfig cfg;
    cfg.ssh_keys = {"/home/u/.ssh/annexsync key"};
    cfg.known_hosts = "/home/u/.config/annexsync/known_hosts";
    auto env = cmd::ssh_env(cfg, true);
    REQUIRE(env.at("GIT_ANNEX_USE_GIT_SSH") == "1");
    const std::string& sshcmd = env.at("GIT_SSH_COMMAND");
    REQUIRE(sshcmd.rfind("ssh -i \"/home/u/.ssh/annexsync key\"", 0) == 0);
    REQUIRE(sshcmd.find("-o IdentitiesOnly=yes") != std::string::npos);
    REQUIRE(sshcmd.find("UserKnownHostsFile=\"/home/u/.config/annexsync/known_hosts\"") !=
            std::string::npos);
    REQUIRE(cmd::ssh_env(cfg, false).count("GIT_ANNEX_USE_GIT_SSH") == 0);
}

TEST_CASE("git and annex commands use the configured binaries") {
    cmd::ToolConfig cfg;
    cfg.git_bin = "/opt/bin/git";
    cfg.annex_bin = "/opt/bin/git-annex";
    auto g = cmd::git_command(cfg, "/repo", {"log", "-z"});
    REQUIRE(g.program == "/opt/bin/git");
    REQUIRE(g.cwd == fs::path("/repo"));
    REQUIRE(g.args == std::vector<std::string>{"log", "-z"});
    auto a = cmd::annex_command(cfg, "/repo", {"sync"});
    REQUIRE(a.program == "/opt/bin/git-annex");
}

TEST_CASE("clone_command parses progress from stderr") {
    cmd::ToolConfig cfg;
    auto spec = cmd::clone_command(cfg, "/work", "ssh://git@gin:22/a/b", "b");
    REQUIRE(spec.args == std::vector<std::string>{"clone", "--progress", "ssh://git@gin:22/a/b",
                                                  "b"});
    REQUIRE(spec.err_delims == procutil::kProgressDelims);
}

TEST_CASE("annex_init_command passes the repository version") {
    cmd::ToolConfig cfg;
    auto spec = cmd::annex_init_command(cfg, "/repo", "alice@laptop");
    REQUIRE(spec.program == "git-annex");
    REQUIRE(spec.cwd == fs::path("/repo"));
    REQUIRE(spec.args == std::vector<std::string>{"init", "--version=8", "alice@laptop"});
    cfg.annex_repo_version = "10";
    REQUIRE(cmd::annex_init_command(cfg, "/repo", "d").args[1] == "--version=10");
}

TEST_CASE("annex_filter_args lists threshold and exclusions") {
    cmd::ToolConfig cfg;
    cfg.annex_min_size = 1024;
    cfg.annex_exclude = {"*.md", "docs/*.txt"};
    REQUIRE(cmd::annex_filter_args(cfg) ==
            std::vector<std::string>{"--not", "--smallerthan=1024", "--exclude=*.md",
                                     "--exclude=docs/*.txt", "--exclude=config.yml"});
    REQUIRE(cmd::annex_filter_args(cfg, "../config.yml").back() == "--exclude=../config.yml");
}

TEST_CASE("is_content_file applies size and patterns") {
    cmd::ToolConfig cfg;
    cfg.annex_min_size = 100;
    cfg.annex_exclude = {"*.md", "docs/*.txt"};
    REQUIRE(cmd::is_content_file(cfg, "data/raw.bin", 100));
    REQUIRE_FALSE(cmd::is_content_file(cfg, "data/raw.bin", 99));
    REQUIRE_FALSE(cmd::is_content_file(cfg, "sub/README.md", 1000));
    REQUIRE_FALSE(cmd::is_content_file(cfg, "docs/notes.txt", 1000));
    REQUIRE(cmd::is_content_file(cfg, "other/notes.txt", 1000));
    REQUIRE_FALSE(cmd::is_content_file(cfg, "config.yml", 1000));
    REQUIRE_FALSE(cmd::is_content_file(cfg, "./config.yml", 1000));
}

TEST_CASE("pattern matching by name and by path") {
    REQUIRE(patterns::matches("a/b/c.csv", {"*.csv"}));
    REQUIRE(patterns::matches("a/b/c.csv", {"a/b/*.csv"}));
    REQUIRE_FALSE(patterns::matches("a/b/c.csv", {"b/*.csv"}));
    REQUIRE(patterns::matches("a/LICENSE", {"LICENSE"}));
    REQUIRE_FALSE(patterns::matches("a/LICENSE.txt", {"LICENSE"}));
}

TEST_CASE("clean_path normalises user paths") {
    REQUIRE(patterns::clean_path("") == ".");
    REQUIRE(patterns::clean_path("./a/../b/") == "b");
    REQUIRE(patterns::clean_path("dir/") == "dir");
    REQUIRE(patterns::clean_path(".") == ".");
}

TEST_CASE("expand_globs strict and lenient") {
    fs::path dir = annexsync::test_support::make_temp_dir("globs");
    annexsync::test_support::write_file(dir / "b.bin", "b");
    annexsync::test_support::write_file(dir / "a.bin", "a");
    std::string pat = (dir / "*.bin").string();
    auto files = patterns::expand_globs({pat}, true);
    REQUIRE(files == std::vector<std::string>{(dir / "a.bin").string(),
                                              (dir / "b.bin").string()});
    std::string missing = (dir / "*.none").string();
    REQUIRE(patterns::expand_globs({missing}, false) == std::vector<std::string>{missing});
    REQUIRE_THROWS_WITH(patterns::expand_globs({missing}, true), "No files matched " + missing);
    FS_REMOVE_ALL(dir);
}
