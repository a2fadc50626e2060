#include "test_common.hpp"
#include "git_utils.hpp"

using annexsync::test_support::make_temp_dir;

TEST_CASE("discover_repo finds the root from a subdirectory") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path dir = make_temp_dir("discover");
    fs::create_directories(dir / "a" / "b");
    REQUIRE(std::system(("git init -q " + dir.string() + REDIR).c_str()) == 0);
    REQUIRE(std::system(("git -C " + dir.string() + " config annex.direct true" REDIR).c_str()) ==
            0);
    REQUIRE(std::system(("git -C " + dir.string() + " config annexsync.remote gin" REDIR)
                            .c_str()) == 0);

    std::string error;
    auto loc = git::discover_repo(dir / "a" / "b", &error);
    REQUIRE(loc);
    REQUIRE(fs::equivalent(loc->root, dir));
    REQUIRE(loc->git_dir.filename() == ".git");
    REQUIRE_FALSE(loc->bare);

    REQUIRE(git::config_bool(loc->root, "annex.direct"));
    REQUIRE_FALSE(git::config_bool(loc->root, "annex.missing"));
    REQUIRE(git::config_value(loc->root, "annexsync.remote") == std::optional<std::string>("gin"));
    REQUIRE_FALSE(git::get_local_hash(loc->root));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("discover_repo outside a repository") {
    git::GitInitGuard guard;
    fs::path dir = make_temp_dir("no_repo");
    std::string error;
    if (git::discover_repo(dir, &error)) {
        WARN("temp directory is inside a repository; skipping");
        FS_REMOVE_ALL(dir);
        return;
    }
    REQUIRE_FALSE(error.empty());
    FS_REMOVE_ALL(dir);
}
