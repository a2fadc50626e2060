#pragma once
#include <catch2/catch_test_macros.hpp>
#include "arg_parser.hpp"
#include "command_builder.hpp"
#include "config_utils.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "pattern_utils.hpp"
#include "process.hpp"
#include "progress_parser.hpp"
#include "repo_context.hpp"
#include "status_event.hpp"
#include "time_utils.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include <unistd.h>

#define REDIR " > /dev/null 2>&1"

static inline bool have_git() { return std::system("git --version " REDIR) == 0; }

namespace fs = std::filesystem;

namespace annexsync::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive)
        fs::remove_all(target, ec);
    else
        fs::remove(target, ec);
    return !ec || ec == std::errc::no_such_file_or_directory;
}

inline void remove_with_retry(const fs::path& target, bool recursive) {
    std::error_code ec;
    if (remove_once(target, recursive, ec))
        return;
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}
}  // namespace detail

inline void remove_path(const fs::path& target) {
    detail::remove_with_retry(target, false);
}

inline void remove_all(const fs::path& target) {
    detail::remove_with_retry(target, true);
}

/** Fresh empty directory below the system temp dir. */
inline fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("annexsync_" + name + "_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

inline std::vector<std::string> read_lines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream ifs(path);
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

/**
 * Stand-in for git or git-annex: a shell script that appends its arguments
 * to `<name>.calls` and then runs @p body, which usually dispatches on "$1".
 */
struct FakeTool {
    fs::path script;
    fs::path calls;

    FakeTool(const fs::path& dir, const std::string& name, const std::string& body)
        : script(dir / name), calls(dir / (name + ".calls")) {
        write_file(script, "#!/bin/sh\necho \"$*\" >> '" + calls.string() + "'\n" + body + "\n");
        fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);
    }

    std::vector<std::string> invocations() const { return read_lines(calls); }

    size_t count(const std::string& prefix) const {
        size_t n = 0;
        for (const auto& c : invocations())
            if (c.rfind(prefix, 0) == 0)
                ++n;
        return n;
    }
};

/** Runs the test body from @p dir, restoring the previous directory afterwards. */
struct CwdGuard {
    fs::path previous;
    explicit CwdGuard(const fs::path& dir) : previous(fs::current_path()) {
        fs::current_path(dir);
    }
    ~CwdGuard() {
        std::error_code ec;
        fs::current_path(previous, ec);
    }
    CwdGuard(const CwdGuard&) = delete;
    CwdGuard& operator=(const CwdGuard&) = delete;
};

/** Repository context rooted at @p root that runs the given fake tools. */
inline repo::Context fake_context(const fs::path& root, const FakeTool& git,
                                  const FakeTool& annex) {
    repo::Context ctx;
    ctx.root = root;
    ctx.git_dir = root / ".git";
    ctx.annex_version = "8";
    ctx.default_remote = "origin";
    ctx.tools.git_bin = git.script.string();
    ctx.tools.annex_bin = annex.script.string();
    return ctx;
}
}  // namespace annexsync::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::annexsync::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::annexsync::test_support::remove_all((path))
#endif
