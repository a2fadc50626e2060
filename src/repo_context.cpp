#include "repo_context.hpp"
#include <sstream>

#include "config_utils.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace repo {

using errors::Category;
using errors::OperationError;

Context open_context(const fs::path& start, const cmd::ToolConfig& tools) {
    std::string error;
    auto loc = git::discover_repo(start, &error);
    if (!loc) {
        log_debug("Repository discovery failed",
                  LogFields{{"dir", start.string()}, {"error", error}});
        throw OperationError(Category::Environment,
                             "this command must be run from inside a repository");
    }
    Context ctx;
    ctx.root = loc->root;
    ctx.workdir = fs::absolute(start);
    ctx.git_dir = loc->git_dir;
    ctx.bare = loc->bare;
    ctx.tools = tools;
    ctx.direct = git::config_bool(ctx.root, "annex.direct");
    ctx.annex_version = git::config_value(ctx.root, "annex.version").value_or("");

    fs::path repo_cfg = ctx.root / cmd::kRepoConfigFile;
    std::error_code ec;
    if (fs::exists(repo_cfg, ec)) {
        ConfigValues values;
        if (!load_yaml_config(repo_cfg.string(), values, error) ||
            !apply_repo_config(values, ctx.tools, error))
            log_warning("Ignoring repository configuration",
                        LogFields{{"file", repo_cfg.string()}, {"error", error}});
    }

    if (auto r = git::config_value(ctx.root, "annexsync.remote")) {
        ctx.default_remote = *r;
    } else if (auto up = git::config_value(ctx.root, "branch.master.remote")) {
        log_info("Recording default remote", *up);
        config_set(ctx, "annexsync.remote", *up);
        ctx.default_remote = *up;
    }
    log_debug("Repository context",
              LogFields{{"root", ctx.root.string()},
                        {"direct", ctx.direct ? "true" : "false"},
                        {"annex.version", ctx.annex_version},
                        {"remote", ctx.default_remote.value_or("")}});
    return ctx;
}

std::string root_relative(const Context& ctx, const fs::path& path) {
    fs::path full = (command_dir(ctx) / path).lexically_normal();
    fs::path rel = full.lexically_relative(ctx.root.lexically_normal());
    if (rel.empty() || *rel.begin() == "..")
        return path.generic_string();
    return rel.generic_string();
}

std::string command_relative(const Context& ctx, const fs::path& path) {
    fs::path full = (ctx.root / path).lexically_normal();
    fs::path rel = full.lexically_relative(command_dir(ctx).lexically_normal());
    if (rel.empty())
        return full.generic_string();
    return rel.generic_string();
}

procutil::CommandSpec git(const Context& ctx, std::vector<std::string> args) {
    return cmd::git_command(ctx.tools, command_dir(ctx), std::move(args));
}

procutil::CommandSpec annex(const Context& ctx, std::vector<std::string> args) {
    return cmd::annex_command(ctx.tools, command_dir(ctx), std::move(args));
}

procutil::CaptureResult run(const procutil::CommandSpec& spec) {
    procutil::CaptureResult res = procutil::run_capture(spec);
    if (!res.ok())
        log_command_output(spec.display(), res.out, res.err);
    return res;
}

std::string run_checked(const procutil::CommandSpec& spec, const std::string& what) {
    procutil::CaptureResult res = run(spec);
    if (!res.ok()) {
        std::string detail = errors::trim(res.err.empty() ? res.out : res.err);
        throw OperationError(Category::Command, detail.empty() ? what : what + ": " + detail,
                             res.out + res.err);
    }
    return res.out;
}

BareToggle::BareToggle(const Context& ctx) : ctx_(ctx) {
    if (!ctx_.direct)
        return;
    procutil::CaptureResult res =
        run(git(ctx_, {"config", "--local", "--bool", "core.bare", "false"}));
    if (!res.ok())
        throw OperationError(Category::Command, "failed to toggle repository bare mode", res.err);
    active_ = true;
}

BareToggle::~BareToggle() {
    if (!active_)
        return;
    try {
        procutil::CaptureResult res =
            run(git(ctx_, {"config", "--local", "--bool", "core.bare", "true"}));
        if (!res.ok())
            log_error("Error switching bare status to true", res.err);
    } catch (const std::exception& e) {
        log_error("Error switching bare status to true", e.what());
    }
}

void config_set(const Context& ctx, const std::string& key, const std::string& value) {
    run_checked(git(ctx, {"config", "--local", key, value}), "failed to set " + key);
}

void config_unset(const Context& ctx, const std::string& key) {
    run_checked(git(ctx, {"config", "--unset", "--local", key}), "failed to unset " + key);
}

std::map<std::string, std::string> remotes(const Context& ctx) {
    std::string out = run_checked(git(ctx, {"remote", "-v", "show", "-n"}),
                                  "failed to read remote configuration");
    std::map<std::string, std::string> result;
    std::istringstream in(out);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream words(line);
        std::string name, url, kind, extra;
        if (!(words >> name >> url >> kind) || (words >> extra)) {
            if (!errors::trim(line).empty())
                log_warning("Unexpected remote output", line);
            continue;
        }
        result.emplace(name, url);
    }
    return result;
}

void add_remote(const Context& ctx, const std::string& name, const std::string& url) {
    procutil::CaptureResult res = run(git(ctx, {"remote", "add", name, url}));
    if (!res.ok()) {
        if (res.err.find("already exists") != std::string::npos)
            throw OperationError(Category::Command,
                                 "remote with name '" + name + "' already exists", res.err);
        throw OperationError(Category::Command, "failed to add remote: " + errors::trim(res.err),
                             res.err);
    }
    // Fetch references of the new remote; an unreachable remote is still added.
    run(git(ctx, {"fetch", name}));
}

void remove_remote(Context& ctx, const std::string& name) {
    procutil::CaptureResult res = run(git(ctx, {"remote", "remove", name}));
    if (!res.ok()) {
        if (res.err.find("No such remote") != std::string::npos)
            throw OperationError(Category::Command,
                                 "remote with name '" + name + "' does not exist", res.err);
        throw OperationError(Category::Command,
                             "failed to remove remote: " + errors::trim(res.err), res.err);
    }
    if (ctx.default_remote == name) {
        try {
            config_unset(ctx, "annexsync.remote");
        } catch (const OperationError& e) {
            log_warning("Failed to clear the default remote", e.what());
        }
        ctx.default_remote.reset();
    }
}

void set_default_remote(Context& ctx, const std::string& name) {
    auto known = remotes(ctx);
    if (known.find(name) == known.end())
        throw OperationError(Category::Command, "unknown remote name '" + name + "'");
    config_set(ctx, "annexsync.remote", name);
    ctx.default_remote = name;
}

std::string require_default_remote(const Context& ctx) {
    if (!ctx.default_remote)
        throw OperationError(Category::Command,
                             "no default remote configured; use 'annexsync use-remote' to set one");
    return *ctx.default_remote;
}

std::string ls_remote(const Context& ctx, const std::string& remote) {
    procutil::CaptureResult res = run(git(ctx, {"ls-remote", remote}));
    if (!res.ok()) {
        if (res.err.find("does not exist") != std::string::npos ||
            res.err.find("Permission denied") != std::string::npos)
            throw OperationError(Category::Connection, "remote " + remote + " does not exist",
                                 res.err);
        throw OperationError(Category::Connection,
                             "failed to query remote " + remote + ": " + errors::trim(res.err),
                             res.err);
    }
    return res.out;
}

void merge_abort(const Context& ctx) {
    // git-annex fixes up the index on status; merge --abort fails before that.
    run(git(ctx, {"status"}));
    run(git(ctx, {"merge", "--abort"}));
}

bool commit_if_new(const Context& ctx) {
    if (git::get_local_hash(ctx.root))
        return false;
    std::string msg = "--message=Initial commit: Repository initialised on " + procutil::host_name();
    if (ctx.direct)
        run_checked(annex(ctx, {"sync", "--commit", msg}), "failed to create initial commit");
    else
        run_checked(git(ctx, {"commit", "--allow-empty", msg}), "failed to create initial commit");
    return true;
}

void commit(const Context& ctx, const std::string& message) {
    BareToggle toggle(ctx);
    procutil::CaptureResult res =
        procutil::run_capture(git(ctx, {"commit", "--message=" + message}));
    if (res.ok())
        return;
    for (const char* clean : {"nothing to commit", "nothing added to commit",
                              "no changes added to commit"}) {
        if (res.out.find(clean) != std::string::npos) {
            log_info("Nothing to commit");
            throw OperationError(Category::Command, "Nothing to commit", res.out);
        }
    }
    log_command_output("git commit", res.out, res.err);
    throw OperationError(Category::Command, "commit failed: " + errors::trim(res.err),
                         res.out + res.err);
}

void init_repo(const fs::path& dir, const cmd::ToolConfig& tools,
               const std::string& description) {
    std::string error;
    if (!git::discover_repo(dir, &error))
        run_checked(cmd::git_command(tools, dir, {"init"}), "repository initialisation failed");
    Context ctx = open_context(dir, tools);
    config_set(ctx, "core.quotepath", "false");
#ifdef _WIN32
    config_set(ctx, "core.symlinks", "false");
#endif
    commit_if_new(ctx);
    run_checked(cmd::annex_init_command(ctx.tools, command_dir(ctx), description),
                "Repository annex initialisation failed");
    procutil::CaptureResult res = run(git(ctx, {"config", "--local", "annex.backends", "MD5"}));
    if (!res.ok())
        log_warning("Failed to set default annex backend MD5");
}

} // namespace repo
