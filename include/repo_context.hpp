#ifndef REPO_CONTEXT_HPP
#define REPO_CONTEXT_HPP
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "command_builder.hpp"
#include "process.hpp"

namespace repo {
namespace fs = std::filesystem;

/**
 * @brief Per-invocation view of the repository.
 *
 * Computed once by open_context() and passed to every operation.
 */
struct Context {
    fs::path root;
    fs::path workdir; ///< Directory commands run in and user paths are relative to
    fs::path git_dir;
    bool bare = false;
    bool direct = false;       ///< annex.direct is set
    std::string annex_version; ///< annex.version, empty before `annex init`
    std::optional<std::string> default_remote;
    cmd::ToolConfig tools;
};

/**
 * @brief Discover the repository containing @p start.
 *
 * Reads the operating mode and default remote, and merges the `annex`
 * section of `<root>/config.yml` into the tool configuration.
 *
 * @throws errors::OperationError (Environment) outside a repository.
 */
Context open_context(const fs::path& start, const cmd::ToolConfig& tools);

/** @brief Directory commands run in: the invocation directory, else the root. */
inline const fs::path& command_dir(const Context& ctx) {
    return ctx.workdir.empty() ? ctx.root : ctx.workdir;
}

/**
 * @brief @p path, given relative to command_dir(), relative to the root.
 *
 * Paths outside the repository come back unchanged.
 */
std::string root_relative(const Context& ctx, const fs::path& path);

/** @brief Root-relative @p path as seen from command_dir(). */
std::string command_relative(const Context& ctx, const fs::path& path);

/** @brief `git <args>` in command_dir(). */
procutil::CommandSpec git(const Context& ctx, std::vector<std::string> args);

/** @brief `git-annex <args>` in command_dir(). */
procutil::CommandSpec annex(const Context& ctx, std::vector<std::string> args);

/**
 * @brief Run a command to completion and log its output when it fails.
 */
procutil::CaptureResult run(const procutil::CommandSpec& spec);

/**
 * @brief Run a command and raise errors::OperationError if it fails.
 *
 * @param what Prefix of the error message.
 * @return stdout of the command.
 */
std::string run_checked(const procutil::CommandSpec& spec, const std::string& what);

/**
 * @brief Temporarily switch a direct mode repository out of bare mode.
 *
 * Sets `core.bare` to false for the lifetime of the object and back to true
 * on destruction. Does nothing for indirect repositories.
 */
class BareToggle {
  public:
    explicit BareToggle(const Context& ctx);
    ~BareToggle();
    BareToggle(const BareToggle&) = delete;
    BareToggle& operator=(const BareToggle&) = delete;

  private:
    const Context& ctx_;
    bool active_ = false;
};

void config_set(const Context& ctx, const std::string& key, const std::string& value);
void config_unset(const Context& ctx, const std::string& key);

/**
 * @brief Configured remotes and their fetch URL, from `git remote -v show -n`.
 */
std::map<std::string, std::string> remotes(const Context& ctx);

/**
 * @brief Add a remote and fetch it. A failing fetch is only logged.
 *
 * @throws errors::OperationError "remote with name '<n>' already exists".
 */
void add_remote(const Context& ctx, const std::string& name, const std::string& url);

/**
 * @brief Remove a remote; clears the default remote if it was this one.
 *
 * @throws errors::OperationError "remote with name '<n>' does not exist".
 */
void remove_remote(Context& ctx, const std::string& name);

/**
 * @brief Make @p name the default remote after checking it is configured.
 */
void set_default_remote(Context& ctx, const std::string& name);

/**
 * @brief Default remote, or throws if none is configured.
 */
std::string require_default_remote(const Context& ctx);

/**
 * @brief Output of `git ls-remote <remote>`.
 */
std::string ls_remote(const Context& ctx, const std::string& remote);

/**
 * @brief `git status` followed by `git merge --abort`; failures are logged.
 */
void merge_abort(const Context& ctx);

/**
 * @brief Create the bootstrap commit of a repository without HEAD.
 *
 * @return `true` if a commit was created.
 */
bool commit_if_new(const Context& ctx);

/**
 * @brief Commit the index with @p message.
 *
 * @throws errors::OperationError "Nothing to commit" when the index is clean.
 */
void commit(const Context& ctx, const std::string& message);

/**
 * @brief Initialise @p dir as a repository managed by annexsync.
 *
 * Runs `git init` if needed, disables `core.quotepath`, creates the bootstrap
 * commit, runs `git-annex init --version=<n> <description>` and selects the
 * MD5 backend.
 */
void init_repo(const fs::path& dir, const cmd::ToolConfig& tools,
               const std::string& description);

} // namespace repo

#endif // REPO_CONTEXT_HPP
