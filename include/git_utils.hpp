#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <optional>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using config_ptr = GitHandle<git_config, git_config_free>;

// The utility functions below are read-only and assume libgit2 is already
// initialized. Every change to a repository goes through the git binary.

/** Location of a repository found by discovery. */
struct RepoLocation {
    fs::path root;    ///< Working tree, or the directory holding `.git` for bare annex repos
    fs::path git_dir; ///< The `.git` directory itself
    bool bare = false;
};

/**
 * @brief Find the repository containing @p start.
 *
 * Walks up the directory hierarchy like `git rev-parse --show-toplevel`.
 * Repositories switched to bare mode by git-annex direct mode are reported
 * with the parent of their `.git` directory as root.
 *
 * @param start Directory to search from.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Location or `std::nullopt` when @p start is not inside a repository.
 */
std::optional<RepoLocation> discover_repo(const fs::path& start, std::string* error = nullptr);

/**
 * @brief Read a string value from the repository configuration.
 *
 * @param repo  Repository root.
 * @param key   Dotted configuration key, e.g. `annex.direct`.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Value or `std::nullopt` if the key is not set.
 */
std::optional<std::string> config_value(const fs::path& repo, const std::string& key,
                                        std::string* error = nullptr);

/**
 * @brief Read a boolean configuration value.
 *
 * @return `false` if the key is unset or not a boolean.
 */
bool config_bool(const fs::path& repo, const std::string& key);

/**
 * @brief Get the commit hash pointed to by `HEAD`.
 *
 * @return 40 character hexadecimal commit hash or `std::nullopt` for an
 *         unborn branch or on error.
 */
std::optional<std::string> get_local_hash(const fs::path& repo, std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
