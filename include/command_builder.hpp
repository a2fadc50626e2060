#ifndef COMMAND_BUILDER_HPP
#define COMMAND_BUILDER_HPP
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "process.hpp"

namespace cmd {

/** Name of the per-repository configuration file; never content tracked. */
inline constexpr const char* kRepoConfigFile = "config.yml";

/** Default content size threshold, 10 MiB. */
inline constexpr std::uintmax_t kDefaultMinSize = 10ull * 1024 * 1024;
inline constexpr const char* kDefaultRepoVersion = "8";

/**
 * @brief Binaries, identities and content filter used to build commands.
 */
struct ToolConfig {
    std::string git_bin = "git";
    std::string annex_bin = "git-annex";
    std::string ssh_bin = "ssh";
    std::vector<std::string> ssh_keys; ///< Identity files passed with -i
    std::string known_hosts;           ///< UserKnownHostsFile, empty to use ssh's default
    std::uintmax_t annex_min_size = kDefaultMinSize;
    std::vector<std::string> annex_exclude; ///< Globs that always stay in git
    std::string annex_repo_version = kDefaultRepoVersion; ///< Passed to `annex init --version`
};

/**
 * @brief Environment overrides that route ssh through the configured keys.
 *
 * Produces `GIT_SSH_COMMAND` when at least one key or a known hosts file is
 * configured. @p annex adds `GIT_ANNEX_USE_GIT_SSH=1` so git-annex uses the
 * same command.
 */
std::map<std::string, std::string> ssh_env(const ToolConfig& cfg, bool annex);

/** @brief `git <args>` run in @p dir. */
procutil::CommandSpec git_command(const ToolConfig& cfg, const std::filesystem::path& dir,
                                  std::vector<std::string> args);

/** @brief `git-annex <args>` run in @p dir. */
procutil::CommandSpec annex_command(const ToolConfig& cfg, const std::filesystem::path& dir,
                                    std::vector<std::string> args);

/**
 * @brief `git clone --progress <url> <dest>`, with symlinks disabled on
 * Windows. stderr is split on carriage returns for progress parsing.
 */
procutil::CommandSpec clone_command(const ToolConfig& cfg, const std::filesystem::path& dir,
                                    const std::string& url, const std::string& dest);

/** @brief `git-annex init --version=<n> <description>` run in @p dir. */
procutil::CommandSpec annex_init_command(const ToolConfig& cfg, const std::filesystem::path& dir,
                                         const std::string& description);

/**
 * @brief git-annex matching options for the content filter.
 *
 * `--not --smallerthan=<bytes>` followed by one `--exclude=<glob>` per
 * configured pattern and a final exclusion of the repository configuration.
 *
 * @param repo_config Path of `config.yml` relative to the directory
 *        git-annex runs in, since git-annex matches globs from there.
 */
std::vector<std::string> annex_filter_args(const ToolConfig& cfg,
                                           const std::string& repo_config = kRepoConfigFile);

/**
 * @brief In-process version of the content filter.
 *
 * @param path Path relative to the repository root.
 * @param size File size in bytes.
 * @return `true` if the file belongs in the annex.
 */
bool is_content_file(const ToolConfig& cfg, const std::filesystem::path& path,
                     std::uintmax_t size);

} // namespace cmd

#endif // COMMAND_BUILDER_HPP
