#ifndef ANNEX_UTILS_HPP
#define ANNEX_UTILS_HPP
#include <optional>
#include <string>
#include <vector>

#include "repo_context.hpp"

namespace annex {

/** One known location of a content key. */
struct Location {
    std::string uuid;
    std::string description;
    bool here = false;
};

/** Result of `git-annex whereis --json` for one file. */
struct ContentLocationInfo {
    std::string key;
    std::string file;
    bool success = false;
    std::vector<Location> locations;
    std::string error; ///< Set when the line could not be decoded
};

/** One line of `git-annex status --json`. */
struct StatusEntry {
    std::string status; ///< "?", "M", "A", "D", "T"
    std::string file;
};

/**
 * @brief Locations of the content of @p paths.
 *
 * Undecodable lines come back with @a error set.
 *
 * @throws errors::OperationError if git-annex cannot be started.
 */
std::vector<ContentLocationInfo> whereis(const repo::Context& ctx,
                                         const std::vector<std::string>& paths);

/**
 * @brief Lightweight status of @p paths.
 *
 * @throws errors::OperationError on an undecodable line or a failed run.
 */
std::vector<StatusEntry> status(const repo::Context& ctx, const std::vector<std::string>& paths);

/**
 * @brief `git ls-files <args>`.
 *
 * @throws errors::OperationError if the command fails.
 */
std::vector<std::string> ls_files(const repo::Context& ctx, const std::vector<std::string>& args);

/**
 * @brief Files differing from @p upstream, `git diff -z --name-only --relative`.
 *
 * A failing diff, e.g. for an upstream that was never fetched, is logged and
 * yields no files.
 */
std::vector<std::string> diff_upstream(const repo::Context& ctx,
                                       const std::vector<std::string>& paths,
                                       const std::string& upstream);

/**
 * @brief Display name recorded in the metadata of @p key, or an empty string.
 */
std::string metadata_name(const repo::Context& ctx, const std::string& key);

/**
 * @brief Record the base name of @p path in its key metadata.
 *
 * @return `false` if git-annex refused; the failure is logged.
 */
bool set_metadata_name(const repo::Context& ctx, const std::string& path);

/**
 * @brief Path of the local content of @p key, if present.
 */
std::optional<std::string> content_location(const repo::Context& ctx, const std::string& key);

/**
 * @brief Download the content of a single key. Output is only logged.
 */
bool get_key(const repo::Context& ctx, const std::string& key);

/**
 * @brief Human readable summary of the index for commit messages.
 *
 * Lists new, modified, deleted, type modified and untracked files with a
 * count header for each non-empty group.
 */
std::string describe_index(const repo::Context& ctx, const std::vector<std::string>& paths);

/**
 * @brief Counts of new, modified and deleted files, one line each.
 */
std::string describe_index_short(const repo::Context& ctx, const std::vector<std::string>& paths);

} // namespace annex

#endif // ANNEX_UTILS_HPP
