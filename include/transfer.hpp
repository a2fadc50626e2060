#ifndef TRANSFER_HPP
#define TRANSFER_HPP
#include <filesystem>
#include <string>
#include <vector>

#include "command_builder.hpp"
#include "repo_context.hpp"
#include "status_event.hpp"

namespace transfer {

/// Operation phase labels shared with the output layer.
inline constexpr const char* kStateAnnexAdd = "Adding (annex)";
inline constexpr const char* kStateGitAdd = "Adding (git)  ";
inline constexpr const char* kStateRemove = "Removing";
inline constexpr const char* kStateLock = "Locking";
inline constexpr const char* kStateUnlock = "Unlocking";
inline constexpr const char* kStateGet = "Downloading";
inline constexpr const char* kStateDrop = "Removing content";
inline constexpr const char* kStateDownload = "Downloading changes";
inline constexpr const char* kStateSync = "Synchronising";
inline constexpr const char* kStateClone = "Downloading repository";
inline constexpr const char* kStateInit = "Initialising local storage";

/**
 * @brief Upload history and content to each of @p remotes.
 *
 * For every remote: `git push --progress`, then
 * `git-annex sync --no-pull --no-commit`, then a content copy of the
 * annexed files among @p paths. A failing metadata step is classified and
 * stops the remote before any content is copied. An empty @p remotes
 * uploads to the default remote.
 */
EventStream upload(const repo::Context& ctx, std::vector<std::string> paths,
                   std::vector<std::string> remotes);

/**
 * @brief Download history from all remotes without pushing or committing.
 *
 * Overwritten files and merge conflicts are reported with their file
 * lists; a conflicted merge is aborted before the stream closes.
 * Automatically resolved conflicts become a notice. With @p content the
 * annexed content is fetched afterwards.
 */
EventStream download(const repo::Context& ctx, bool content);

/** @brief `git-annex sync --resolvemerge [--content]`, classified like download(). */
EventStream sync(const repo::Context& ctx, bool content);

/**
 * @brief Add files: content files to the annex, everything else to git.
 *
 * Patterns are expanded leniently. Successful annex adds record the file
 * name in the key metadata.
 */
EventStream add(const repo::Context& ctx, std::vector<std::string> paths);

/** @brief `git-annex get` of the given paths with progress. */
EventStream get_content(const repo::Context& ctx, std::vector<std::string> paths);

/** @brief `git-annex drop`; content only goes when a remote copy is verified. */
EventStream remove_content(const repo::Context& ctx, std::vector<std::string> paths);

/** @brief Lock unlocked files with `git-annex add --update`. */
EventStream lock(const repo::Context& ctx, std::vector<std::string> paths);

/** @brief `git-annex unlock` of the given paths. */
EventStream unlock(const repo::Context& ctx, std::vector<std::string> paths);

/**
 * @brief Clone @p url into @p parent / @p dest and initialise the annex.
 *
 * @param description Annex description of the new clone.
 */
EventStream clone(const cmd::ToolConfig& tools, std::filesystem::path parent, std::string url,
                  std::string dest, std::string description);

/**
 * @brief File names of automatically resolved conflict copies.
 *
 * git-annex keeps both versions of conflicting content under names
 * containing ".variant-".
 */
std::vector<std::string> variant_files(const std::string& output);

/** @brief Default clone directory for @p url: its last path component without ".git". */
std::string clone_dir_name(const std::string& url);

} // namespace transfer

#endif // TRANSFER_HPP
