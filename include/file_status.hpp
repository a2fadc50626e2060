#ifndef FILE_STATUS_HPP
#define FILE_STATUS_HPP
#include <map>
#include <string>
#include <vector>

#include "repo_context.hpp"

namespace filestatus {

/**
 * @brief Synchronisation state of a single path.
 *
 * Enumerators are listed in display priority order.
 */
enum class FileStatus {
    Synced,
    NoContent,
    Modified,
    LocalChanges,
    RemoteChanges,
    Unlocked,
    TypeChange,
    Removed,
    Untracked,
};

/// Long human readable description, e.g. "No local content".
const char* description(FileStatus s);

/// Two-letter code used by `ls --short`.
const char* abbrev(FileStatus s);

/// All statuses in display order.
const std::vector<FileStatus>& all_statuses();

using StatusMap = std::map<std::string, FileStatus>;

/**
 * @brief Compute the status of every file matching @p args.
 *
 * Patterns are glob expanded leniently; no patterns means the whole
 * repository. Direct mode repositories use the location-first algorithm,
 * indirect ones the four-query algorithm.
 *
 * @throws errors::OperationError when any underlying query fails.
 */
StatusMap resolve(const repo::Context& ctx, const std::vector<std::string>& args);

/// Location-first resolution used for direct mode repositories.
StatusMap resolve_direct(const repo::Context& ctx, const std::vector<std::string>& paths);

/// Four-query resolution used for indirect repositories.
StatusMap resolve_indirect(const repo::Context& ctx, const std::vector<std::string>& paths);

} // namespace filestatus

#endif // FILE_STATUS_HPP
