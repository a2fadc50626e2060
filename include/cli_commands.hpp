#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "config_utils.hpp"
#include "file_status.hpp"
#include "options.hpp"
#include "status_event.hpp"

namespace cli {

/**
 * @brief Render a status event stream and count failed files.
 *
 * Progress style prints one line per file and phase, redrawing it in place
 * when @p interactive is set; JSON style prints one object per event;
 * verbose style prints each command once followed by the raw tool output.
 * An empty stream prints "Nothing to do" in progress style.
 *
 * @return Number of distinct files with at least one failed event, plus
 *         one per failed event that names no file. Notices never count.
 */
size_t print_events(EventStream& stream, OutputStyle style, std::ostream& out,
                    bool interactive = false);

/** @brief JSON object for one event. */
std::string event_json(const StatusEvent& ev);

/** @brief "1 operation failed" or "<n> operations failed". */
std::string failure_summary(size_t failed);

/**
 * @brief File listing for `ls`.
 *
 * Grouped by status in display order with the long description as header,
 * or "<code> <file>" lines when @p short_form is set.
 */
std::string format_status_listing(const filestatus::StatusMap& statuses, bool short_form);

/** @brief The `ls --json` array. */
std::string status_listing_json(const filestatus::StatusMap& statuses);

/**
 * @brief Expand `<alias>:<owner/repo>` through the configured servers.
 *
 * Anything whose prefix is not a configured alias is returned unchanged.
 */
std::string resolve_remote_url(const ClientConfig& cfg, const std::string& location);

/** @brief Commit message "annexsync <action> from <host>" plus a change summary. */
std::string make_commit_message(const std::string& action, const std::string& changes);

/**
 * @brief Execute the subcommand in @p opts.
 *
 * @return Process exit code. Hard errors propagate as exceptions.
 */
int run_command(const Options& opts);

} // namespace cli
