#ifndef PROGRESS_PARSER_HPP
#define PROGRESS_PARSER_HPP
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "status_event.hpp"

namespace progress {

/** Completed progress marker carried by the final event of a file. */
inline constexpr const char* kComplete = "100%";

/** Action/result record printed by `git-annex ... --json`. */
struct AnnexAction {
    std::string command;
    std::string note;
    bool success = false;
    std::string key;
    std::string file;
};

/** Intermediate record printed by `git-annex ... --json-progress`. */
struct AnnexProgress {
    AnnexAction action;
    std::int64_t byte_progress = 0;
    std::int64_t total_size = 0;
    std::string percent;
};

/** A line that is neither of the above. */
struct Unparseable {
    std::string line;
    std::string reason;
};

using AnnexRecord = std::variant<AnnexProgress, AnnexAction, Unparseable>;

/**
 * @brief Decode one JSON line of git-annex output.
 *
 * The progress shape is tried first, then the action/result shape.
 */
AnnexRecord decode_annex_line(const std::string& line);

/**
 * @brief Human readable binary size, e.g. "500 B", "1.0 MiB", "20 KiB".
 *
 * Values below ten bytes are printed as integers. Larger values use one
 * decimal while the scaled value is below ten.
 */
std::string format_ibytes(std::uint64_t bytes);

/**
 * @brief Transfer rate such as "1.0 MiB/s".
 *
 * @return Empty string if @p dt or @p dbytes is not positive.
 */
std::string calc_rate(std::int64_t dbytes, std::chrono::nanoseconds dt);

/**
 * @brief Rate between consecutive samples of the same item.
 *
 * The first sample after the item changes yields no rate.
 */
class RateTracker {
  public:
    using clock = std::chrono::steady_clock;

    std::string update(const std::string& item, std::int64_t bytes, clock::time_point now);

  private:
    std::string item_;
    std::int64_t prev_bytes_ = 0;
    clock::time_point prev_time_{};
    bool have_prev_ = false;
};

/** Text progress parsed from `git push` or `git clone` stderr. */
struct TextProgress {
    std::string state;
    std::string percent;
    std::string rate;
};

/**
 * @brief Parse a `git push --progress` record.
 *
 * Matches "Compressing objects" and "Writing objects"; the latter is
 * reported as "Uploading git files (to: <remote>)".
 */
std::optional<TextProgress> parse_push_line(const std::string& line, const std::string& remote);

/**
 * @brief Parse a `git clone --progress` record.
 *
 * Only "Receiving objects" lines carry data: the third word is the percentage
 * and the eighth and ninth words form the rate.
 */
std::optional<TextProgress> parse_clone_line(const std::string& line);

/** @brief Error text for a failed transfer note. */
std::string transfer_failure(const std::string& note);

/**
 * @brief Display name for key metadata returned by `git-annex metadata --json`.
 *
 * Uses the `annexsync-filename` field and its `-lastchanged` timestamp,
 * falling back to the `file` field. Returns an empty string when neither
 * is present or the JSON is malformed.
 */
std::string metadata_display_name(const std::string& metadata_json);

/**
 * @brief Resolves annex keys to display names, looking each key up once.
 */
class KeyNameResolver {
  public:
    using Lookup = std::function<std::string(const std::string& key)>;

    explicit KeyNameResolver(Lookup lookup) : lookup_(std::move(lookup)) {}

    /** @brief Name for @p key, or "(unknown)". */
    std::string name_for(const std::string& key);

    size_t lookups() const noexcept { return lookups_; }

  private:
    Lookup lookup_;
    std::map<std::string, std::string> cache_;
    size_t lookups_ = 0;
};

/**
 * @brief Turns git-annex JSON lines of one invocation into status events.
 */
class AnnexEventParser {
  public:
    using FailureText = std::function<std::string(const AnnexAction&)>;

    /**
     * @param state     Phase label put on every event.
     * @param raw_input Command line, copied into every event.
     * @param failure   Error text for unsuccessful results; defaults to
     *                  transfer_failure() of the note.
     * @param names     Optional resolver for records that carry only a key.
     */
    AnnexEventParser(std::string state, std::string raw_input, FailureText failure = {},
                     KeyNameResolver* names = nullptr);

    /**
     * @brief Feed one line of output.
     *
     * @return The event for the line, or `std::nullopt` for blank and
     *         unparseable lines and records without a file name.
     */
    std::optional<StatusEvent> feed(const std::string& line,
                                    RateTracker::clock::time_point now = RateTracker::clock::now());

    size_t skipped() const noexcept { return skipped_; }

  private:
    std::string display_name(const AnnexAction& a);

    std::string state_;
    std::string raw_input_;
    FailureText failure_;
    KeyNameResolver* names_;
    RateTracker rate_;
    std::string current_key_;
    std::string current_name_;
    size_t skipped_ = 0;
};

} // namespace progress

#endif // PROGRESS_PARSER_HPP
