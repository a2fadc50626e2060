#ifndef ERRORS_HPP
#define ERRORS_HPP
#include <stdexcept>
#include <string>
#include <vector>

namespace errors {

/** Failure classes reported by the orchestration layer. */
enum class Category {
    Environment,          ///< Missing or outdated tool, not inside a repository
    Authorization,        ///< Key rejected by the server
    HostKey,              ///< Server key does not match the known host key
    Connection,           ///< Remote unreachable
    PushRejected,         ///< Remote holds changes that were never downloaded
    WouldOverwrite,       ///< Local files would be overwritten by a merge
    MergeConflict,        ///< Merge stopped on conflicts
    AutoResolvedConflict, ///< Conflicts resolved by keeping both variants
    ItemFailure,          ///< A single file or key failed
    Command,              ///< Any other non-zero exit of a tool
};

const char* category_name(Category c);

/**
 * @brief Structured error carried in-band by status events and by
 * OperationError.
 */
struct Failure {
    Category category = Category::Command;
    std::string message;            ///< User facing text
    std::vector<std::string> files; ///< Paths named by the tool, if any
    std::string detail;             ///< Raw tool output kept for the log

    /** @brief Message followed by the affected files, one per line. */
    std::string describe() const;
};

/**
 * @brief Hard error raised by operations that do not stream events.
 */
class OperationError : public std::runtime_error {
  public:
    explicit OperationError(Failure f);
    OperationError(Category c, const std::string& message, const std::string& detail = "");

    const Failure& failure() const noexcept { return failure_; }

  private:
    Failure failure_;
};

/**
 * @brief One entry of an ordered classification table.
 *
 * The first rule whose @a needle occurs in the tool output decides the
 * category and message.
 */
struct Rule {
    const char* needle;
    Category category;
    const char* message;
};

/** Rules applied to failed `git push` and `annex sync --no-pull` runs. */
const std::vector<Rule>& upload_rules();

/** Rules applied to failed `annex sync --no-push` and `annex sync` runs. */
const std::vector<Rule>& download_rules();

/**
 * @brief Classify the combined output of a failed command.
 *
 * @param text     stdout and stderr of the tool.
 * @param rules    Ordered table to match against.
 * @param fallback Message used when no rule matches; the tool output is
 *                 appended.
 */
Failure classify(const std::string& text, const std::vector<Rule>& rules,
                 const std::string& fallback);

/**
 * @brief Lines enclosed by any of @p starts and any of @p ends, trimmed.
 *
 * Several enclosed blocks are concatenated. Blank lines are skipped.
 */
std::vector<std::string> files_between_markers(const std::string& text,
                                               const std::vector<std::string>& starts,
                                               const std::vector<std::string>& ends);

/**
 * @brief Text after @p marker on every line that contains it, trimmed.
 */
std::vector<std::string> files_with_marker(const std::string& text, const std::string& marker);

/** @brief Trimmed lines of @p text that contain @p needle. */
std::vector<std::string> lines_containing(const std::string& text, const std::string& needle);

/** @brief Strip ASCII whitespace from both ends. */
std::string trim(const std::string& s);

} // namespace errors

#endif // ERRORS_HPP
