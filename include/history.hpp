#ifndef HISTORY_HPP
#define HISTORY_HPP
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "repo_context.hpp"

namespace history {

/** Paths touched by one commit; renames are not listed. */
struct DiffStat {
    std::vector<std::string> added;
    std::vector<std::string> modified;
    std::vector<std::string> deleted;
};

struct CommitRecord {
    std::string hash;
    std::string abbrev_hash;
    std::string author_name;
    std::string author_email;
    std::string date; ///< Strict ISO 8601 author date
    std::string subject;
    std::string body;
    DiffStat stats;
};

/** One entry of a recursive `git ls-tree`. */
struct TreeObject {
    std::string name; ///< Path from the repository root
    std::string hash;
    std::string type; ///< "blob" or "tree"
    std::string mode;
};

/** Outcome of copying one tree entry out of history. */
struct FileCheckoutStatus {
    std::string name;
    std::string destination;
    std::string type; ///< "Annex", "Link", "Git" or "Tree"
    std::optional<std::string> error;
};

struct LogQuery {
    unsigned count = 0; ///< 0 returns the entire history
    std::string revrange;
    std::vector<std::string> paths;
    bool show_deletes = false; ///< Include commits that only delete matching paths
};

void to_json(nlohmann::json& j, const DiffStat& s);
void to_json(nlohmann::json& j, const CommitRecord& c);

/**
 * @brief Decode one record of `git log -z` whose fields are separated by
 * the ASCII unit separator (0x1f).
 *
 * The body is the last field and is trimmed. Returns `std::nullopt` for
 * records with fewer than seven fields.
 */
std::optional<CommitRecord> parse_commit(const std::string& record);

/** @brief Parse `git log --format=::%H --name-status` output by commit hash. */
std::map<std::string, DiffStat> parse_name_status(const std::string& out);

/** @brief Parse one `git ls-tree` record; `std::nullopt` if malformed. */
std::optional<TreeObject> parse_tree_entry(const std::string& record);

/**
 * @brief Newest-first commits matching @p q, each with its diff stat.
 *
 * @throws errors::OperationError when git log fails; an unknown revision is
 *         reported as "'<rev>' does not match a known version ID or name".
 */
std::vector<CommitRecord> commit_log(const repo::Context& ctx, const LogQuery& q);

/** @brief Diff stats for the commits of @p q; failures are logged and yield nothing. */
std::map<std::string, DiffStat> log_diffstat(const repo::Context& ctx, const LogQuery& q);

/** @brief Recursive tree listing of @p revision restricted to @p paths. */
std::vector<TreeObject> ls_tree(const repo::Context& ctx, const std::string& revision,
                                const std::vector<std::string>& paths);

/** @brief Raw contents of @p path at @p revision. */
std::string cat_file(const repo::Context& ctx, const std::string& revision,
                     const std::string& path);

/** @brief Number of commits in `a..b`. */
int rev_count(const repo::Context& ctx, const std::string& a, const std::string& b);

/**
 * @brief Restore @p paths (the whole tree when empty) to @p revision and
 * re-check the restored annexed content.
 */
void checkout_version(const repo::Context& ctx, const std::string& revision,
                      const std::vector<std::string>& paths);

/** @brief "<stem>-<suffix><ext>" for a file name taken out of history. */
std::string copy_name(const std::string& name, const std::string& suffix);

using CheckoutCallback = std::function<void(const FileCheckoutStatus&)>;

/**
 * @brief Copy the files of @p revision to @p outpath without touching the
 * working tree.
 *
 * Annexed content missing locally is fetched by key once before copying.
 * Every tree entry is reported through @p report.
 *
 * @return Number of entries that failed.
 * @throws errors::OperationError if the tree cannot be listed.
 */
size_t checkout_file_copies(const repo::Context& ctx, const std::string& revision,
                            const std::vector<std::string>& paths,
                            const std::filesystem::path& outpath, const std::string& suffix,
                            const CheckoutCallback& report);

} // namespace history

#endif // HISTORY_HPP
