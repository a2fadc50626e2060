#include "history.hpp"
#include <fstream>
#include <sstream>

#include "annex_utils.hpp"
#include "errors.hpp"
#include "logger.hpp"

using json = nlohmann::json;

namespace history {

using errors::Category;
using errors::OperationError;

namespace {

// Fields are separated by the ASCII unit separator; the body comes last and
// keeps any separators it contains.
const char* kLogFormat = "%H%x1f%h%x1f%an%x1f%ae%x1f%aI%x1f%s%x1f%b";
constexpr char kFieldSep = '\x1f';
constexpr size_t kLogFields = 7;

// Lowercase filters are not honoured by every git release, so deletions are
// left out by listing every other status.
const char* kNoDeletesFilter = "--diff-filter=ACMRTUXB";

// Bytes of a blob searched for the annex object path of a pointer file.
constexpr size_t kPointerScan = 255;

std::vector<std::string> query_args(std::vector<std::string> args, const LogQuery& q) {
    if (q.count > 0)
        args.push_back("--max-count=" + std::to_string(q.count));
    if (!q.show_deletes)
        args.push_back(kNoDeletesFilter);
    return args;
}

} // namespace

void to_json(json& j, const DiffStat& s) {
    j = json{{"new", s.added}, {"modified", s.modified}, {"deleted", s.deleted}};
}

void to_json(json& j, const CommitRecord& c) {
    j = json{{"hash", c.hash},
             {"abbrevhash", c.abbrev_hash},
             {"authorname", c.author_name},
             {"authoremail", c.author_email},
             {"date", c.date},
             {"subject", c.subject},
             {"body", c.body},
             {"filestats", c.stats}};
}

std::optional<CommitRecord> parse_commit(const std::string& record) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() + 1 < kLogFields) {
        size_t sep = record.find(kFieldSep, start);
        if (sep == std::string::npos)
            break;
        fields.push_back(record.substr(start, sep - start));
        start = sep + 1;
    }
    if (fields.size() + 1 < kLogFields) {
        log_warning("Error parsing git log",
                    LogFields{{"record", record},
                              {"fields", std::to_string(fields.size() + 1)}});
        return std::nullopt;
    }
    fields.push_back(record.substr(start));

    CommitRecord c;
    c.hash = fields[0];
    c.abbrev_hash = fields[1];
    c.author_name = fields[2];
    c.author_email = fields[3];
    c.date = fields[4];
    c.subject = fields[5];
    c.body = errors::trim(fields[6]);
    if (c.hash.empty()) {
        log_warning("Error parsing git log", LogFields{{"record", record}});
        return std::nullopt;
    }
    return c;
}

std::map<std::string, DiffStat> parse_name_status(const std::string& out) {
    std::map<std::string, DiffStat> stats;
    std::istringstream in(out);
    std::string line;
    std::string hash;
    while (std::getline(in, line)) {
        if (errors::trim(line).empty())
            continue;
        if (line.rfind("::", 0) == 0) {
            hash = line.substr(2);
            stats[hash];
            continue;
        }
        size_t tab = line.find('\t');
        if (tab == std::string::npos)
            continue;
        std::string st = line.substr(0, tab);
        std::string fname = line.substr(tab + 1);
        DiffStat& cur = stats[hash];
        if (st == "A")
            cur.added.push_back(fname);
        else if (st == "M")
            cur.modified.push_back(fname);
        else if (st == "D")
            cur.deleted.push_back(fname);
        else if (st != "R100")
            log_debug("Could not parse diffstat line", line);
    }
    return stats;
}

std::optional<TreeObject> parse_tree_entry(const std::string& record) {
    size_t tab = record.find('\t');
    if (tab == std::string::npos)
        return std::nullopt;
    std::istringstream in(record.substr(0, tab));
    TreeObject obj;
    if (!(in >> obj.mode >> obj.type >> obj.hash))
        return std::nullopt;
    obj.name = record.substr(tab + 1);
    if (obj.name.empty())
        return std::nullopt;
    return obj;
}

std::vector<CommitRecord> commit_log(const repo::Context& ctx, const LogQuery& q) {
    std::vector<std::string> args =
        query_args({"log", "-z", std::string("--format=") + kLogFormat}, q);
    if (!q.revrange.empty())
        args.push_back(q.revrange);
    args.push_back("--");
    args.insert(args.end(), q.paths.begin(), q.paths.end());

    procutil::CommandSpec spec = repo::git(ctx, std::move(args));
    spec.out_delims = procutil::kNulDelim;
    procutil::Process proc(spec);
    std::vector<CommitRecord> commits;
    while (auto rec = proc.next_out()) {
        if (rec->empty())
            continue;
        if (auto c = parse_commit(*rec))
            commits.push_back(std::move(*c));
    }
    std::string err = proc.rest_err();
    if (proc.wait() != 0) {
        log_command_output(spec.display(), "", err);
        if (err.find("bad revision") != std::string::npos)
            throw OperationError(Category::Command,
                                 "'" + q.revrange + "' does not match a known version ID or name",
                                 err);
        throw OperationError(Category::Command, "error retrieving version logs: " +
                                                    errors::trim(err), err);
    }

    std::map<std::string, DiffStat> stats = log_diffstat(ctx, q);
    for (auto& c : commits) {
        auto it = stats.find(c.hash);
        if (it != stats.end())
            c.stats = it->second;
    }
    return commits;
}

std::map<std::string, DiffStat> log_diffstat(const repo::Context& ctx, const LogQuery& q) {
    std::vector<std::string> args = query_args({"log", "--format=::%H", "--name-status"}, q);
    if (!q.revrange.empty())
        args.push_back(q.revrange);
    args.push_back("--");
    args.insert(args.end(), q.paths.begin(), q.paths.end());
    procutil::CaptureResult res = repo::run(repo::git(ctx, std::move(args)));
    if (!res.ok()) {
        log_warning("Failed to get diff stats");
        return {};
    }
    return parse_name_status(res.out);
}

std::vector<TreeObject> ls_tree(const repo::Context& ctx, const std::string& revision,
                                const std::vector<std::string>& paths) {
    std::vector<std::string> args = {"ls-tree", "--full-tree", "-z", "-t", "-r", revision};
    args.insert(args.end(), paths.begin(), paths.end());
    procutil::CommandSpec spec = repo::git(ctx, std::move(args));
    spec.out_delims = procutil::kNulDelim;
    procutil::Process proc(spec);
    std::vector<TreeObject> objects;
    while (auto rec = proc.next_out()) {
        if (auto obj = parse_tree_entry(*rec))
            objects.push_back(std::move(*obj));
    }
    std::string err = proc.rest_err();
    if (proc.wait() != 0) {
        log_command_output(spec.display(), "", err);
        throw OperationError(Category::Command, errors::trim(err), err);
    }
    return objects;
}

std::string cat_file(const repo::Context& ctx, const std::string& revision,
                     const std::string& path) {
    procutil::CaptureResult res =
        repo::run(repo::git(ctx, {"cat-file", "blob", revision + ":" + path}));
    if (!res.ok())
        throw OperationError(Category::Command, errors::trim(res.err), res.err);
    return res.out;
}

int rev_count(const repo::Context& ctx, const std::string& a, const std::string& b) {
    std::string out = repo::run_checked(repo::git(ctx, {"rev-list", "--count", a + ".." + b}),
                                        "failed to count revisions");
    try {
        return std::stoi(errors::trim(out));
    } catch (const std::logic_error&) {
        throw OperationError(Category::Command, "unexpected rev-list output", out);
    }
}

void checkout_version(const repo::Context& ctx, const std::string& revision,
                      const std::vector<std::string>& paths) {
    std::vector<std::string> targets = paths;
    if (targets.empty())
        targets.push_back(".");
    std::vector<std::string> args = {"checkout", revision, "--"};
    args.insert(args.end(), targets.begin(), targets.end());
    repo::run_checked(repo::git(ctx, std::move(args)), "checkout failed");

    std::vector<std::string> fsck = {"fsck"};
    fsck.insert(fsck.end(), paths.begin(), paths.end());
    repo::run_checked(repo::annex(ctx, std::move(fsck)), "annex fsck failed");
}

std::string copy_name(const std::string& name, const std::string& suffix) {
    std::filesystem::path p(name);
    std::string ext = p.extension().string();
    std::string stem = name.substr(0, name.size() - ext.size());
    return stem + "-" + suffix + ext;
}

size_t checkout_file_copies(const repo::Context& ctx, const std::string& revision,
                            const std::vector<std::string>& paths,
                            const std::filesystem::path& outpath, const std::string& suffix,
                            const CheckoutCallback& report) {
    namespace fs = std::filesystem;
    size_t failed = 0;
    auto emit = [&](const FileCheckoutStatus& st) {
        if (st.error)
            ++failed;
        if (report)
            report(st);
    };
    for (const auto& obj : ls_tree(ctx, revision, paths)) {
        FileCheckoutStatus status;
        status.name = obj.name;
        std::error_code ec;
        if (obj.type == "tree") {
            status.type = "Tree";
            status.destination = (outpath / obj.name).string();
            fs::create_directories(status.destination, ec);
            if (ec)
                status.error = "Error creating " + status.destination + ": " + ec.message();
            emit(status);
            continue;
        }
        if (obj.type != "blob")
            continue;

        fs::path outfile = outpath / copy_name(obj.name, suffix);
        status.destination = outfile.string();
        const std::string exists_error =
            "destination file '" + outfile.string() + "' exists; refusing to overwrite";
        std::string content;
        try {
            content = cat_file(ctx, revision, obj.name);
        } catch (const OperationError& e) {
            status.error = e.what();
            emit(status);
            continue;
        }
        fs::create_directories(outfile.parent_path(), ec);
        if (ec) {
            status.error = "Error creating " + outfile.parent_path().string() + ": " +
                           ec.message();
            emit(status);
            continue;
        }

        if (content.substr(0, kPointerScan).find("/annex/objects") != std::string::npos) {
            status.type = "Annex";
            std::string key = fs::path(errors::trim(content)).filename().string();
            auto loc = annex::content_location(ctx, key);
            if (!loc) {
                log_info("Fetching annexed content", key);
                if (!annex::get_key(ctx, key))
                    log_warning("Content download by key failed", key);
                loc = annex::content_location(ctx, key);
            }
            if (!loc) {
                status.error = "Annexed content is not available locally";
            } else if (fs::exists(outfile, ec)) {
                status.error = exists_error;
            } else if (!fs::copy_file(*loc, outfile, fs::copy_options::none, ec)) {
                status.error = "Error writing " + outfile.string() + ": " + ec.message();
            }
        } else if (obj.mode == "120000") {
            status.type = "Link";
            status.destination = content;
        } else if (obj.mode == "100755" || obj.mode == "100644") {
            status.type = "Git";
            if (fs::exists(outfile, ec)) {
                status.error = exists_error;
            } else {
                std::ofstream out(outfile, std::ios::binary);
                out.write(content.data(), static_cast<std::streamsize>(content.size()));
                if (!out)
                    status.error = "Error writing " + outfile.string();
            }
        } else {
            status.error = "Unexpected object found in tree: " + obj.name;
        }
        emit(status);
    }
    return failed;
}

} // namespace history
