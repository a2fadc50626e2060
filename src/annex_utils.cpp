#include "annex_utils.hpp"
#include <map>
#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "logger.hpp"
#include "progress_parser.hpp"

using json = nlohmann::json;

namespace annex {

using errors::Category;
using errors::OperationError;

namespace {

std::vector<std::string> with_args(std::vector<std::string> head,
                                   const std::vector<std::string>& tail) {
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

std::vector<std::string> split_records(const std::string& out, char sep) {
    std::vector<std::string> recs;
    size_t start = 0;
    while (start <= out.size()) {
        size_t end = out.find(sep, start);
        if (end == std::string::npos)
            end = out.size();
        std::string rec = out.substr(start, end - start);
        if (!rec.empty() && rec.back() == '\r')
            rec.pop_back();
        if (!rec.empty())
            recs.push_back(rec);
        start = end + 1;
    }
    return recs;
}

std::string make_file_list(const std::string& header, const std::vector<std::string>& names) {
    if (names.empty())
        return "";
    std::string out = header + " (" + std::to_string(names.size()) + ")\n";
    for (size_t i = 0; i < names.size(); ++i)
        out += "  " + std::to_string(i + 1) + ": " + names[i] + "\n";
    return out + "\n";
}

} // namespace

std::vector<ContentLocationInfo> whereis(const repo::Context& ctx,
                                         const std::vector<std::string>& paths) {
    procutil::CommandSpec spec = repo::annex(ctx, with_args({"whereis", "--json"}, paths));
    procutil::Process proc(spec);
    std::vector<ContentLocationInfo> out;
    while (auto line = proc.next_out()) {
        if (errors::trim(*line).empty())
            continue;
        ContentLocationInfo info;
        try {
            json j = json::parse(*line);
            info.key = j.value("key", "");
            info.file = j.value("file", "");
            info.success = j.value("success", false);
            if (j.contains("whereis") && j["whereis"].is_array()) {
                for (const auto& w : j["whereis"]) {
                    Location loc;
                    loc.uuid = w.value("uuid", "");
                    loc.description = w.value("description", "");
                    loc.here = w.value("here", false);
                    info.locations.push_back(loc);
                }
            }
        } catch (const json::exception& e) {
            info.error = e.what();
        }
        out.push_back(std::move(info));
    }
    std::string err = proc.rest_err();
    if (proc.wait() != 0)
        log_command_output(spec.display(), "", err);
    return out;
}

std::vector<StatusEntry> status(const repo::Context& ctx, const std::vector<std::string>& paths) {
    procutil::CommandSpec spec = repo::annex(ctx, with_args({"status", "--json"}, paths));
    procutil::CaptureResult res = repo::run(spec);
    if (!res.ok())
        throw OperationError(Category::Command,
                             "Failed to run git-annex status: " + errors::trim(res.err), res.err);
    std::vector<StatusEntry> out;
    for (const auto& line : split_records(res.out, '\n')) {
        try {
            json j = json::parse(line);
            out.push_back(StatusEntry{j.value("status", ""), j.value("file", "")});
        } catch (const json::exception& e) {
            throw OperationError(Category::Command,
                                 "Failed to read git-annex status: " + std::string(e.what()), line);
        }
    }
    return out;
}

std::vector<std::string> ls_files(const repo::Context& ctx, const std::vector<std::string>& args) {
    std::string out =
        repo::run_checked(repo::git(ctx, with_args({"ls-files"}, args)), "git ls-files failed");
    return split_records(out, '\n');
}

std::vector<std::string> diff_upstream(const repo::Context& ctx,
                                       const std::vector<std::string>& paths,
                                       const std::string& upstream) {
    procutil::CaptureResult res = repo::run(repo::git(
        ctx, with_args({"diff", "-z", "--name-only", "--relative", upstream, "--"}, paths)));
    if (!res.ok())
        return {};
    return split_records(res.out, '\0');
}

std::string metadata_name(const repo::Context& ctx, const std::string& key) {
    procutil::CaptureResult res =
        repo::run(repo::annex(ctx, {"metadata", "--json", "--key=" + key}));
    if (!res.ok()) {
        log_error("Error retrieving annexed content metadata", key);
        return "";
    }
    return progress::metadata_display_name(errors::trim(res.out));
}

bool set_metadata_name(const repo::Context& ctx, const std::string& path) {
    std::string name = std::filesystem::path(path).filename().string();
    procutil::CaptureResult res =
        repo::run(repo::annex(ctx, {"metadata", "--set=annexsync-filename=" + name, path}));
    if (res.ok())
        log_debug("Filename metadata set", LogFields{{"file", path}, {"name", name}});
    return res.ok();
}

std::optional<std::string> content_location(const repo::Context& ctx, const std::string& key) {
    procutil::CaptureResult res = repo::run(repo::annex(ctx, {"contentlocation", key}));
    std::string loc = errors::trim(res.out);
    if (!res.ok() || loc.empty())
        return std::nullopt;
    return (repo::command_dir(ctx) / loc).string();
}

bool get_key(const repo::Context& ctx, const std::string& key) {
    return repo::run(repo::annex(ctx, {"get", "--json-progress", "--key=" + key})).ok();
}

std::string describe_index(const repo::Context& ctx, const std::vector<std::string>& paths) {
    std::map<std::string, std::vector<std::string>> groups;
    for (const auto& entry : status(ctx, paths))
        groups[entry.status].push_back(entry.file);
    return make_file_list("New files", groups["A"]) +
           make_file_list("Modified files", groups["M"]) +
           make_file_list("Deleted files", groups["D"]) +
           make_file_list("Type modified files", groups["T"]) +
           make_file_list("Untracked files", groups["?"]);
}

std::string describe_index_short(const repo::Context& ctx, const std::vector<std::string>& paths) {
    std::map<std::string, size_t> counts;
    for (const auto& entry : status(ctx, paths))
        ++counts[entry.status];
    std::string out;
    if (counts["A"] > 0)
        out += "New files: " + std::to_string(counts["A"]) + "\n";
    if (counts["M"] > 0)
        out += "Modified files: " + std::to_string(counts["M"]) + "\n";
    if (counts["D"] > 0)
        out += "Deleted files: " + std::to_string(counts["D"]) + "\n";
    return out;
}

} // namespace annex
