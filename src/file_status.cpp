#include "file_status.hpp"
#include <future>

#include "annex_utils.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "pattern_utils.hpp"

namespace filestatus {

const char* description(FileStatus s) {
    switch (s) {
    case FileStatus::Synced:
        return "Synced";
    case FileStatus::NoContent:
        return "No local content";
    case FileStatus::Modified:
        return "Locally modified (unsaved)";
    case FileStatus::LocalChanges:
        return "Locally modified (not uploaded)";
    case FileStatus::RemoteChanges:
        return "Remotely modified (not downloaded)";
    case FileStatus::Unlocked:
        return "Unlocked for editing";
    case FileStatus::TypeChange:
        return "Lock status changed";
    case FileStatus::Removed:
        return "Removed";
    case FileStatus::Untracked:
        return "Untracked";
    }
    return "Unknown";
}

const char* abbrev(FileStatus s) {
    switch (s) {
    case FileStatus::Synced:
        return "OK";
    case FileStatus::NoContent:
        return "NC";
    case FileStatus::Modified:
        return "MD";
    case FileStatus::LocalChanges:
        return "LC";
    case FileStatus::RemoteChanges:
        return "RC";
    case FileStatus::Unlocked:
        return "UL";
    case FileStatus::TypeChange:
        return "TC";
    case FileStatus::Removed:
        return "RM";
    case FileStatus::Untracked:
        return "??";
    }
    return "";
}

const std::vector<FileStatus>& all_statuses() {
    static const std::vector<FileStatus> order = {
        FileStatus::Synced,       FileStatus::NoContent,     FileStatus::Modified,
        FileStatus::LocalChanges, FileStatus::RemoteChanges, FileStatus::Unlocked,
        FileStatus::TypeChange,   FileStatus::Removed,       FileStatus::Untracked,
    };
    return order;
}

namespace {

std::vector<std::string> with_paths(std::vector<std::string> args,
                                    const std::vector<std::string>& paths) {
    args.insert(args.end(), paths.begin(), paths.end());
    return args;
}

std::vector<std::string> cleaned(const std::vector<std::string>& files) {
    std::vector<std::string> out;
    out.reserve(files.size());
    for (const auto& f : files)
        out.push_back(patterns::clean_path(f));
    return out;
}

// Here and elsewhere is synced, here only is not uploaded, not here at all
// means the content is missing locally. Undecodable entries carry no
// information and are skipped.
void apply_locations(const repo::Context& ctx, const std::vector<std::string>& paths,
                     StatusMap& out) {
    for (const auto& info : annex::whereis(ctx, paths)) {
        if (!info.error.empty()) {
            log_debug("Skipping undecodable whereis entry", info.error);
            continue;
        }
        if (info.file.empty())
            continue;
        FileStatus st = FileStatus::NoContent;
        for (const auto& loc : info.locations) {
            if (loc.here) {
                st = info.locations.size() > 1 ? FileStatus::Synced : FileStatus::LocalChanges;
                break;
            }
        }
        out[patterns::clean_path(info.file)] = st;
    }
}

void mark(const std::vector<std::string>& files, FileStatus st, StatusMap& out) {
    for (const auto& f : files)
        out[f] = st;
}

} // namespace

StatusMap resolve_direct(const repo::Context& ctx, const std::vector<std::string>& paths) {
    StatusMap statuses;
    apply_locations(ctx, paths, statuses);

    std::vector<std::string> status_paths = paths;
    if (status_paths.empty())
        status_paths.push_back(".");
    for (const auto& entry : annex::status(ctx, status_paths)) {
        std::string fname = patterns::clean_path(entry.file);
        if (entry.status == "?")
            statuses[fname] = FileStatus::Untracked;
        else if (entry.status == "M")
            statuses[fname] = FileStatus::Modified;
        else if (entry.status == "D")
            statuses[fname] = FileStatus::Removed;
    }

    std::vector<std::string> gitfiles;
    {
        repo::BareToggle toggle(ctx);
        for (const auto& f : cleaned(annex::ls_files(ctx, paths))) {
            if (statuses.count(f))
                continue;
            statuses[f] = FileStatus::Synced;
            gitfiles.push_back(f);
        }
    }
    if (!gitfiles.empty() && ctx.default_remote) {
        std::string upstream = *ctx.default_remote + "/master";
        for (const auto& f : cleaned(annex::diff_upstream(ctx, gitfiles, upstream)))
            statuses[f] = FileStatus::LocalChanges;
    }
    return statuses;
}

StatusMap resolve_indirect(const repo::Context& ctx, const std::vector<std::string>& paths) {
    auto query = [&ctx, &paths](const char* option) {
        return cleaned(annex::ls_files(ctx, with_paths({option}, paths)));
    };
    auto cached_f = std::async(std::launch::async, query, "--cached");
    auto modified_f = std::async(std::launch::async, query, "--modified");
    auto others_f = std::async(std::launch::async, query, "--others");
    auto deleted_f = std::async(std::launch::async, query, "--deleted");
    // get() rethrows the first failure after its task has finished; the
    // remaining futures join in their destructors.
    std::vector<std::string> cached = cached_f.get();
    std::vector<std::string> modified = modified_f.get();
    std::vector<std::string> others = others_f.get();
    std::vector<std::string> deleted = deleted_f.get();

    StatusMap statuses;
    if (!cached.empty()) {
        bool noremotes = !ctx.default_remote.has_value();
        if (!noremotes) {
            try {
                if (errors::trim(repo::ls_remote(ctx, *ctx.default_remote)).empty())
                    noremotes = true;
            } catch (const errors::OperationError& e) {
                log_warning("Could not query default remote", e.what());
            }
        }
        if (noremotes) {
            mark(cached, FileStatus::LocalChanges, statuses);
        } else {
            std::string upstream = *ctx.default_remote + "/master";
            mark(cleaned(annex::diff_upstream(ctx, cached, upstream)), FileStatus::LocalChanges,
                 statuses);
        }
        apply_locations(ctx, cached, statuses);
    }
    for (const auto& f : cached)
        statuses.emplace(f, FileStatus::Synced);

    mark(modified, FileStatus::Modified, statuses);
    mark(others, FileStatus::Untracked, statuses);
    mark(deleted, FileStatus::Removed, statuses);

    std::vector<std::string> status_paths = paths;
    if (status_paths.empty())
        status_paths.push_back(".");
    for (const auto& entry : annex::status(ctx, status_paths))
        if (entry.status == "T")
            statuses[patterns::clean_path(entry.file)] = FileStatus::TypeChange;
    return statuses;
}

StatusMap resolve(const repo::Context& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> paths = patterns::expand_globs(args, false);
    log_debug("Resolving file status",
              LogFields{{"mode", ctx.direct ? "direct" : "indirect"},
                        {"paths", std::to_string(paths.size())}});
    return ctx.direct ? resolve_direct(ctx, paths) : resolve_indirect(ctx, paths);
}

} // namespace filestatus
