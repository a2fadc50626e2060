#include "transfer.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <system_error>

#include "annex_utils.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "pattern_utils.hpp"
#include "process.hpp"
#include "progress_parser.hpp"

namespace transfer {

using errors::Category;
using errors::Failure;

namespace {

std::vector<std::string> with_paths(std::vector<std::string> args,
                                    const std::vector<std::string>& paths) {
    args.insert(args.end(), paths.begin(), paths.end());
    return args;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

/**
 * Stream the stdout of a git-annex JSON command through @p parser.
 *
 * @return Number of item failures reported by the tool.
 */
size_t run_annex_items(const procutil::CommandSpec& spec, progress::AnnexEventParser& parser,
                       EventSink& sink, const std::string& what,
                       const std::function<void(const StatusEvent&)>& on_success = {}) {
    procutil::Process proc(spec);
    size_t failed = 0;
    while (auto line = proc.next_out()) {
        auto ev = parser.feed(*line);
        if (!ev)
            continue;
        if (ev->error)
            ++failed;
        else if (on_success && ev->progress == progress::kComplete)
            on_success(*ev);
        sink.send(std::move(*ev));
    }
    std::string err = proc.rest_err();
    if (proc.wait() != 0) {
        log_command_output(spec.display(), "", err);
        if (failed == 0) {
            std::string detail = errors::trim(err);
            sink.fail("", Failure{Category::Command, detail.empty() ? what : what + ": " + detail,
                                  {}, err},
                      spec.display());
            ++failed;
        }
    }
    return failed;
}

// git push with progress parsed from stderr. Returns false after reporting a
// classified failure.
bool push_history(const repo::Context& ctx, const std::string& remote, EventSink& sink) {
    repo::BareToggle toggle(ctx);
    procutil::CommandSpec spec = repo::git(ctx, {"push", "--progress", remote});
    spec.err_delims = procutil::kProgressDelims;
    procutil::Process proc(spec);
    std::string err;
    while (auto line = proc.next_err()) {
        err += *line + "\n";
        auto p = progress::parse_push_line(*line, remote);
        if (!p)
            continue;
        StatusEvent ev;
        ev.state = p->state;
        ev.progress = p->percent;
        ev.raw_input = spec.display();
        ev.raw_output = *line;
        sink.send(std::move(ev));
    }
    if (proc.wait() == 0)
        return true;
    log_command_output(spec.display(), "", err);
    sink.fail("", errors::classify(err, errors::upload_rules(), "upload failed"), spec.display());
    return false;
}

bool push_annex_branch(const repo::Context& ctx, EventSink& sink) {
    procutil::CommandSpec spec = repo::annex(ctx, {"sync", "--no-pull", "--no-commit"});
    procutil::CaptureResult res = repo::run(spec);
    if (res.ok())
        return true;
    sink.fail("", errors::classify(res.out + res.err, errors::upload_rules(), "upload failed"),
              spec.display());
    return false;
}

void copy_content(const repo::Context& ctx, const std::vector<std::string>& paths,
                  const std::string& remote, EventSink& sink) {
    std::string state = "Uploading (to: " + remote + ")";
    std::vector<std::string> eligible;
    for (const auto& info : annex::whereis(ctx, paths)) {
        if (info.error.empty() && !info.file.empty())
            eligible.push_back(info.file);
    }
    if (eligible.empty()) {
        log_info("No annexed content to upload", remote);
        sink.notice(remote, state, "no annexed content eligible for upload");
        return;
    }
    std::vector<std::string> args = {"copy", "--json-progress", "--to=" + remote};
    if (paths.empty())
        args.push_back("--all");
    else
        args.insert(args.end(), eligible.begin(), eligible.end());
    procutil::CommandSpec spec = repo::annex(ctx, std::move(args));
    progress::KeyNameResolver names(
        [&ctx](const std::string& key) { return annex::metadata_name(ctx, key); });
    progress::AnnexEventParser parser(state, spec.display(), {}, &names);
    run_annex_items(spec, parser, sink, "upload failed");
}

// Shared handling of `annex sync` variants that merge remote changes.
bool merge_sync(const repo::Context& ctx, const procutil::CommandSpec& spec,
                const std::string& state, EventSink& sink) {
    procutil::CaptureResult res = repo::run(spec);
    std::string text = res.out + "\n" + res.err;
    if (!res.ok()) {
        Failure f = errors::classify(text, errors::download_rules(), "download failed");
        if (f.category == Category::WouldOverwrite) {
            f.files = errors::files_between_markers(
                text, {"would be overwritten by merge"},
                {"Please commit your changes", "Please move or remove", "Aborting"});
        } else if (f.category == Category::MergeConflict) {
            f.files = errors::files_with_marker(text, "Merge conflict in ");
            repo::merge_abort(ctx);
        }
        sink.fail("", std::move(f), spec.display());
        return false;
    }
    std::vector<std::string> variants = variant_files(text);
    if (!variants.empty()) {
        StatusEvent ev;
        ev.state = state;
        ev.raw_input = spec.display();
        ev.raw_output = text;
        ev.notice = true;
        ev.error = Failure{Category::AutoResolvedConflict,
                           "files changed locally and remotely were merged automatically; "
                           "both versions were kept",
                           variants, ""};
        sink.send(std::move(ev));
    }
    StatusEvent done;
    done.state = state;
    done.progress = progress::kComplete;
    done.raw_input = spec.display();
    done.raw_output = res.out;
    sink.send(std::move(done));
    return true;
}

void get_paths(const repo::Context& ctx, const std::vector<std::string>& paths,
               EventSink& sink) {
    procutil::CommandSpec spec = repo::annex(ctx, with_paths({"get", "--json-progress"}, paths));
    progress::AnnexEventParser parser(kStateGet, spec.display());
    run_annex_items(spec, parser, sink, "download failed");
}

void annex_add_common(const repo::Context& ctx, const std::vector<std::string>& paths,
                      bool update, EventSink& sink) {
    std::vector<std::string> args = {"add", "--json"};
    if (update)
        args.push_back("--update");
    args.insert(args.end(), paths.begin(), paths.end());
    std::vector<std::string> filter =
        cmd::annex_filter_args(ctx.tools, repo::command_relative(ctx, cmd::kRepoConfigFile));
    args.insert(args.end(), filter.begin(), filter.end());
    procutil::CommandSpec spec = repo::annex(ctx, std::move(args));
    progress::AnnexEventParser parser(update ? kStateLock : kStateAnnexAdd, spec.display(),
                                      [](const progress::AnnexAction&) { return "failed"; });
    run_annex_items(spec, parser, sink, update ? "lock failed" : "annex add failed",
                    [&ctx](const StatusEvent& ev) {
                        if (!annex::set_metadata_name(ctx, ev.file_name))
                            log_warning("Failed to record file name metadata", ev.file_name);
                    });
}

// Direct mode: git add must skip annexed files but pick up deletions.
std::vector<std::string> git_add_direct(const repo::Context& ctx,
                                        const std::vector<std::string>& paths) {
    std::vector<std::string> annexed;
    for (const auto& info : annex::whereis(ctx, paths)) {
        if (info.error.empty() && !info.file.empty())
            annexed.push_back(patterns::clean_path(info.file));
    }
    std::vector<std::string> filtered;
    for (const auto& p : paths) {
        if (!contains(annexed, patterns::clean_path(p)))
            filtered.push_back(p);
    }
    for (const auto& f : annex::ls_files(ctx, paths)) {
        std::string clean = patterns::clean_path(f);
        if (!contains(annexed, clean) && !contains(filtered, clean))
            filtered.push_back(clean);
    }
    return filtered;
}

// "add 'name'" and "remove 'name'" lines of `git add --verbose`.
std::optional<StatusEvent> parse_git_add_line(const std::string& line) {
    StatusEvent ev;
    std::string rest;
    if (line.rfind("add '", 0) == 0) {
        ev.state = kStateGitAdd;
        rest = line.substr(5);
    } else if (line.rfind("remove '", 0) == 0) {
        ev.state = kStateRemove;
        rest = line.substr(8);
    } else {
        return std::nullopt;
    }
    if (!rest.empty() && rest.back() == '\'')
        rest.pop_back();
    ev.file_name = rest;
    ev.progress = progress::kComplete;
    ev.raw_output = line;
    return ev;
}

void git_add(const repo::Context& ctx, std::vector<std::string> paths, EventSink& sink) {
    if (paths.empty()) {
        log_debug("No paths to add to git");
        return;
    }
    repo::BareToggle toggle(ctx);
    if (ctx.direct) {
        paths = git_add_direct(ctx, paths);
        if (paths.empty())
            return;
    }
    procutil::CommandSpec spec = repo::git(ctx, with_paths({"add", "--verbose", "--"}, paths));
    procutil::Process proc(spec);
    while (auto line = proc.next_out()) {
        auto ev = parse_git_add_line(*line);
        if (!ev)
            continue;
        ev->raw_input = spec.display();
        sink.send(std::move(*ev));
    }
    std::string err = proc.rest_err();
    if (proc.wait() != 0) {
        log_command_output(spec.display(), "", err);
        sink.fail("", Failure{Category::Command, "git add failed: " + errors::trim(err), {}, err},
                  spec.display());
    }
}

std::string clone_failure(const std::string& err, const std::string& dest) {
    if (err.find("does not exist") != std::string::npos ||
        err.find("not found") != std::string::npos)
        return "Repository download failed. Make sure you typed the repository path correctly "
               "and that you have access to it";
    if (err.find("already exists and is not an empty directory") != std::string::npos)
        return "Repository download failed. '" + dest +
               "' already exists in the current directory and is not empty.";
    if (err.find("Host key verification failed") != std::string::npos)
        return "Server key does not match known or configured host key";
    return "Repository download failed: " + errors::trim(err);
}

} // namespace

std::vector<std::string> variant_files(const std::string& output) {
    std::vector<std::string> files;
    for (const auto& line : errors::lines_containing(output, ".variant-")) {
        std::istringstream words(line);
        std::string w;
        while (words >> w) {
            if (w.find(".variant-") == std::string::npos)
                continue;
            w.erase(std::remove(w.begin(), w.end(), '\''), w.end());
            w.erase(std::remove(w.begin(), w.end(), '"'), w.end());
            if (!w.empty() && !contains(files, w))
                files.push_back(w);
        }
    }
    return files;
}

std::string clone_dir_name(const std::string& url) {
    std::string s = url;
    while (!s.empty() && s.back() == '/')
        s.pop_back();
    size_t cut = s.find_last_of("/:");
    std::string name = cut == std::string::npos ? s : s.substr(cut + 1);
    const std::string suffix = ".git";
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)
        name.erase(name.size() - suffix.size());
    return name;
}

EventStream upload(const repo::Context& ctx, std::vector<std::string> paths,
                   std::vector<std::string> remotes) {
    return EventStream([ctx, paths = std::move(paths),
                        remotes = std::move(remotes)](EventSink& sink) mutable {
        log_info("Upload", LogFields{{"paths", std::to_string(paths.size())},
                                     {"remotes", std::to_string(remotes.size())}});
        paths = patterns::expand_globs(paths, false);
        if (remotes.empty())
            remotes.push_back(repo::require_default_remote(ctx));
        auto known = repo::remotes(ctx);
        for (const auto& remote : remotes) {
            if (known.find(remote) == known.end()) {
                sink.fail(remote, Failure{Category::Command,
                                          "unknown remote name '" + remote + "': skipping",
                                          {remote},
                                          ""});
                continue;
            }
            if (!push_history(ctx, remote, sink))
                continue;
            if (!push_annex_branch(ctx, sink))
                continue;
            copy_content(ctx, paths, remote, sink);
        }
    });
}

EventStream download(const repo::Context& ctx, bool content) {
    return EventStream([ctx, content](EventSink& sink) {
        log_info("Download");
        procutil::CommandSpec spec = repo::annex(ctx, {"sync", "--no-push", "--no-commit"});
        if (merge_sync(ctx, spec, kStateDownload, sink) && content)
            get_paths(ctx, {}, sink);
    });
}

EventStream sync(const repo::Context& ctx, bool content) {
    return EventStream([ctx, content](EventSink& sink) {
        log_info("Sync", content ? "with content" : "");
        std::vector<std::string> args = {"sync", "--resolvemerge"};
        if (content)
            args.push_back("--content");
        merge_sync(ctx, repo::annex(ctx, std::move(args)), kStateSync, sink);
    });
}

EventStream add(const repo::Context& ctx, std::vector<std::string> paths) {
    return EventStream([ctx, paths = std::move(paths)](EventSink& sink) {
        std::vector<std::string> expanded = patterns::expand_globs(paths, false);
        if (expanded.empty())
            return;
        // Files below the size threshold or excluded never reach git-annex.
        // Exclusions apply to root-relative paths whatever the invocation
        // directory.
        std::vector<std::string> annex_paths;
        for (const auto& p : expanded) {
            std::error_code ec;
            std::filesystem::path full = repo::command_dir(ctx) / p;
            if (std::filesystem::is_directory(full, ec)) {
                annex_paths.push_back(p);
                continue;
            }
            std::string rel = repo::root_relative(ctx, p);
            if (rel == cmd::kRepoConfigFile)
                continue;
            std::uintmax_t size = std::filesystem::file_size(full, ec);
            if (ec || cmd::is_content_file(ctx.tools, rel, size))
                annex_paths.push_back(p);
        }
        if (!annex_paths.empty())
            annex_add_common(ctx, annex_paths, false, sink);
        git_add(ctx, expanded, sink);
    });
}

EventStream get_content(const repo::Context& ctx, std::vector<std::string> paths) {
    return EventStream([ctx, paths = std::move(paths)](EventSink& sink) {
        get_paths(ctx, patterns::expand_globs(paths, true), sink);
    });
}

EventStream remove_content(const repo::Context& ctx, std::vector<std::string> paths) {
    return EventStream([ctx, paths = std::move(paths)](EventSink& sink) {
        procutil::CommandSpec spec = repo::annex(
            ctx, with_paths({"drop", "--json"}, patterns::expand_globs(paths, true)));
        progress::AnnexEventParser parser(
            kStateDrop, spec.display(), [](const progress::AnnexAction& a) -> std::string {
                if (a.note.find("unsafe") != std::string::npos)
                    return "failed (unsafe): could not verify remote copy";
                return a.note;
            });
        run_annex_items(spec, parser, sink, "remove content failed");
    });
}

EventStream lock(const repo::Context& ctx, std::vector<std::string> paths) {
    return EventStream([ctx, paths = std::move(paths)](EventSink& sink) {
        annex_add_common(ctx, patterns::expand_globs(paths, true), true, sink);
    });
}

EventStream unlock(const repo::Context& ctx, std::vector<std::string> paths) {
    return EventStream([ctx, paths = std::move(paths)](EventSink& sink) {
        procutil::CommandSpec spec = repo::annex(
            ctx, with_paths({"unlock", "--json"}, patterns::expand_globs(paths, true)));
        progress::AnnexEventParser parser(kStateUnlock, spec.display(),
                                          [](const progress::AnnexAction&) -> std::string {
                                              return "Content not available locally. Use "
                                                     "'annexsync get-content' to download";
                                          });
        run_annex_items(spec, parser, sink, "unlock failed");
    });
}

EventStream clone(const cmd::ToolConfig& tools, std::filesystem::path parent, std::string url,
                  std::string dest, std::string description) {
    return EventStream([tools, parent = std::move(parent), url = std::move(url),
                        dest = std::move(dest),
                        description = std::move(description)](EventSink& sink) {
        std::string target = dest.empty() ? clone_dir_name(url) : dest;
        procutil::CommandSpec spec = cmd::clone_command(tools, parent, url, target);
        StatusEvent status;
        status.file_name = target;
        status.state = kStateClone;
        status.raw_input = spec.display();
        sink.send(status);

        procutil::Process proc(spec);
        std::string err;
        while (auto line = proc.next_err()) {
            err += *line + "\n";
            auto p = progress::parse_clone_line(*line);
            if (!p)
                continue;
            status.progress = p->percent;
            status.rate = p->rate;
            status.raw_output = *line;
            sink.send(status);
        }
        if (proc.wait() != 0) {
            log_command_output(spec.display(), "", err);
            Category cat = err.find("Host key verification failed") != std::string::npos
                               ? Category::HostKey
                               : Category::Command;
            sink.fail(target, Failure{cat, clone_failure(err, target), {}, err}, spec.display());
            return;
        }

        StatusEvent init;
        init.file_name = target;
        init.state = kStateInit;
        sink.send(init);
        repo::init_repo(parent / target, tools, description);
        init.progress = progress::kComplete;
        sink.send(std::move(init));
    });
}

} // namespace transfer
