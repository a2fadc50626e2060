#include "cli_commands.hpp"
#include <algorithm>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <unistd.h>
#include <nlohmann/json.hpp>

#include "annex_utils.hpp"
#include "errors.hpp"
#include "history.hpp"
#include "logger.hpp"
#include "parse_utils.hpp"
#include "progress_parser.hpp"
#include "repo_context.hpp"
#include "system_utils.hpp"
#include "time_utils.hpp"
#include "tool_versions.hpp"
#include "transfer.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace cli {

std::string event_json(const StatusEvent& ev) {
    json j = {{"filename", ev.file_name},
              {"state", ev.state},
              {"progress", ev.progress},
              {"rate", ev.rate},
              {"err", ev.error ? ev.error->message : std::string()}};
    if (ev.error && !ev.error->files.empty())
        j["errfiles"] = ev.error->files;
    if (ev.notice)
        j["notice"] = true;
    return j.dump();
}

std::string failure_summary(size_t failed) {
    return std::to_string(failed) + (failed == 1 ? " operation failed" : " operations failed");
}

namespace {

std::string progress_line(const StatusEvent& ev) {
    std::string line = " ";
    auto append = [&line](const std::string& part) {
        if (!part.empty())
            line += part + " ";
    };
    append(ev.state);
    if (!ev.file_name.empty())
        append("\"" + ev.file_name + "\"");
    if (ev.error) {
        append(ev.error->describe());
    } else if (ev.notice) {
        append(ev.raw_output);
    } else if (ev.progress == progress::kComplete) {
        append("OK");
    } else {
        append(ev.progress);
        append(ev.rate);
    }
    return line;
}

} // namespace

size_t print_events(EventStream& stream, OutputStyle style, std::ostream& out, bool interactive) {
    std::map<std::string, bool> success;
    size_t unnamed_failures = 0; // remote or command level, one per event
    bool printed = false;
    std::string fname, state, lastprint, rawin;
    while (auto ev = stream.next()) {
        if (!ev->notice) {
            if (ev->error) {
                log_error(ev->error->message, ev->file_name);
                if (ev->file_name.empty())
                    ++unnamed_failures;
                else
                    success[ev->file_name] = false;
            } else if (ev->progress == progress::kComplete && !ev->file_name.empty()) {
                success.emplace(ev->file_name, true);
            }
        } else if (ev->error) {
            log_warning(ev->error->message, ev->file_name);
        }

        switch (style) {
        case OutputStyle::Json:
            out << event_json(*ev) << "\n";
            break;
        case OutputStyle::Verbose:
            if (ev->raw_input != rawin) {
                out << "Running Command: " << ev->raw_input << "\n";
                rawin = ev->raw_input;
            }
            out << ev->raw_output;
            if (!ev->raw_output.empty() && ev->raw_output.back() != '\n')
                out << "\n";
            break;
        case OutputStyle::Progress: {
            bool new_item = ev->file_name != fname || ev->state != state;
            std::string line = progress_line(*ev);
            bool final = ev->error || ev->notice || ev->progress == progress::kComplete;
            if (interactive) {
                if (new_item && !lastprint.empty())
                    out << "\n";
                if (new_item)
                    lastprint.clear();
                if (line != lastprint) {
                    out << "\r" << std::string(lastprint.size(), ' ') << "\r" << line;
                    lastprint = line;
                }
            } else if (final || new_item) {
                // Without a terminal only the first and the final line of an item are shown.
                if (!new_item && !lastprint.empty() && lastprint != line)
                    out << "\n";
                if (line != lastprint) {
                    if (new_item && !lastprint.empty())
                        out << "\n";
                    out << line;
                    lastprint = line;
                }
            }
            fname = ev->file_name;
            state = ev->state;
            break;
        }
        }
        printed = true;
    }
    if (style == OutputStyle::Progress) {
        if (!lastprint.empty())
            out << "\n";
        if (!printed)
            out << "   Nothing to do\n";
    }
    out.flush();
    return unnamed_failures +
           static_cast<size_t>(std::count_if(success.begin(), success.end(),
                                             [](const auto& kv) { return !kv.second; }));
}

std::string format_status_listing(const filestatus::StatusMap& statuses, bool short_form) {
    std::ostringstream out;
    if (short_form) {
        for (const auto& [file, st] : statuses)
            out << filestatus::abbrev(st) << " " << file << "\n";
        return out.str();
    }
    std::map<filestatus::FileStatus, std::vector<std::string>> groups;
    for (const auto& [file, st] : statuses)
        groups[st].push_back(file);
    for (auto st : filestatus::all_statuses()) {
        auto it = groups.find(st);
        if (it == groups.end())
            continue;
        out << filestatus::description(st) << ":\n\n";
        for (const auto& f : it->second)
            out << "\t" << f << "\n";
        out << "\n";
    }
    return out.str();
}

std::string status_listing_json(const filestatus::StatusMap& statuses) {
    json arr = json::array();
    for (const auto& [file, st] : statuses)
        arr.push_back({{"filename", file}, {"status", filestatus::abbrev(st)}});
    return arr.dump();
}

std::string resolve_remote_url(const ClientConfig& cfg, const std::string& location) {
    size_t colon = location.find(':');
    if (colon == std::string::npos)
        return location;
    auto it = cfg.servers.find(location.substr(0, colon));
    if (it == cfg.servers.end())
        return location;
    return it->second.repo_url(location.substr(colon + 1));
}

std::string make_commit_message(const std::string& action, const std::string& changes) {
    return "annexsync " + action + " from " + procutil::host_name() + "\n\n" + changes;
}

namespace {

using Handler = std::function<int(const Options&, const ClientConfig&)>;

bool interactive_output() { return ::isatty(STDOUT_FILENO) == 1; }

int finish(EventStream& stream, const Options& opts) {
    size_t failed = print_events(stream, opts.style, std::cout, interactive_output());
    if (failed == 0)
        return 0;
    std::cerr << failure_summary(failed) << "\n";
    return 1;
}

repo::Context open_repo(const ClientConfig& cfg) {
    versions::check_tools(cfg.tools);
    return repo::open_context(fs::current_path(), cfg.tools);
}

std::string clone_description() {
    std::string user = procutil::safe_getenv("USER").value_or("annexsync");
    return user + "@" + procutil::host_name();
}

// Records changes of the given paths; "Nothing to commit" is not an error.
bool record_changes(const repo::Context& ctx, const Options& opts, const std::string& action) {
    std::string msg = opts.message;
    if (msg.empty()) {
        std::string changes;
        try {
            changes = annex::describe_index_short(ctx, opts.args);
        } catch (const errors::OperationError& e) {
            log_warning("Failed to determine changes for commit message", e.what());
        }
        msg = make_commit_message(action, changes);
    }
    if (opts.style == OutputStyle::Progress)
        std::cout << ":: Recording changes " << std::flush;
    try {
        repo::commit(ctx, msg);
    } catch (const errors::OperationError& e) {
        if (e.failure().message != "Nothing to commit")
            throw;
        if (opts.style == OutputStyle::Progress)
            std::cout << "N/A\n:: No changes recorded\n";
        return false;
    }
    if (opts.style == OutputStyle::Progress)
        std::cout << "OK\n";
    return true;
}

int cmd_init(const Options& opts, const ClientConfig& cfg) {
    versions::check_tools(cfg.tools);
    if (opts.style == OutputStyle::Progress)
        std::cout << ":: Initialising local storage " << std::flush;
    repo::init_repo(fs::current_path(), cfg.tools, clone_description());
    if (opts.style == OutputStyle::Progress)
        std::cout << "OK\n";
    return 0;
}

int cmd_clone(const Options& opts, const ClientConfig& cfg) {
    if (opts.args.empty())
        throw std::runtime_error("clone requires a repository location");
    versions::check_tools(cfg.tools);
    std::string url = resolve_remote_url(cfg, opts.args[0]);
    std::string dest = opts.args.size() > 1 ? opts.args[1] : "";
    EventStream stream =
        transfer::clone(cfg.tools, fs::current_path(), url, dest, clone_description());
    return finish(stream, opts);
}

int cmd_add(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    EventStream stream = transfer::add(ctx, opts.args);
    return finish(stream, opts);
}

int cmd_commit(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    EventStream stream = transfer::add(ctx, opts.args);
    int rc = finish(stream, opts);
    record_changes(ctx, opts, "commit");
    return rc;
}

int cmd_upload(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    int rc = 0;
    if (!opts.args.empty()) {
        EventStream added = transfer::add(ctx, opts.args);
        rc = finish(added, opts);
        record_changes(ctx, opts, "upload");
    }
    EventStream stream = transfer::upload(ctx, opts.args, opts.remotes);
    return std::max(rc, finish(stream, opts));
}

int cmd_download(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    // Unlocked files would block the merge.
    EventStream locked = transfer::lock(ctx, {});
    int rc = finish(locked, opts);
    EventStream stream = transfer::download(ctx, opts.content);
    return std::max(rc, finish(stream, opts));
}

int cmd_sync(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    EventStream stream = transfer::sync(ctx, opts.content);
    return finish(stream, opts);
}

int cmd_get_content(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    EventStream stream = transfer::get_content(ctx, opts.args);
    return finish(stream, opts);
}

int cmd_remove_content(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    EventStream stream = transfer::remove_content(ctx, opts.args);
    return finish(stream, opts);
}

int cmd_lock(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    EventStream stream = transfer::lock(ctx, opts.args);
    return finish(stream, opts);
}

int cmd_unlock(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    EventStream stream = transfer::unlock(ctx, opts.args);
    return finish(stream, opts);
}

int cmd_ls(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    filestatus::StatusMap statuses = filestatus::resolve(ctx, opts.args);
    if (opts.style == OutputStyle::Json)
        std::cout << status_listing_json(statuses) << "\n";
    else
        std::cout << format_status_listing(statuses, opts.short_status);
    return 0;
}

void print_commit(const history::CommitRecord& c, const std::string& prefix) {
    std::cout << prefix << c.abbrev_hash << " * " << c.date << "\n\n";
    std::cout << "    " << c.subject << "\n";
    if (!c.body.empty())
        std::cout << "    " << c.body << "\n";
    auto list = [](const char* title, const std::vector<std::string>& files) {
        if (files.empty())
            return;
        std::cout << "  " << title << "\n    ";
        for (size_t i = 0; i < files.size(); ++i)
            std::cout << (i ? ", " : "") << files[i];
        std::cout << "\n";
    };
    list("Added", c.stats.added);
    list("Modified", c.stats.modified);
    list("Deleted", c.stats.deleted);
    std::cout << "\n";
}

int cmd_log(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    history::LogQuery q;
    q.count = opts.max_count;
    q.revrange = opts.revision;
    q.paths = opts.args;
    auto commits = history::commit_log(ctx, q);
    if (opts.style == OutputStyle::Json) {
        std::cout << json(commits).dump() << "\n";
        return 0;
    }
    for (const auto& c : commits)
        print_commit(c, "");
    return 0;
}

history::CommitRecord prompt_version(const std::vector<history::CommitRecord>& commits) {
    size_t width = std::to_string(commits.size() + 1).size();
    for (size_t i = 0; i < commits.size(); ++i) {
        std::string idx = std::to_string(i + 1);
        print_commit(commits[i], "[" + std::string(width - idx.size(), ' ') + idx + "]  ");
    }
    std::cout << "Version to retrieve files from: " << std::flush;
    std::string sel;
    std::getline(std::cin, sel);
    sel = errors::trim(sel);
    bool ok = false;
    unsigned num = parse_uint(sel, 1, 100000, ok);
    if (ok && num > 0 && num <= commits.size())
        return commits[num - 1];
    for (const auto& c : commits)
        if (c.abbrev_hash == sel)
            return c;
    throw std::runtime_error("Aborting");
}

int copy_out(const repo::Context& ctx, const history::CommitRecord& commit,
             const std::vector<std::string>& paths, const std::string& destination) {
    std::string suffix = iso_date_suffix(commit.date);
    size_t copied = 0;
    std::cout << ":: Checking out old file versions\n";
    size_t failed = history::checkout_file_copies(
        ctx, commit.abbrev_hash, paths, destination, suffix,
        [&](const history::FileCheckoutStatus& st) {
            if (st.error) {
                log_error(*st.error, st.name);
                std::cout << "Failed to retrieve copy of '" << st.name << "': " << *st.error
                          << "\n";
            } else if (st.type == "Tree") {
                std::cout << " Created subdirectory '" << st.destination << "'\n";
            } else {
                ++copied;
                std::cout << " Copied file '" << st.name << "' from revision "
                          << commit.abbrev_hash << " (" << commit.date << ") to '"
                          << st.destination << "'\n";
            }
        });
    std::cout << "\n" << copied << " files were checked out from an older version\n";
    if (failed == 0)
        return 0;
    std::cerr << failure_summary(failed) << "\n";
    return 1;
}

int cmd_version(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = open_repo(cfg);
    history::LogQuery q;
    q.paths = opts.args;
    history::CommitRecord commit;
    if (opts.revision.empty()) {
        q.count = opts.max_count;
        auto commits = history::commit_log(ctx, q);
        if (opts.style == OutputStyle::Json) {
            std::cout << json(commits).dump() << "\n";
            return 0;
        }
        if (commits.empty())
            throw std::runtime_error("No revisions matched request");
        commit = prompt_version(commits);
    } else {
        q.count = 1;
        q.revrange = opts.revision;
        auto commits = history::commit_log(ctx, q);
        if (commits.empty())
            throw std::runtime_error("No revisions matched request");
        commit = commits.front();
    }
    if (!opts.copy_to.empty())
        return copy_out(ctx, commit, opts.args, opts.copy_to);
    history::checkout_version(ctx, commit.abbrev_hash, opts.args);
    return cmd_commit(opts, cfg);
}

int cmd_checkout_copies(const Options& opts, const ClientConfig& cfg) {
    if (opts.args.size() < 2)
        throw std::runtime_error("checkout-copies requires a revision and a destination");
    repo::Context ctx = open_repo(cfg);
    history::LogQuery q;
    q.count = 1;
    q.revrange = opts.args[0];
    auto commits = history::commit_log(ctx, q);
    if (commits.empty())
        throw std::runtime_error("No revisions matched request");
    std::vector<std::string> paths(opts.args.begin() + 2, opts.args.end());
    return copy_out(ctx, commits.front(), paths, opts.args[1]);
}

int cmd_remotes(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = repo::open_context(fs::current_path(), cfg.tools);
    auto remotes = repo::remotes(ctx);
    if (opts.style == OutputStyle::Json) {
        json j = json::object();
        for (const auto& [name, url] : remotes)
            j[name] = url;
        std::cout << j.dump() << "\n";
        return 0;
    }
    if (remotes.empty()) {
        std::cout << ":: No remotes configured\n";
        return 0;
    }
    std::cout << ":: Remotes\n";
    for (const auto& [name, url] : remotes) {
        std::cout << "  " << name << ": " << url;
        if (ctx.default_remote == name)
            std::cout << " [default]";
        std::cout << "\n";
    }
    return 0;
}

int cmd_add_remote(const Options& opts, const ClientConfig& cfg) {
    if (opts.args.size() != 2)
        throw std::runtime_error("add-remote requires a name and a location");
    repo::Context ctx = open_repo(cfg);
    std::string url = resolve_remote_url(cfg, opts.args[1]);
    repo::add_remote(ctx, opts.args[0], url);
    std::cout << ":: Added new remote: " << opts.args[0] << " [" << url << "]\n";
    if (!ctx.default_remote) {
        repo::set_default_remote(ctx, opts.args[0]);
        std::cout << ":: Default remote: " << opts.args[0] << "\n";
    }
    return 0;
}

int cmd_remove_remote(const Options& opts, const ClientConfig& cfg) {
    if (opts.args.size() != 1)
        throw std::runtime_error("remove-remote requires a remote name");
    repo::Context ctx = repo::open_context(fs::current_path(), cfg.tools);
    repo::remove_remote(ctx, opts.args[0]);
    std::cout << ":: Removed remote " << opts.args[0] << "\n";
    return 0;
}

int cmd_use_remote(const Options& opts, const ClientConfig& cfg) {
    repo::Context ctx = repo::open_context(fs::current_path(), cfg.tools);
    if (opts.args.empty()) {
        std::cout << ":: Default remote: " << repo::require_default_remote(ctx) << "\n";
        return 0;
    }
    repo::set_default_remote(ctx, opts.args[0]);
    std::cout << ":: Default remote: " << opts.args[0] << "\n";
    return 0;
}

int cmd_tool_versions(const Options&, const ClientConfig& cfg) {
    std::cout << versions::describe(cfg.tools) << "\n";
    return 0;
}

} // namespace

int run_command(const Options& opts) {
    static const std::map<std::string, Handler> handlers = {
        {"init", cmd_init},
        {"clone", cmd_clone},
        {"add", cmd_add},
        {"commit", cmd_commit},
        {"upload", cmd_upload},
        {"download", cmd_download},
        {"sync", cmd_sync},
        {"get-content", cmd_get_content},
        {"remove-content", cmd_remove_content},
        {"lock", cmd_lock},
        {"unlock", cmd_unlock},
        {"ls", cmd_ls},
        {"log", cmd_log},
        {"version", cmd_version},
        {"checkout-copies", cmd_checkout_copies},
        {"remotes", cmd_remotes},
        {"add-remote", cmd_add_remote},
        {"remove-remote", cmd_remove_remote},
        {"use-remote", cmd_use_remote},
        {"tool-versions", cmd_tool_versions},
    };
    auto it = handlers.find(opts.command);
    if (it == handlers.end())
        throw std::runtime_error("Unknown command: " + opts.command);
    ClientConfig cfg = load_client_config(opts.config_file);
    log_info("Running command", LogFields{{"command", opts.command},
                                          {"args", std::to_string(opts.args.size())}});
    return it->second(opts, cfg);
}

} // namespace cli
