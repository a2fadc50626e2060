#include "git_utils.hpp"

using namespace std;

namespace git {

GitInitGuard::GitInitGuard() { git_libgit2_init(); }
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

static bool open_repo(git_repository** out, const fs::path& repo, string* error) {
    if (git_repository_open(out, repo.string().c_str()) != 0) {
        set_error(error);
        return false;
    }
    return true;
}

optional<RepoLocation> discover_repo(const fs::path& start, string* error) {
    git_buf buf = GIT_BUF_INIT;
    if (git_repository_discover(&buf, start.string().c_str(), 0, nullptr) != 0) {
        set_error(error);
        return nullopt;
    }
    string found(buf.ptr, buf.size);
    git_buf_dispose(&buf);

    git_repository* raw = nullptr;
    if (!open_repo(&raw, found, error))
        return nullopt;
    repo_ptr r(raw);
    RepoLocation loc;
    loc.git_dir = fs::path(git_repository_path(r.get())).lexically_normal();
    loc.bare = git_repository_is_bare(r.get()) != 0;
    if (const char* wd = git_repository_workdir(r.get())) {
        loc.root = fs::path(wd).lexically_normal();
    } else {
        fs::path gd = loc.git_dir;
        if (!gd.has_filename())
            gd = gd.parent_path();
        loc.root = gd.filename() == ".git" ? gd.parent_path() : gd;
    }
    if (!loc.root.has_filename() && loc.root.has_parent_path() && loc.root != loc.root.root_path())
        loc.root = loc.root.parent_path();
    return loc;
}

optional<string> config_value(const fs::path& repo, const string& key, string* error) {
    git_repository* raw = nullptr;
    if (!open_repo(&raw, repo, error))
        return nullopt;
    repo_ptr r(raw);
    git_config* raw_cfg = nullptr;
    if (git_repository_config_snapshot(&raw_cfg, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    config_ptr cfg(raw_cfg);
    const char* value = nullptr;
    if (git_config_get_string(&value, cfg.get(), key.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    return string(value ? value : "");
}

bool config_bool(const fs::path& repo, const string& key) {
    git_repository* raw = nullptr;
    if (!open_repo(&raw, repo, nullptr))
        return false;
    repo_ptr r(raw);
    git_config* raw_cfg = nullptr;
    if (git_repository_config_snapshot(&raw_cfg, r.get()) != 0)
        return false;
    config_ptr cfg(raw_cfg);
    int value = 0;
    if (git_config_get_bool(&value, cfg.get(), key.c_str()) != 0)
        return false;
    return value != 0;
}

optional<string> get_local_hash(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (!open_repo(&raw, repo, error))
        return nullopt;
    repo_ptr r(raw);
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

} // namespace git
