#include "test_common.hpp"
#include "transfer.hpp"

using annexsync::test_support::CwdGuard;
using annexsync::test_support::FakeTool;
using annexsync::test_support::fake_context;
using annexsync::test_support::make_temp_dir;
using annexsync::test_support::write_file;
using errors::Category;

namespace {

const char* kRemotes =
    R"(remote) printf 'origin\tssh://git@gin:22/a/b (fetch)\norigin\tssh://git@gin:22/a/b (push)\n' ;;)";

std::string git_script(const std::string& push_body) {
    return std::string("case \"$1\" in\n") + kRemotes + "\npush) " + push_body +
           " ;;\n*) ;;\nesac";
}

const char* kAnnexUpload = R"(case "$1" in
sync) echo 'ok' ;;
whereis) echo '{"key":"K1","file":"a.bin","success":true,"whereis":[{"uuid":"u1","here":true}]}' ;;
copy)
    echo '{"byte-progress":5,"action":{"command":"copy","key":"K1","file":"a.bin"},"percent-progress":"50%"}'
    echo '{"command":"copy","success":true,"key":"K1","file":"a.bin"}'
    ;;
*) exit 1 ;;
esac)";

std::vector<const StatusEvent*> failures(const std::vector<StatusEvent>& events) {
    std::vector<const StatusEvent*> out;
    for (const auto& ev : events)
        if (ev.error && !ev.notice)
            out.push_back(&ev);
    return out;
}

} // namespace

TEST_CASE("upload pushes history, annex branch and content") {
    fs::path dir = make_temp_dir("upload_ok");
    FakeTool git(dir, "git",
                 git_script("printf 'Compressing objects:  50%% (1/2)\\rWriting objects: "
                            "100%% (3/3), done.\\n' >&2"));
    FakeTool annex(dir, "git-annex", kAnnexUpload);
    repo::Context ctx = fake_context(dir, git, annex);

    auto events = transfer::upload(ctx, {}, {}).collect();
    REQUIRE(failures(events).empty());
    bool pushed = false;
    bool uploaded = false;
    for (const auto& ev : events) {
        if (ev.state == "Uploading git files (to: origin)" && ev.progress == "100%")
            pushed = true;
        if (ev.state == "Uploading (to: origin)" && ev.file_name == "a.bin" &&
            ev.progress == progress::kComplete)
            uploaded = true;
    }
    REQUIRE(pushed);
    REQUIRE(uploaded);
    REQUIRE(git.count("push --progress origin") == 1);
    REQUIRE(annex.count("sync --no-pull --no-commit") == 1);
    REQUIRE(annex.count("copy --json-progress --to=origin --all") == 1);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("upload stops at a rejected push") {
    fs::path dir = make_temp_dir("upload_rejected");
    FakeTool git(dir, "git",
                 git_script("echo ' ! [rejected]        master -> master (fetch first)' >&2; "
                            "exit 1"));
    FakeTool annex(dir, "git-annex", kAnnexUpload);
    repo::Context ctx = fake_context(dir, git, annex);

    auto events = transfer::upload(ctx, {}, {}).collect();
    auto failed = failures(events);
    REQUIRE(failed.size() == 1);
    REQUIRE(failed[0]->error->category == Category::PushRejected);
    REQUIRE(annex.count("sync") == 0);
    REQUIRE(annex.count("copy") == 0);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("upload skips unknown remotes") {
    fs::path dir = make_temp_dir("upload_unknown");
    FakeTool git(dir, "git", git_script("true"));
    FakeTool annex(dir, "git-annex", kAnnexUpload);
    repo::Context ctx = fake_context(dir, git, annex);

    auto events = transfer::upload(ctx, {}, {"backup"}).collect();
    auto failed = failures(events);
    REQUIRE(failed.size() == 1);
    REQUIRE(failed[0]->error->message == "unknown remote name 'backup': skipping");
    REQUIRE(git.count("push") == 0);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("upload without a default remote fails") {
    fs::path dir = make_temp_dir("upload_noremote");
    FakeTool git(dir, "git", git_script("true"));
    FakeTool annex(dir, "git-annex", kAnnexUpload);
    repo::Context ctx = fake_context(dir, git, annex);
    ctx.default_remote.reset();

    auto events = transfer::upload(ctx, {}, {}).collect();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].error);
    REQUIRE(events[0].error->message.find("no default remote") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("upload with no annexed content emits a notice") {
    fs::path dir = make_temp_dir("upload_nothing");
    FakeTool git(dir, "git", git_script("true"));
    FakeTool annex(dir, "git-annex", "case \"$1\" in\nwhereis) ;;\n*) ;;\nesac");
    repo::Context ctx = fake_context(dir, git, annex);

    auto events = transfer::upload(ctx, {}, {}).collect();
    REQUIRE(failures(events).empty());
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].notice);
    REQUIRE(annex.count("copy") == 0);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("download reports files that would be overwritten") {
    fs::path dir = make_temp_dir("download_overwrite");
    FakeTool git(dir, "git", "exit 0");
    FakeTool annex(dir, "git-annex",
                   "echo 'error: Your local changes to the following files would be "
                   "overwritten by merge:' >&2\n"
                   "printf '\\tnotes.txt\\n\\tdata/t.csv\\n' >&2\n"
                   "echo 'Please commit your changes or stash them before you merge.' >&2\n"
                   "echo 'Aborting' >&2\nexit 1");
    repo::Context ctx = fake_context(dir, git, annex);

    auto events = transfer::download(ctx, true).collect();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].error->category == Category::WouldOverwrite);
    REQUIRE(events[0].error->files == std::vector<std::string>{"notes.txt", "data/t.csv"});
    REQUIRE(annex.count("get") == 0);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("download aborts a conflicted merge") {
    fs::path dir = make_temp_dir("download_conflict");
    FakeTool git(dir, "git", "exit 0");
    FakeTool annex(dir, "git-annex",
                   "echo 'CONFLICT (content): Merge conflict in a.txt'\n"
                   "echo 'Automatic merge failed; fix conflicts and then commit the result.'\n"
                   "exit 1");
    repo::Context ctx = fake_context(dir, git, annex);

    auto events = transfer::download(ctx, false).collect();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].error->category == Category::MergeConflict);
    REQUIRE(events[0].error->files == std::vector<std::string>{"a.txt"});
    REQUIRE(git.count("merge --abort") == 1);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("download with content fetches files after merging") {
    fs::path dir = make_temp_dir("download_content");
    FakeTool git(dir, "git", "exit 0");
    FakeTool annex(dir, "git-annex", R"(case "$1" in
sync) echo 'merge origin/master ok' ;;
get) echo '{"command":"get","success":true,"key":"K","file":"a.bin"}' ;;
esac)");
    repo::Context ctx = fake_context(dir, git, annex);

    auto events = transfer::download(ctx, true).collect();
    REQUIRE(failures(events).empty());
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].state == transfer::kStateDownload);
    REQUIRE(events[0].progress == progress::kComplete);
    REQUIRE(events[1].file_name == "a.bin");
    REQUIRE(annex.count("sync --no-push --no-commit") == 1);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("sync reports automatically resolved conflicts") {
    fs::path dir = make_temp_dir("sync_variant");
    FakeTool git(dir, "git", "exit 0");
    FakeTool annex(dir, "git-annex",
                   "echo 'merge synced/master (Merging...) resolving conflict'\n"
                   "echo \"adding 'a.variant-cc12.txt'\"\necho ok");
    repo::Context ctx = fake_context(dir, git, annex);

    auto events = transfer::sync(ctx, true).collect();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].notice);
    REQUIRE(events[0].error->category == Category::AutoResolvedConflict);
    REQUIRE(events[0].error->files == std::vector<std::string>{"a.variant-cc12.txt"});
    REQUIRE(events[1].progress == progress::kComplete);
    REQUIRE(annex.count("sync --resolvemerge --content") == 1);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("add sends only content files to git-annex") {
    fs::path dir = make_temp_dir("add_partition");
    write_file(dir / "big.bin", std::string(200, 'x'));
    write_file(dir / "small.txt", "tiny");
    FakeTool git(dir, "git", R"(case "$1" in
add) echo "add 'big.bin'"; echo "add 'small.txt'" ;;
esac)");
    FakeTool annex(dir, "git-annex", R"(case "$1" in
add) echo '{"command":"add","success":true,"key":"K","file":"big.bin"}' ;;
metadata) ;;
esac)");
    repo::Context ctx = fake_context(dir, git, annex);
    ctx.tools.annex_min_size = 100;
    CwdGuard cwd(dir);

    auto events = transfer::add(ctx, {"big.bin", "small.txt"}).collect();
    REQUIRE(failures(events).empty());
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].state == transfer::kStateAnnexAdd);
    REQUIRE(events[1].state == transfer::kStateGitAdd);
    REQUIRE(annex.count("add --json big.bin --not --smallerthan=100 --exclude=config.yml") == 1);
    REQUIRE(annex.count("metadata --set=annexsync-filename=big.bin big.bin") == 1);
    REQUIRE(git.count("add --verbose -- big.bin small.txt") == 1);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("add from a subdirectory keeps the repository config in git") {
    fs::path dir = make_temp_dir("add_subdir");
    fs::path sub = dir / "sub";
    write_file(dir / "config.yml", std::string(200, '#'));
    write_file(sub / "config.yml", std::string(200, 'x'));
    write_file(sub / "big.bin", std::string(200, 'x'));
    FakeTool git(dir, "git", "exit 0");
    FakeTool annex(dir, "git-annex", R"(case "$1" in
add) echo '{"command":"add","success":true,"key":"K","file":"config.yml"}' ;;
esac)");
    repo::Context ctx = fake_context(dir, git, annex);
    ctx.workdir = sub;
    ctx.tools.annex_min_size = 100;
    CwdGuard cwd(sub);

    auto events = transfer::add(ctx, {"../config.yml", "config.yml", "big.bin"}).collect();
    REQUIRE(failures(events).empty());
    REQUIRE(annex.count("add --json config.yml big.bin --not --smallerthan=100 "
                        "--exclude=../config.yml") == 1);
    REQUIRE(git.count("add --verbose -- ../config.yml config.yml big.bin") == 1);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("remove_content explains unsafe drops") {
    fs::path dir = make_temp_dir("drop_unsafe");
    write_file(dir / "a.bin", "a");
    FakeTool git(dir, "git", "exit 0");
    FakeTool annex(dir, "git-annex",
                   "echo '{\"command\":\"drop\",\"note\":\"unsafe; could only verify 0 out "
                   "of 1 necessary copies\",\"success\":false,\"file\":\"a.bin\"}'\nexit 1");
    repo::Context ctx = fake_context(dir, git, annex);
    CwdGuard cwd(dir);

    auto events = transfer::remove_content(ctx, {"a.bin"}).collect();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].error->message == "failed (unsafe): could not verify remote copy");
    REQUIRE(events[0].state == transfer::kStateDrop);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("lock and unlock require matching paths") {
    fs::path dir = make_temp_dir("lock_nomatch");
    FakeTool git(dir, "git", "exit 0");
    FakeTool annex(dir, "git-annex", "exit 0");
    repo::Context ctx = fake_context(dir, git, annex);
    CwdGuard cwd(dir);

    auto events = transfer::unlock(ctx, {"missing.bin"}).collect();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].error->message == "No files matched missing.bin");
    REQUIRE(annex.count("unlock") == 0);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("unlock failure points at get-content") {
    fs::path dir = make_temp_dir("unlock_missing");
    write_file(dir / "a.bin", "a");
    FakeTool git(dir, "git", "exit 0");
    FakeTool annex(dir, "git-annex",
                   "echo '{\"command\":\"unlock\",\"success\":false,\"file\":\"a.bin\"}'\n"
                   "exit 1");
    repo::Context ctx = fake_context(dir, git, annex);
    CwdGuard cwd(dir);

    auto events = transfer::unlock(ctx, {"a.bin"}).collect();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].error->message.find("annexsync get-content") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("clone reports a missing repository") {
    fs::path dir = make_temp_dir("clone_missing");
    FakeTool git(dir, "git",
                 "echo \"fatal: repository 'ssh://gin/a/b' does not exist\" >&2; exit 128");
    cmd::ToolConfig tools;
    tools.git_bin = git.script.string();

    auto events = transfer::clone(tools, dir, "ssh://gin/a/b.git", "", "me@host").collect();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].file_name == "b");
    REQUIRE(events[0].state == transfer::kStateClone);
    REQUIRE(events[1].error);
    REQUIRE(events[1].error->message.find("Make sure you typed the repository path") !=
            std::string::npos);
    REQUIRE(git.count("clone --progress ssh://gin/a/b.git b") == 1);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("clone_dir_name and variant_files") {
    REQUIRE(transfer::clone_dir_name("ssh://git@gin:22/alice/data.git") == "data");
    REQUIRE(transfer::clone_dir_name("gin:alice/data/") == "data");
    REQUIRE(transfer::clone_dir_name("data") == "data");
    REQUIRE(transfer::variant_files("ok\nadding 'x.variant-1.txt' and \"y.variant-2\"\n"
                                    "x.variant-1.txt again") ==
            std::vector<std::string>{"x.variant-1.txt", "y.variant-2"});
    REQUIRE(transfer::variant_files("nothing here").empty());
}
