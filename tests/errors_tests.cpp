#include "test_common.hpp"

using errors::Category;

TEST_CASE("classify upload failures in rule order") {
    auto f = errors::classify("To gin:x\n ! [rejected] master -> master (fetch first)\n",
                              errors::upload_rules(), "upload failed");
    REQUIRE(f.category == Category::PushRejected);
    REQUIRE(f.message.find("have not been downloaded") != std::string::npos);

    f = errors::classify("git@gin: Permission denied (publickey).\nrejected",
                         errors::upload_rules(), "upload failed");
    REQUIRE(f.category == Category::Authorization);

    f = errors::classify("ssh: Could not resolve hostname gin: Name or service not known",
                         errors::upload_rules(), "upload failed");
    REQUIRE(f.category == Category::Connection);
}

TEST_CASE("classify falls back to the tool output") {
    auto f = errors::classify("  something odd happened\n", errors::download_rules(),
                              "download failed");
    REQUIRE(f.category == Category::Command);
    REQUIRE(f.message == "download failed: something odd happened");
    REQUIRE(f.detail == "  something odd happened\n");
    REQUIRE(errors::classify("", errors::download_rules(), "download failed").message ==
            "download failed");
}

TEST_CASE("classify download failures") {
    REQUIRE(errors::classify("error: Your local changes to the following files would be "
                             "overwritten by merge:",
                             errors::download_rules(), "download failed")
                .category == Category::WouldOverwrite);
    REQUIRE(errors::classify("CONFLICT (content): Merge conflict in a.txt",
                             errors::download_rules(), "download failed")
                .category == Category::MergeConflict);
    REQUIRE(errors::classify("Host key verification failed.", errors::download_rules(),
                             "download failed")
                .category == Category::HostKey);
}

TEST_CASE("files_between_markers collects enclosed lines") {
    const std::string out = "Updating 1..2\n"
                            "error: Your local changes to the following files would be "
                            "overwritten by merge:\n"
                            "\tnotes.txt\n"
                            "\tdata/table.csv\n"
                            "Please commit your changes or stash them before you merge.\n"
                            "error: The following untracked working tree files would be "
                            "overwritten by merge:\n"
                            "\tnew.txt\n"
                            "Please move or remove them before you merge.\n"
                            "Aborting\n";
    auto files = errors::files_between_markers(
        out, {"would be overwritten by merge"},
        {"Please commit your changes", "Please move or remove", "Aborting"});
    REQUIRE(files == std::vector<std::string>{"notes.txt", "data/table.csv", "new.txt"});
}

TEST_CASE("files_with_marker and lines_containing") {
    const std::string out = "Auto-merging a.txt\nCONFLICT (content): Merge conflict in a.txt\n"
                            "CONFLICT (content): Merge conflict in b/c.txt\n";
    REQUIRE(errors::files_with_marker(out, "Merge conflict in ") ==
            std::vector<std::string>{"a.txt", "b/c.txt"});
    REQUIRE(errors::lines_containing(out, "Auto-merging") ==
            std::vector<std::string>{"Auto-merging a.txt"});
}

TEST_CASE("Failure describe and OperationError") {
    errors::Failure f{Category::WouldOverwrite, "download failed", {"a", "b"}, "raw"};
    REQUIRE(f.describe() == "download failed\n  a\n  b");
    errors::OperationError e(f);
    REQUIRE(std::string(e.what()) == f.describe());
    REQUIRE(e.failure().category == Category::WouldOverwrite);
    REQUIRE(std::string(errors::category_name(Category::HostKey)) == "host-key");
}

TEST_CASE("trim strips whitespace") {
    REQUIRE(errors::trim("  a b\r\n") == "a b");
    REQUIRE(errors::trim(" \t ").empty());
}
