#include <zlib.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include "test_common.hpp"

using annexsync::test_support::read_lines;

struct LoggerGuard {
    ~LoggerGuard() { shutdown_logger(); }
};

TEST_CASE("Logger rotates and limits files") {
    fs::path log = fs::temp_directory_path() / "annexsync_logger_rotate.log";
    fs::path log1 = log;
    log1 += ".1";
    fs::path log2 = log;
    log2 += ".2";
    fs::path log3 = log;
    log3 += ".3";
    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);
    fs::remove(log3);

    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    flush_logger();
    shutdown_logger();
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));
    REQUIRE_FALSE(fs::exists(log3));

    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);
}

TEST_CASE("Logger compresses rotated files") {
    fs::path log = fs::temp_directory_path() / "annexsync_logger_compress.log";
    fs::path log1 = log;
    log1 += ".1.gz";
    fs::path log2 = log;
    log2 += ".2.gz";
    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);

    set_log_compression(true);
    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();

    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));

    gzFile zf = gzopen(log1.c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[32];
    int n = gzread(zf, buf, sizeof(buf));
    gzclose(zf);
    REQUIRE(n > 0);

    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);
    set_log_compression(false);
}

TEST_CASE("Logger switches between JSON and plain") {
    fs::path log = fs::temp_directory_path() / "annexsync_logger_format.log";
    fs::remove(log);
    init_logger(log.string());
    LoggerGuard guard;
    set_json_logging(true);
    log_info("json entry", LogFields{{"k", "v"}});
    flush_logger();
    set_json_logging(false);
    log_info("plain entry", LogFields{{"cmd", "git push"}});
    flush_logger();
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0][0] == '{');
    REQUIRE(lines[0].find("\"k\":\"v\"") != std::string::npos);
    REQUIRE(lines[1][0] == '[');
    REQUIRE(lines[1].find("[INFO] plain entry cmd=git push") != std::string::npos);

    fs::remove(log);
}

TEST_CASE("Logger drops entries below the minimum level") {
    fs::path log = fs::temp_directory_path() / "annexsync_logger_level.log";
    fs::remove(log);
    init_logger(log.string(), LogLevel::WARNING);
    log_debug("hidden");
    log_info("hidden too");
    log_warning("shown", "extra");
    log_error("also shown");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("[WARNING] shown data=extra") != std::string::npos);
    REQUIRE(lines[1].find("[ERROR] also shown") != std::string::npos);
    fs::remove(log);
}

TEST_CASE("log_command_output records the tool output") {
    fs::path log = fs::temp_directory_path() / "annexsync_logger_cmd.log";
    fs::remove(log);
    init_logger(log.string(), LogLevel::DEBUG);
    set_json_logging(true);
    log_command_output("git-annex sync", "", "fatal: nope");
    shutdown_logger();
    set_json_logging(false);
    std::string text = annexsync::test_support::read_file(log);
    REQUIRE(text.find("\"cmd\":\"git-annex sync\"") != std::string::npos);
    REQUIRE(text.find("fatal: nope") != std::string::npos);
    REQUIRE(text.find("\"stdout\"") == std::string::npos);
    fs::remove(log);
}

TEST_CASE("parse_log_level names") {
    LogLevel level = LogLevel::INFO;
    REQUIRE(parse_log_level("DEBUG", level));
    REQUIRE(level == LogLevel::DEBUG);
    REQUIRE(parse_log_level("warn", level));
    REQUIRE(level == LogLevel::WARNING);
    REQUIRE(parse_log_level("err", level));
    REQUIRE(level == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("chatty", level));
}

TEST_CASE("default_log_path honours ANNEXSYNC_LOG_DIR") {
    fs::path dir = fs::temp_directory_path() / "annexsync_logdir";
    fs::remove_all(dir);
    setenv("ANNEXSYNC_LOG_DIR", dir.string().c_str(), 1);
    REQUIRE(default_log_path() == (dir / "annexsync.log").string());
    REQUIRE(fs::is_directory(dir));
    unsetenv("ANNEXSYNC_LOG_DIR");
    fs::remove_all(dir);
}

TEST_CASE("shutdown_logger drains queued messages") {
    fs::path log = fs::temp_directory_path() / "annexsync_logger_drain.log";
    fs::remove(log);
    init_logger(log.string());
    for (int i = 0; i < 50; ++i)
        log_info("queued " + std::to_string(i));
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 50);
    fs::remove(log);
}

TEST_CASE("shutdown_logger exits cleanly with no messages") {
    fs::path log = fs::temp_directory_path() / "annexsync_logger_noop.log";
    fs::remove(log);
    init_logger(log.string());
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
    REQUIRE(fs::exists(log));
    REQUIRE(fs::file_size(log) == 0);
    fs::remove(log);
}

TEST_CASE("init_logger restores the previous file on failed reopen") {
    fs::path log = fs::temp_directory_path() / "annexsync_logger_fail_reinit.log";
    fs::remove(log);
    init_logger(log.string());
    log_info("before");
    fs::path bad = log.parent_path() / "annexsync_missing" / "logger.log";
    init_logger(bad.string());
    log_info("after");
    shutdown_logger();
    REQUIRE(read_lines(log).size() >= 2);
    fs::remove(log);
}

TEST_CASE("init_logger and shutdown_logger can run concurrently") {
    fs::path log1 = fs::temp_directory_path() / "annexsync_logger_race1.log";
    fs::path log2 = fs::temp_directory_path() / "annexsync_logger_race2.log";
    fs::remove(log1);
    fs::remove(log2);
    init_logger(log1.string());
    std::promise<void> go;
    auto ready = go.get_future().share();
    std::thread t1([&] {
        ready.wait();
        init_logger(log2.string());
    });
    std::thread t2([&] {
        ready.wait();
        shutdown_logger();
    });
    go.set_value();
    t1.join();
    t2.join();
    if (logger_initialized())
        shutdown_logger();
    fs::remove(log1);
    fs::remove(log2);
    REQUIRE(true);
}
