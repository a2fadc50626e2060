#include "test_common.hpp"
#include "system_utils.hpp"
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

TEST_CASE("UniqueFd releases descriptor") {
    int raw = -1;
    {
        procutil::UniqueFd fd(::open("/dev/null", O_RDONLY));
        REQUIRE(fd);
        raw = fd.get();
    }
    errno = 0;
    REQUIRE(::close(raw) == -1);
    REQUIRE(errno == EBADF);
}

TEST_CASE("UniqueFd move transfers ownership") {
    procutil::UniqueFd a(::open("/dev/null", O_RDONLY));
    int raw = a.get();
    procutil::UniqueFd b(std::move(a));
    REQUIRE_FALSE(a);
    REQUIRE(b.get() == raw);
    int released = b.release();
    REQUIRE_FALSE(b);
    REQUIRE(::close(released) == 0);
}

TEST_CASE("make_pipe sets close-on-exec") {
    procutil::Pipe p = procutil::make_pipe();
    REQUIRE(p.read_end);
    REQUIRE(p.write_end);
    REQUIRE((::fcntl(p.read_end.get(), F_GETFD) & FD_CLOEXEC) != 0);
    REQUIRE((::fcntl(p.write_end.get(), F_GETFD) & FD_CLOEXEC) != 0);
}

TEST_CASE("environment_block replaces overridden variables") {
    setenv("ANNEXSYNC_ENV_TEST", "old", 1);
    auto block = procutil::environment_block({{"ANNEXSYNC_ENV_TEST", "new"}});
    size_t hits = 0;
    for (const auto& e : block) {
        if (e.rfind("ANNEXSYNC_ENV_TEST=", 0) == 0) {
            ++hits;
            REQUIRE(e == "ANNEXSYNC_ENV_TEST=new");
        }
    }
    REQUIRE(hits == 1);
    unsetenv("ANNEXSYNC_ENV_TEST");
}

TEST_CASE("safe_getenv distinguishes unset variables") {
    unsetenv("ANNEXSYNC_UNSET_VAR");
    REQUIRE_FALSE(procutil::safe_getenv("ANNEXSYNC_UNSET_VAR").has_value());
    setenv("ANNEXSYNC_UNSET_VAR", "", 1);
    REQUIRE(procutil::safe_getenv("ANNEXSYNC_UNSET_VAR") == std::string());
    unsetenv("ANNEXSYNC_UNSET_VAR");
}

TEST_CASE("host_name is never empty") { REQUIRE_FALSE(procutil::host_name().empty()); }

TEST_CASE("iso_date_suffix and annex timestamps") {
    REQUIRE(iso_date_suffix("2019-07-07T12:34:56+02:00") == "2019-07-07-123456");
    REQUIRE(iso_date_suffix("2019-07") == "2019-07");
    REQUIRE(annex_time_display("2019-07-07@12-34-56") == "2019-07-07 12:34:56");
    REQUIRE(annex_time_display("garbage").empty());
}
