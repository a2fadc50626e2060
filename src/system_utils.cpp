#include "system_utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <system_error>

extern char** environ;

namespace procutil {

std::optional<std::string> safe_getenv(const char* name) {
    const char* v = std::getenv(name);
    if (v)
        return std::string(v);
    return std::nullopt;
}

std::string host_name() {
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0')
        return "(unknown)";
    return buf;
}

std::vector<std::string> environment_block(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> block;
    for (char** e = environ; e && *e; ++e) {
        std::string entry = *e;
        size_t eq = entry.find('=');
        if (eq != std::string::npos && overrides.count(entry.substr(0, eq)))
            continue;
        block.push_back(std::move(entry));
    }
    for (const auto& [k, v] : overrides)
        block.push_back(k + "=" + v);
    return block;
}

Pipe make_pipe() {
    int fds[2] = {-1, -1};
#ifdef __linux__
    if (::pipe2(fds, O_CLOEXEC) != 0)
        throw std::system_error(errno, std::system_category(), "pipe2");
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
#else
    if (::pipe(fds) != 0)
        throw std::system_error(errno, std::system_category(), "pipe");
    Pipe p{UniqueFd(fds[0]), UniqueFd(fds[1])};
    if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) != 0 || ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) != 0)
        throw std::system_error(errno, std::system_category(), "fcntl");
    return p;
#endif
}

} // namespace procutil
