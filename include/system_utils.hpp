#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <map>
#include <optional>
#include <string>
#include <vector>
#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace procutil {

/**
 * @brief Read an environment variable.
 *
 * @return The value, or `std::nullopt` when the variable is not set.
 */
std::optional<std::string> safe_getenv(const char* name);

/**
 * @brief Name of the local machine, or "(unknown)" if it cannot be read.
 */
std::string host_name();

/**
 * @brief Build a `NAME=value` environment block.
 *
 * Starts from the environment of the current process and replaces or adds
 * every entry in @p overrides.
 */
std::vector<std::string> environment_block(const std::map<std::string, std::string>& overrides);

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of pipe ends handed out by the process adapter.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0) {
#ifdef _WIN32
            _close(fd);
#else
            close(fd);
#endif
        }
        fd = f;
    }

  private:
    int fd;
};

/**
 * @brief Pair of pipe ends created with close-on-exec set on both.
 */
struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

/**
 * @brief Create a pipe.
 *
 * @throws std::system_error if the pipe cannot be created.
 */
Pipe make_pipe();

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
