#ifndef PROCESS_HPP
#define PROCESS_HPP
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <sys/types.h>

#include "channel.hpp"

namespace procutil {

/**
 * @brief Everything needed to launch one external command.
 */
struct CommandSpec {
    std::string program;                    ///< Executable name or path, looked up in PATH
    std::vector<std::string> args;          ///< Arguments, without the program name
    std::filesystem::path cwd;              ///< Working directory; empty keeps the current one
    std::map<std::string, std::string> env; ///< Added to (or replacing) the inherited environment
    std::string out_delims = "\n";          ///< Record separators for stdout
    std::string err_delims = "\n";          ///< Record separators for stderr

    /** @brief Program and arguments joined for logs and diagnostics. */
    std::string display() const;
};

/** Separator set for `-z` style output. */
inline const std::string kNulDelim(1, '\0');
/** Separator set for terminal progress output that redraws with carriage returns. */
inline const std::string kProgressDelims = "\r\n";

/**
 * @brief Result of running a command to completion with buffered output.
 */
struct CaptureResult {
    int exit_code = -1;
    std::string out;
    std::string err;

    bool ok() const noexcept { return exit_code == 0; }
};

bool needs_quoting(std::string_view s);
std::string quote_argument(std::string_view s);

/**
 * @brief A running child process with both output channels drained concurrently.
 *
 * The constructor forks and executes the command. Each output pipe is read by
 * its own thread which splits the bytes into records and queues them, so the
 * child never blocks on a full pipe regardless of the order in which the
 * caller consumes the two channels. stdin is connected to /dev/null.
 *
 * A non-zero exit status is only reported through wait(). A command that
 * cannot be started at all raises `std::system_error` from the constructor.
 */
class Process {
  public:
    explicit Process(CommandSpec spec);
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /** @brief Next stdout record, blocking; `std::nullopt` at end of stream. */
    std::optional<std::string> next_out() { return out_->pop(); }

    /** @brief Next stderr record, blocking; `std::nullopt` at end of stream. */
    std::optional<std::string> next_err() { return err_->pop(); }

    /** @brief Remaining stdout records joined with @p sep. */
    std::string rest_out(const std::string& sep = "\n");

    /** @brief Remaining stderr records joined with @p sep. */
    std::string rest_err(const std::string& sep = "\n");

    /**
     * @brief Wait for the child to exit.
     *
     * @return Exit code, or 128 plus the signal number if it was killed.
     */
    int wait();

    const CommandSpec& spec() const noexcept { return spec_; }
    pid_t pid() const noexcept { return pid_; }

  private:
    CommandSpec spec_;
    pid_t pid_ = -1;
    std::optional<int> exit_code_;
    std::shared_ptr<Channel<std::string>> out_;
    std::shared_ptr<Channel<std::string>> err_;
    std::jthread out_reader_;
    std::jthread err_reader_;
};

/**
 * @brief Run a command and capture its complete stdout and stderr.
 *
 * @throws std::system_error if the command cannot be started.
 */
CaptureResult run_capture(const CommandSpec& spec);

} // namespace procutil

#endif // PROCESS_HPP
