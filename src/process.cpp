#include "process.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

#include "logger.hpp"
#include "system_utils.hpp"

extern char** environ;

namespace procutil {

namespace {

void check_rc(bool ok, const std::string& what) {
    if (!ok)
        throw std::system_error(std::error_code(errno, std::system_category()), what);
}

/**
 * Reader thread body. Splits the byte stream on any character in @p delims
 * and queues each record; an empty delimiter set queues raw chunks. The
 * channel is closed once the write end is gone.
 */
void pump(int fd, std::string delims, std::shared_ptr<Channel<std::string>> chan) {
    UniqueFd owned(fd);
    std::string pending;
    char buf[8192];
    while (true) {
        ssize_t n = ::read(owned.get(), buf, sizeof(buf));
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        if (delims.empty()) {
            chan->push(std::string(buf, static_cast<size_t>(n)));
            continue;
        }
        pending.append(buf, static_cast<size_t>(n));
        size_t start = 0;
        for (size_t i = 0; i < pending.size(); ++i) {
            if (delims.find(pending[i]) != std::string::npos) {
                chan->push(pending.substr(start, i - start));
                start = i + 1;
            }
        }
        pending.erase(0, start);
    }
    if (!pending.empty())
        chan->push(std::move(pending));
    chan->close();
}

std::string join_rest(Channel<std::string>& chan, const std::string& sep) {
    std::string out;
    bool first = true;
    while (auto rec = chan.pop()) {
        if (!first)
            out += sep;
        out += *rec;
        first = false;
    }
    return out;
}

} // namespace

bool needs_quoting(std::string_view s) {
    std::string_view okay_chars = "@%-+=:,./|_";
    if (s.empty())
        return true;
    return !std::all_of(s.begin(), s.end(), [&](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) ||
               okay_chars.find(c) != std::string_view::npos;
    });
}

std::string quote_argument(std::string_view s) {
    if (!needs_quoting(s))
        return std::string(s);
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

std::string CommandSpec::display() const {
    std::string acc = quote_argument(program);
    for (const auto& a : args)
        acc += " " + quote_argument(a);
    return acc;
}

Process::Process(CommandSpec spec)
    : spec_(std::move(spec)), out_(std::make_shared<Channel<std::string>>()),
      err_(std::make_shared<Channel<std::string>>()) {
    // Everything the child touches is allocated before fork().
    std::vector<std::string> env_block = environment_block(spec_.env);
    std::vector<char*> envp;
    envp.reserve(env_block.size() + 1);
    for (auto& e : env_block)
        envp.push_back(e.data());
    envp.push_back(nullptr);

    std::vector<std::string> argv_store;
    argv_store.reserve(spec_.args.size() + 1);
    argv_store.push_back(spec_.program);
    argv_store.insert(argv_store.end(), spec_.args.begin(), spec_.args.end());
    std::vector<char*> argv;
    argv.reserve(argv_store.size() + 1);
    for (auto& a : argv_store)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    std::string workdir = spec_.cwd.string();

    Pipe out = make_pipe();
    Pipe err = make_pipe();
    Pipe exec_status = make_pipe();

    std::string shown_dir = workdir.empty() ? std::filesystem::current_path().string() : workdir;
    log_debug("Running command", LogFields{{"dir", shown_dir}, {"cmd", spec_.display()}});

    pid_ = ::fork();
    check_rc(pid_ >= 0, "fork() failed for " + spec_.program);
    if (pid_ == 0) {
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            if (devnull == STDIN_FILENO) {
                ::fcntl(devnull, F_SETFD, 0);
            } else {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
        }
        ::dup2(out.write_end.get(), STDOUT_FILENO);
        ::dup2(err.write_end.get(), STDERR_FILENO);
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            int e = errno;
            (void)!::write(exec_status.write_end.get(), &e, sizeof(e));
            std::_Exit(127);
        }
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        int e = errno;
        (void)!::write(exec_status.write_end.get(), &e, sizeof(e));
        std::_Exit(127);
    }

    out.write_end.reset();
    err.write_end.reset();
    exec_status.write_end.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.read_end.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int st = 0;
        while (::waitpid(pid_, &st, 0) < 0 && errno == EINTR) {
        }
        exit_code_ = 127;
        log_error("Failed to start command", LogFields{{"cmd", spec_.display()}});
        throw std::system_error(std::error_code(child_errno, std::system_category()),
                                "failed to run '" + spec_.program + "'");
    }

    out_reader_ = std::jthread(pump, out.read_end.release(), spec_.out_delims, out_);
    err_reader_ = std::jthread(pump, err.read_end.release(), spec_.err_delims, err_);
}

Process::~Process() {
    if (!exit_code_ && pid_ > 0) {
        int st = 0;
        while (::waitpid(pid_, &st, 0) < 0 && errno == EINTR) {
        }
    }
}

std::string Process::rest_out(const std::string& sep) { return join_rest(*out_, sep); }

std::string Process::rest_err(const std::string& sep) { return join_rest(*err_, sep); }

int Process::wait() {
    if (exit_code_)
        return *exit_code_;
    int st = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &st, 0);
    } while (r < 0 && errno == EINTR);
    check_rc(r >= 0, "waitpid() failed for " + spec_.program);
    if (WIFEXITED(st))
        exit_code_ = WEXITSTATUS(st);
    else if (WIFSIGNALED(st))
        exit_code_ = 128 + WTERMSIG(st);
    else
        exit_code_ = -1;
    return *exit_code_;
}

CaptureResult run_capture(const CommandSpec& spec) {
    CommandSpec raw = spec;
    raw.out_delims.clear();
    raw.err_delims.clear();
    Process proc(std::move(raw));
    CaptureResult res;
    res.out = proc.rest_out("");
    res.err = proc.rest_err("");
    res.exit_code = proc.wait();
    return res;
}

} // namespace procutil
