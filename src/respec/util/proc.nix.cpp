#include "./proc.hpp"

#include <respec/util/log.hpp>
#include <respec/util/signal.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <utility>

using namespace respec;
using namespace std::chrono_literals;

namespace {

using clock_type = std::chrono::steady_clock;

[[noreturn]] void throw_errno(std::string_view what) {
    BOOST_LEAF_THROW_EXCEPTION(
        std::system_error(std::error_code(errno, std::system_category()), std::string(what)));
}

/// Owns a file descriptor and closes it on scope exit.
class unique_fd {
    int _fd = -1;

public:
    unique_fd() = default;
    explicit unique_fd(int fd) noexcept
        : _fd(fd) {}
    unique_fd(unique_fd&& o) noexcept
        : _fd(std::exchange(o._fd, -1)) {}
    unique_fd& operator=(unique_fd&& o) noexcept {
        reset(std::exchange(o._fd, -1));
        return *this;
    }
    ~unique_fd() { reset(); }

    int  get() const noexcept { return _fd; }
    void reset(int fd = -1) noexcept {
        if (_fd != -1) {
            ::close(_fd);
        }
        _fd = fd;
    }
};

[[noreturn]] void child_fail(const char* msg) noexcept {
    std::fputs(msg, stderr);
    std::_Exit(127);
}

::pid_t spawn_child(const proc_options& opts, unique_fd& read_end, unique_fd& write_end) {
    // Everything the child touches is allocated before fork()
    std::vector<char*> argv;
    argv.reserve(opts.command.size() + 1);
    for (auto& s : opts.command) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);
    std::string workdir = opts.cwd.value_or(std::filesystem::current_path()).string();
    std::string not_found
        = fmt::format("[respec] Executable [{}] was not found on PATH\n", opts.command.front());

    auto pid = ::fork();
    if (pid == -1) {
        throw_errno("fork() for subprocess");
    }
    if (pid != 0) {
        return pid;
    }
    // Own process group, so a timeout can stop mock together with everything it spawned
    ::setpgid(0, 0);
    read_end.reset();
    if (::dup2(write_end.get(), STDOUT_FILENO) == -1
        || ::dup2(write_end.get(), STDERR_FILENO) == -1) {
        child_fail("[respec] Failed to redirect subprocess output\n");
    }
    if (::chdir(workdir.c_str()) == -1) {
        child_fail("[respec] Failed to chdir() for subprocess\n");
    }
    ::execvp(argv[0], argv.data());
    if (errno == ENOENT) {
        child_fail(not_found.c_str());
    }
    std::fputs("[respec] execvp() failed: ", stderr);
    child_fail(std::strerror(errno));
}

void write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        auto n = ::write(fd, data.data(), data.size());
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            throw_errno("write() to subprocess log");
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
}

int poll_timeout(std::optional<clock_type::time_point> deadline) {
    if (!deadline) {
        return -1;
    }
    auto left = std::chrono::ceil<std::chrono::milliseconds>(*deadline - clock_type::now());
    return static_cast<int>(std::max(left, std::chrono::milliseconds::zero()).count());
}

}  // namespace

proc_result respec::run_proc(const proc_options& opts) {
    if (opts.command.empty()) {
        BOOST_LEAF_THROW_EXCEPTION(std::invalid_argument("run_proc() with an empty command"));
    }
    respec_log(debug, "Spawning subprocess: {}", quote_command(opts.command));

    unique_fd log_fd;
    if (opts.output_file) {
        log_fd.reset(
            ::open(opts.output_file->c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
        if (log_fd.get() == -1) {
            throw_errno(fmt::format("open() subprocess log [{}]", opts.output_file->string()));
        }
    }

    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        throw_errno("pipe() for subprocess output");
    }
    unique_fd read_end{fds[0]};
    unique_fd write_end{fds[1]};

    auto start = clock_type::now();
    auto child = spawn_child(opts, read_end, write_end);
    write_end.reset();

    std::optional<clock_type::time_point> deadline;
    if (opts.timeout) {
        deadline = start + *opts.timeout;
    }
    bool                   sent_kill        = false;
    bool                   forwarded_cancel = false;
    proc_result            res;
    std::array<char, 4096> buffer;

    while (true) {
        pollfd pfd{.fd = read_end.get(), .events = POLLIN, .revents = 0};
        int    rc = ::poll(&pfd, 1, poll_timeout(deadline));
        if (rc < 0 && errno == EINTR) {
            // The child's process group does not see terminal signals, so pass cancellation on
            if (is_cancelled() && !forwarded_cancel) {
                ::kill(-child, SIGTERM);
                forwarded_cancel = true;
            }
            continue;
        }
        if (rc < 0) {
            throw_errno("poll() on subprocess output");
        }
        if (rc == 0) {
            if (!res.timed_out) {
                respec_log(warn,
                           "Subprocess [{}] exceeded its {}ms limit; sending SIGTERM",
                           opts.command.front(),
                           opts.timeout->count());
                ::kill(-child, SIGTERM);
                res.timed_out = true;
                deadline      = clock_type::now() + opts.kill_grace;
            } else if (!sent_kill) {
                respec_log(warn, "Subprocess [{}] ignored SIGTERM; killing", opts.command.front());
                ::kill(-child, SIGKILL);
                sent_kill = true;
                deadline.reset();
            }
            continue;
        }
        auto nread = ::read(read_end.get(), buffer.data(), buffer.size());
        if (nread < 0 && errno == EINTR) {
            continue;
        }
        if (nread < 0) {
            throw_errno("read() subprocess output");
        }
        if (nread == 0) {
            break;
        }
        std::string_view chunk{buffer.data(), static_cast<std::size_t>(nread)};
        res.output.append(chunk);
        if (log_fd.get() != -1) {
            write_all(log_fd.get(), chunk);
        }
    }

    int status = 0;
    while (::waitpid(child, &status, 0) < 0) {
        if (errno != EINTR) {
            throw_errno("waitpid() for subprocess");
        }
    }
    res.elapsed
        = std::chrono::duration_cast<std::chrono::milliseconds>(clock_type::now() - start);
    if (WIFEXITED(status)) {
        res.retc = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.signal = WTERMSIG(status);
    }

    cancellation_point();
    return res;
}
