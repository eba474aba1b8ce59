#include "tools/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace tryrun::tools {

namespace {

using Clock = std::chrono::steady_clock;

// Stragglers in the process group may keep the pipes open after the leader
// exits; they get this long before the group is killed.
constexpr std::int64_t kPostExitDrainMs = 500;

std::int64_t elapsed_ms_since(const Clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started)
        .count();
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void set_cloexec(const int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pair(int (&fds)[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

void drain_pipe(int& fd, std::string& out, const std::size_t max_chars) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            append_tail(out, buffer, static_cast<std::size_t>(n), max_chars);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        close_fd(fd);
        return;
    }
}

void append_line(std::string& out, const std::string& line, const std::size_t max_chars) {
    std::string text = out.empty() ? line : "\n" + line;
    append_tail(out, text.data(), text.size(), max_chars);
}

ProcessCapture spawn_failure(ProcessCapture capture, const std::string& detail,
                             const std::size_t max_chars) {
    capture.spawn_failed = true;
    capture.exit_code = -1;
    append_line(capture.stderr_text, detail, max_chars);
    return capture;
}

// Blocks until the child either execs (EOF from the close-on-exec pipe) or
// reports the errno of a failed chdir/exec.
int read_exec_status(const int fd) {
    char buf[sizeof(int)];
    std::size_t got = 0;
    while (got < sizeof(buf)) {
        const ssize_t n = read(fd, buf + got, sizeof(buf) - got);
        if (n > 0) {
            got += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    if (got != sizeof(buf)) {
        return 0;
    }
    int child_errno = 0;
    std::memcpy(&child_errno, buf, sizeof(child_errno));
    return child_errno;
}

[[noreturn]] void report_and_exit(const int status_fd) {
    const int err = errno;
    static_cast<void>(write(status_fd, &err, sizeof(err)));
    _exit(127);
}

}  // namespace

void append_tail(std::string& buffer, const char* data, const std::size_t size,
                 const std::size_t max_chars) {
    buffer.append(data, size);
    if (buffer.size() <= max_chars) {
        return;
    }

    std::size_t cut = buffer.size() - max_chars;
    // Skip UTF-8 continuation bytes so the tail starts on a character.
    std::size_t skipped = 0;
    while (cut < buffer.size() && skipped < 3 &&
           (static_cast<unsigned char>(buffer[cut]) & 0xC0) == 0x80) {
        ++cut;
        ++skipped;
    }
    buffer.erase(0, cut);
}

ProcessCapture run_process(const ProcessRequest& request) {
    ProcessCapture capture;
    capture.command = request.command;
    capture.args = request.args;
    capture.cwd = request.working_directory.string();
    const std::size_t max_chars = request.max_output_chars;

    if (request.cancel_token && request.cancel_token->load()) {
        capture.cancelled = true;
        append_line(capture.stderr_text, "Command cancelled before start.", max_chars);
        return capture;
    }

    // argv is built before fork; the child only calls async-signal-safe code.
    std::vector<std::string> owned_args;
    owned_args.reserve(request.args.size() + 1);
    owned_args.push_back(request.command);
    owned_args.insert(owned_args.end(), request.args.begin(), request.args.end());
    std::vector<char*> argv;
    argv.reserve(owned_args.size() + 1);
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const std::string cwd = request.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 || pipe(status_pipe) != 0) {
        const std::string detail = std::strerror(errno);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return spawn_failure(std::move(capture),
                             "spawn " + request.command + " failed: " + detail, max_chars);
    }
    set_cloexec(status_pipe[0]);
    set_cloexec(status_pipe[1]);

    const auto started = Clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const std::string detail = std::strerror(errno);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return spawn_failure(std::move(capture),
                             "spawn " + request.command + " failed: " + detail, max_chars);
    }

    if (pid == 0) {
        // Own process group so timeouts reach every descendant.
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(status_pipe[0]));
        if (chdir(cwd.c_str()) != 0) {
            report_and_exit(status_pipe[1]);
        }
        execvp(argv[0], argv.data());
        report_and_exit(status_pipe[1]);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    const int exec_errno = read_exec_status(status_pipe[0]);
    close_fd(status_pipe[0]);
    if (exec_errno != 0) {
        int ignored = 0;
        static_cast<void>(waitpid(pid, &ignored, 0));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        capture.duration_ms = elapsed_ms_since(started);
        TRYRUN_LOG_DEBUG("ProcessRunner: spawn failed for " + request.command + ": " +
                         std::strerror(exec_errno));
        return spawn_failure(std::move(capture),
                             "spawn " + request.command + " failed: " +
                                 std::strerror(exec_errno),
                             max_chars);
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    int& stdout_fd = stdout_pipe[0];
    int& stderr_fd = stderr_pipe[0];
    bool child_exited = false;
    bool kill_sent = false;
    std::int64_t term_sent_at = -1;
    std::int64_t exited_at = -1;
    int status = 0;

    while (stdout_fd >= 0 || stderr_fd >= 0 || !child_exited) {
        const std::int64_t elapsed = elapsed_ms_since(started);

        if (!child_exited && !capture.cancelled && request.cancel_token &&
            request.cancel_token->load()) {
            capture.cancelled = true;
            kill_sent = true;
            static_cast<void>(killpg(pid, SIGKILL));
        }

        if (!child_exited && !capture.timed_out && request.timeout_ms > 0 &&
            elapsed >= static_cast<std::int64_t>(request.timeout_ms)) {
            capture.timed_out = true;
            term_sent_at = elapsed;
            static_cast<void>(killpg(pid, SIGTERM));
        }

        if (!child_exited && capture.timed_out && !kill_sent &&
            elapsed - term_sent_at >= static_cast<std::int64_t>(kKillGraceMs)) {
            kill_sent = true;
            static_cast<void>(killpg(pid, SIGKILL));
        }

        if (child_exited && exited_at >= 0 && elapsed - exited_at >= kPostExitDrainMs) {
            static_cast<void>(killpg(pid, SIGKILL));
            drain_pipe(stdout_fd, capture.stdout_text, max_chars);
            drain_pipe(stderr_fd, capture.stderr_text, max_chars);
            close_fd(stdout_fd);
            close_fd(stderr_fd);
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_fd >= 0) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        if (stderr_fd >= 0) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(usleep(10000));
        }

        drain_pipe(stdout_fd, capture.stdout_text, max_chars);
        drain_pipe(stderr_fd, capture.stderr_text, max_chars);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                exited_at = elapsed_ms_since(started);
            }
        }

        if (request.on_tick) {
            request.on_tick(elapsed_ms_since(started));
        }
    }

    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else {
        capture.exit_code = std::nullopt;
    }

    if (capture.cancelled) {
        append_line(capture.stderr_text, "Command cancelled.", max_chars);
    }

    capture.duration_ms = elapsed_ms_since(started);
    return capture;
}

}  // namespace tryrun::tools
