#include "runtime/process_runner.hpp"

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace harbor::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        close_fd(fd);
        return;
    }
}

void feed_stdin(int& fd, const std::string& text, std::size_t& offset) {
    if (fd < 0) {
        return;
    }
    while (offset < text.size()) {
        const ssize_t n = write(fd, text.data() + offset, text.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        // EPIPE: the child stopped reading; drop the rest.
        break;
    }
    close_fd(fd);
}

// A child that exits without reading its stdin must not take us down.
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

// Falls back to the pid alone while it is still unreaped.
void kill_group(const pid_t pid, const bool reaped) {
    if (kill(-pid, SIGKILL) != 0 && !reaped) {
        static_cast<void>(kill(pid, SIGKILL));
    }
}

}  // namespace

std::vector<std::string> shell_argv(const std::string& command) {
    return {"/bin/sh", "-c", command};
}

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.argv.empty() || request.argv.front().empty()) {
        return AgentError{ErrorCategory::Input, "Process argv cannot be empty.",
                          "empty_command"};
    }
    if (request.cancel_token && request.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Process cancelled before start.";
        return capture;
    }

    ignore_sigpipe_once();

    // Built before fork; the child may only make async-signal-safe calls.
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string cwd = request.working_directory.string();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return AgentError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return AgentError{ErrorCategory::Internal, "Failed to fork process.",
                          "fork_failed"};
    }

    if (pid == 0) {
        // Own process group, so a kill also reaches background jobs.
        static_cast<void>(setpgid(0, 0));
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            static_cast<void>(close(p[0]));
            static_cast<void>(close(p[1]));
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    int stdin_fd = stdin_pipe[1];
    int stdout_fd = stdout_pipe[0];
    int stderr_fd = stderr_pipe[0];
    set_nonblocking(stdin_fd);
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    ProcessCapture capture;
    std::size_t stdin_offset = 0;
    if (request.stdin_text.empty()) {
        close_fd(stdin_fd);
    }

    bool child_exited = false;
    int status = 0;
    const auto timeout_ms = request.timeout.count();

    while (stdout_fd >= 0 || stderr_fd >= 0 || !child_exited) {
        // Checked after the shell exits too: its background jobs may still
        // hold the pipes open.
        if (request.cancel_token && request.cancel_token->load() && !capture.cancelled &&
            !capture.timed_out) {
            capture.cancelled = true;
            kill_group(pid, child_exited);
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.timed_out && !capture.cancelled && timeout_ms > 0 &&
            elapsed > timeout_ms) {
            capture.timed_out = true;
            kill_group(pid, child_exited);
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdin_fd >= 0) {
            fds[nfds].fd = stdin_fd;
            fds[nfds].events = POLLOUT;
            ++nfds;
        }
        if (stdout_fd >= 0) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_fd >= 0) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        feed_stdin(stdin_fd, request.stdin_text, stdin_offset);
        drain_pipe(stdout_fd, capture.stdout_text);
        drain_pipe(stderr_fd, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // Grandchildren outside the group can hold the pipes open after a kill.
        if (child_exited && (capture.cancelled || capture.timed_out)) {
            break;
        }
    }

    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stderr_fd);
    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    capture.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return capture;
}

}  // namespace harbor::runtime
