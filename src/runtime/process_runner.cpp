#include "runtime/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace warden::runtime {

using core::errors::ErrorCategory;
using core::errors::WardenError;

namespace {

// How long a killed process group may keep its pipes open.
constexpr std::int64_t kKillGraceMs = 500;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            static_cast<void>(close(fd));
            fd = -1;
        }
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

}  // namespace

ProcessRunner::ProcessRunner(InterpreterCommand command)
    : command_(std::move(command)) {}

core::errors::Result<ProcessCapture> ProcessRunner::run(
    const std::string& code, const std::filesystem::path& working_directory) const {
    if (command_.program.empty()) {
        return WardenError{ErrorCategory::Input, "Interpreter program cannot be empty.",
                           "invalid_interpreter"};
    }

    // argv is built before fork so the child only calls async-signal-safe functions.
    std::vector<std::string> owned_args;
    owned_args.reserve(command_.args.size() + 2);
    owned_args.push_back(command_.program);
    for (const auto& arg : command_.args) {
        owned_args.push_back(arg);
    }
    owned_args.push_back(code);

    std::vector<char*> argv;
    argv.reserve(owned_args.size() + 1);
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const std::string cwd = working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return WardenError{ErrorCategory::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return WardenError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        // Own process group, so a timeout also reaches background children.
        static_cast<void>(setpgid(0, 0));
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        const auto timeout = static_cast<std::int64_t>(command_.timeout_ms);
        if (!capture.timed_out && command_.timeout_ms > 0 && elapsed > timeout) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
            if (!child_exited) {
                static_cast<void>(kill(pid, SIGKILL));
            }
        }
        // A descendant that left the group can hold the pipes forever.
        if (capture.timed_out && elapsed > timeout + kKillGraceMs) {
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited && waitpid(pid, &status, WNOHANG) == pid) {
            child_exited = true;
        }
    }

    if (stdout_open) {
        static_cast<void>(close(stdout_pipe[0]));
    }
    if (stderr_open) {
        static_cast<void>(close(stderr_pipe[0]));
    }
    if (!child_exited) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }

    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

}  // namespace warden::runtime
