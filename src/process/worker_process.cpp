#include "process/worker_process.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "protocol/wire_protocol.hpp"

namespace snipvisor::process {

using core::errors::ErrorCategory;
using core::errors::SupervisorError;

namespace {

constexpr std::size_t kStderrTailBytes = 4096;

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

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

std::string describe_status(const int status) {
    if (WIFEXITED(status)) {
        return "exited with status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "stopped";
}

// write() on a pipe whose reader is gone raises SIGPIPE. Block it on this
// thread for the duration of the write and consume it if it became pending,
// so EPIPE is reported without touching the process-wide disposition.
ssize_t write_without_sigpipe(const int fd, const char* data, const std::size_t size) {
    sigset_t pipe_set;
    sigset_t old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);

    sigset_t pending;
    sigemptyset(&pending);
    static_cast<void>(sigpending(&pending));
    const bool was_pending = sigismember(&pending, SIGPIPE) == 1;

    static_cast<void>(pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set));
    ssize_t n = -1;
    do {
        n = write(fd, data, size);
    } while (n < 0 && errno == EINTR);
    const int saved_errno = errno;

    if (n < 0 && saved_errno == EPIPE && !was_pending) {
        const timespec no_wait{0, 0};
        static_cast<void>(sigtimedwait(&pipe_set, nullptr, &no_wait));
    }
    static_cast<void>(pthread_sigmask(SIG_SETMASK, &old_set, nullptr));
    errno = saved_errno;
    return n;
}

}  // namespace

std::string to_string(const WorkerState state) {
    switch (state) {
        case WorkerState::Unstarted:
            return "unstarted";
        case WorkerState::Ready:
            return "ready";
        case WorkerState::Dead:
            return "dead";
        default:
            return "unknown";
    }
}

WorkerProcess::~WorkerProcess() {
    if (pid_ > 0 && !reaped_) {
        force_kill();
    }
    close_pipes();
}

std::optional<pid_t> WorkerProcess::pid() const {
    if (state_ != WorkerState::Ready) {
        return std::nullopt;
    }
    return pid_;
}

core::errors::Result<pid_t> WorkerProcess::start(const std::vector<std::string>& command,
                                                 const std::uint32_t startup_timeout_ms) {
    if (state_ == WorkerState::Dead) {
        return SupervisorError{ErrorCategory::Internal,
                               "Worker handle has been shut down.",
                               "worker_shut_down"};
    }
    if (state_ == WorkerState::Ready) {
        return SupervisorError{ErrorCategory::Internal, "Worker is already running.",
                               "worker_already_started"};
    }
    if (command.empty()) {
        return SupervisorError{ErrorCategory::Configuration,
                               "Worker command is empty.", "missing_worker_command"};
    }

    // Built before fork(): the child may only call async-signal-safe functions.
    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        const std::string message = errno_text("Failed to create worker pipes");
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return SupervisorError{ErrorCategory::Internal, message, "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string message = errno_text("Failed to fork worker");
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return SupervisorError{ErrorCategory::Internal, message, "fork_failed"};
    }

    if (pid == 0) {
        sigset_t empty;
        sigemptyset(&empty);
        static_cast<void>(sigprocmask(SIG_SETMASK, &empty, nullptr));
        if (dup2(stdin_pipe[0], STDIN_FILENO) < 0 ||
            dup2(stdout_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe[1], STDERR_FILENO) < 0) {
            _exit(126);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(close(stdin_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];
    set_nonblocking(stdout_fd_);
    set_nonblocking(stderr_fd_);

    pid_ = pid;
    reaped_ = false;
    last_exit_status_.reset();
    stdout_buffer_.clear();
    stderr_line_.clear();
    stderr_tail_.clear();
    state_ = WorkerState::Ready;
    SNIPVISOR_LOG_DEBUG("WorkerProcess: spawned " + command.front() + " as pid " +
                        std::to_string(pid));

    auto first_line = read_line(startup_timeout_ms);
    if (core::errors::is_error(first_line)) {
        const auto& err = core::errors::get_error(first_line);
        std::string message = "Worker did not become ready: " + err.message;
        force_kill();
        if (last_exit_status_.has_value() && WIFEXITED(last_exit_status_.value()) &&
            WEXITSTATUS(last_exit_status_.value()) == 127) {
            return SupervisorError{ErrorCategory::Configuration,
                                   "Worker executable could not be launched: " +
                                       command.front(),
                                   "worker_exec_failed",
                                   "Check the worker path and its runtime libraries."};
        }
        if (last_exit_status_.has_value()) {
            message += " (worker " + describe_status(last_exit_status_.value()) + ")";
        }
        if (!stderr_tail_.empty()) {
            message += "\nworker stderr:\n" + stderr_tail_;
        }
        return SupervisorError{ErrorCategory::Startup, message,
                               err.code == "response_timeout" ? "startup_timeout"
                                                              : "startup_eof"};
    }

    const std::string& line = core::errors::get_value(first_line);
    if (!protocol::is_ready_line(line)) {
        force_kill();
        return SupervisorError{ErrorCategory::Startup,
                               "Worker sent an unexpected first line: " + line,
                               "startup_bad_sentinel"};
    }

    return pid;
}

core::errors::Result<std::size_t> WorkerProcess::write_line(const std::string& line) {
    if (state_ != WorkerState::Ready) {
        return SupervisorError{ErrorCategory::ProcessDied,
                               "Worker is not ready (state " + to_string(state_) + ").",
                               "worker_not_ready"};
    }

    const std::string payload = line + "\n";
    const char* data = payload.data();
    std::size_t remaining = payload.size();
    while (remaining > 0) {
        const ssize_t n = write_without_sigpipe(stdin_fd_, data, remaining);
        if (n < 0) {
            return SupervisorError{ErrorCategory::ProcessDied,
                                   errno_text("Failed to write to worker"),
                                   "worker_write_failed"};
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return payload.size();
}

core::errors::Result<std::string> WorkerProcess::read_line(const std::uint32_t timeout_ms) {
    if (state_ != WorkerState::Ready) {
        return SupervisorError{ErrorCategory::ProcessDied,
                               "Worker is not ready (state " + to_string(state_) + ").",
                               "worker_not_ready"};
    }

    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        const auto newline = stdout_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = stdout_buffer_.substr(0, newline);
            stdout_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }

        int wait_ms = -1;
        if (timeout_ms > 0) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  deadline - std::chrono::steady_clock::now())
                                  .count();
            if (left <= 0) {
                return SupervisorError{ErrorCategory::ProcessDied,
                                       "Timed out after " + std::to_string(timeout_ms) +
                                           " ms waiting for a worker line.",
                                       "response_timeout"};
            }
            wait_ms = static_cast<int>(left);
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds].fd = stdout_fd_;
        fds[nfds].events = POLLIN;
        ++nfds;
        if (stderr_fd_ >= 0) {
            fds[nfds].fd = stderr_fd_;
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        const int ready = poll(fds, nfds, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return SupervisorError{ErrorCategory::Internal,
                                   errno_text("poll on worker pipes failed"), "poll_failed"};
        }

        if (nfds > 1 && fds[1].revents != 0) {
            drain_stderr();
        }
        if (fds[0].revents == 0) {
            continue;
        }

        char buffer[4096];
        const ssize_t n = read(stdout_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            stdout_buffer_.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            drain_stderr();
            static_cast<void>(try_reap(false));
            return SupervisorError{ErrorCategory::ProcessDied,
                                   "Worker closed its stdout.", "worker_eof"};
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            continue;
        }
        return SupervisorError{ErrorCategory::ProcessDied,
                               errno_text("Failed to read from worker"),
                               "worker_read_failed"};
    }
}

bool WorkerProcess::is_alive() {
    if (state_ != WorkerState::Ready) {
        return false;
    }
    return !try_reap(false);
}

void WorkerProcess::stop(const std::uint32_t grace_ms) {
    if (pid_ <= 0 || reaped_) {
        close_pipes();
        if (state_ != WorkerState::Dead) {
            state_ = WorkerState::Unstarted;
        }
        return;
    }

    // EOF on stdin is the worker's signal to leave its request loop.
    close_fd(stdin_fd_);
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    while (!try_reap(false)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            SNIPVISOR_LOG_WARN("WorkerProcess: pid " + std::to_string(pid_) +
                               " ignored shutdown for " + std::to_string(grace_ms) +
                               " ms, killing");
            break;
        }
        drain_stderr();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    force_kill();
    if (state_ != WorkerState::Dead) {
        state_ = WorkerState::Unstarted;
    }
}

void WorkerProcess::kill() {
    force_kill();
    if (state_ != WorkerState::Dead) {
        state_ = WorkerState::Unstarted;
    }
}

void WorkerProcess::shutdown(const std::uint32_t grace_ms) {
    stop(grace_ms);
    state_ = WorkerState::Dead;
}

void WorkerProcess::force_kill() {
    if (pid_ > 0 && !reaped_) {
        static_cast<void>(::kill(pid_, SIGKILL));
        static_cast<void>(try_reap(true));
    }
    drain_stderr();
    close_pipes();
    if (state_ == WorkerState::Ready) {
        state_ = WorkerState::Unstarted;
    }
}

bool WorkerProcess::try_reap(const bool block) {
    if (pid_ <= 0 || reaped_) {
        return true;
    }

    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (waited < 0 && errno == EINTR);

    if (waited == 0) {
        return false;
    }
    reaped_ = true;
    if (waited == pid_) {
        last_exit_status_ = status;
        SNIPVISOR_LOG_DEBUG("WorkerProcess: pid " + std::to_string(pid_) + " " +
                            describe_status(status));
    }
    return true;
}

void WorkerProcess::drain_stderr() {
    if (stderr_fd_ < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(stderr_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            append_stderr(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
            close_fd(stderr_fd_);
        }
        return;
    }
}

void WorkerProcess::append_stderr(const char* data, const std::size_t size) {
    stderr_tail_.append(data, size);
    if (stderr_tail_.size() > kStderrTailBytes) {
        stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
    }

    const bool relay = core::logging::Logger::get().enabled(core::logging::LogLevel::DEBUG);
    stderr_line_.append(data, size);
    std::size_t newline = 0;
    while ((newline = stderr_line_.find('\n')) != std::string::npos) {
        if (relay) {
            SNIPVISOR_LOG_DEBUG("worker " + std::to_string(pid_) + ": " +
                                stderr_line_.substr(0, newline));
        }
        stderr_line_.erase(0, newline + 1);
    }

    // A worker that never writes a newline must not grow the line buffer.
    if (stderr_line_.size() > kStderrTailBytes) {
        if (relay) {
            SNIPVISOR_LOG_DEBUG("worker " + std::to_string(pid_) + " (partial): " +
                                stderr_line_);
        }
        stderr_line_.clear();
    }
}

void WorkerProcess::close_pipes() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    stdout_buffer_.clear();
    stderr_line_.clear();
}

}  // namespace snipvisor::process
