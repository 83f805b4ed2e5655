#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/supervisor_errors.hpp"

namespace snipvisor::process {

enum class WorkerState {
    Unstarted,
    Ready,
    Dead
};

std::string to_string(WorkerState state);

// Owns one worker child process and its three pipes.
//
// Lifecycle: Unstarted --start--> Ready --stop/kill--> Unstarted, and
// shutdown() moves to the terminal Dead state from anywhere. Line I/O is only
// legal in Ready. Not thread-safe; the supervisor serializes access.
class WorkerProcess {
public:
    WorkerProcess() = default;
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    // Spawns `command` and blocks until the READY sentinel arrives. Returns
    // the child's pid. On failure the child is killed and the handle stays
    // Unstarted.
    core::errors::Result<pid_t> start(const std::vector<std::string>& command,
                                      std::uint32_t startup_timeout_ms);

    // Writes `line` plus a newline to the worker's stdin.
    core::errors::Result<std::size_t> write_line(const std::string& line);

    // Reads exactly one line from the worker's stdout. timeout_ms == 0 waits
    // forever.
    core::errors::Result<std::string> read_line(std::uint32_t timeout_ms);

    // Non-blocking probe. Reaps the child if it has exited.
    bool is_alive();

    // Closes stdin, waits up to grace_ms for a clean exit, then kills.
    void stop(std::uint32_t grace_ms);

    // Kills immediately. Used when the worker's state can no longer be trusted.
    void kill();

    // Like stop(), but the handle can never be started again.
    void shutdown(std::uint32_t grace_ms);

    WorkerState state() const { return state_; }
    std::optional<pid_t> pid() const;
    std::optional<int> last_exit_status() const { return last_exit_status_; }

    // Most recent bytes the worker wrote to stderr.
    const std::string& stderr_tail() const { return stderr_tail_; }

    // Bytes of an unterminated stderr line held for relaying. Bounded by the
    // tail size.
    std::size_t pending_stderr_bytes() const { return stderr_line_.size(); }

private:
    void drain_stderr();
    void append_stderr(const char* data, std::size_t size);
    bool try_reap(bool block);
    void close_pipes();
    void force_kill();

    WorkerState state_ = WorkerState::Unstarted;
    pid_t pid_ = -1;
    bool reaped_ = true;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::string stdout_buffer_;
    std::string stderr_line_;
    std::string stderr_tail_;
    std::optional<int> last_exit_status_;
};

}  // namespace snipvisor::process
