#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include "core/config/supervisor_config.hpp"
#include "core/errors/supervisor_errors.hpp"
#include "policy/isolation_policy.hpp"
#include "process/worker_process.hpp"
#include "protocol/execution_contract.hpp"

namespace snipvisor::runtime {

// Owns one worker process and serializes every call into it.
//
// execute() holds the supervisor lock for the full round trip: lazy start,
// scheduled restart, liveness probe, send, blocking read, policy bookkeeping.
// Snippet exceptions come back as ExecutionFailure values; only
// infrastructure and configuration problems are returned as errors. A failed
// round trip is never retried, the next call starts a fresh worker instead.
class ExecutorSupervisor {
public:
    explicit ExecutorSupervisor(core::config::SupervisorConfig config);
    ~ExecutorSupervisor();

    ExecutorSupervisor(const ExecutorSupervisor&) = delete;
    ExecutorSupervisor& operator=(const ExecutorSupervisor&) = delete;

    core::errors::Result<protocol::ExecutionOutcome> execute(
        const std::string& code,
        const std::optional<std::string>& input = std::nullopt);

    core::errors::Result<protocol::ExecutionOutcome> execute(
        const protocol::ExecutionRequest& request);

    protocol::SupervisorStats stats();

    // Stops the worker and makes every later execute() fail. Idempotent.
    void shutdown();

    bool is_shut_down() const;

    const std::string& instance_id() const { return instance_id_; }
    const core::config::SupervisorConfig& config() const { return config_; }

private:
    core::errors::Result<pid_t> ensure_worker_locked();
    core::errors::Result<pid_t> start_worker_locked(const std::string& reason);
    void discard_worker_locked(const std::string& reason);

    const core::config::SupervisorConfig config_;
    const policy::IsolationPolicy policy_;
    const std::string instance_id_;
    std::optional<core::errors::SupervisorError> config_error_;

    mutable std::mutex mutex_;
    process::WorkerProcess worker_;
    bool shut_down_ = false;
    bool ever_started_ = false;
    bool restart_due_ = false;
    std::uint64_t execution_count_ = 0;
    std::uint64_t total_executions_ = 0;
    std::uint64_t restart_count_ = 0;
};

}  // namespace snipvisor::runtime
