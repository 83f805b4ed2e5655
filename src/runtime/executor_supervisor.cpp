#include "runtime/executor_supervisor.hpp"

#include <utility>
#include "core/config/instance_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/wire_protocol.hpp"
#include "runtime/cleanup_registry.hpp"

namespace snipvisor::runtime {

using core::errors::ErrorCategory;
using core::errors::SupervisorError;
using process::WorkerState;
using protocol::ExecutionOutcome;
using protocol::ExecutionRequest;
using protocol::SupervisorStats;
using protocol::WireRequest;

ExecutorSupervisor::ExecutorSupervisor(core::config::SupervisorConfig config)
    : config_(std::move(config)),
      policy_(config_.isolation),
      instance_id_(core::config::generate_instance_id()) {
    auto validated = core::config::validate(config_);
    if (core::errors::is_error(validated)) {
        config_error_ = core::errors::get_error(validated);
        SNIPVISOR_LOG_ERROR("ExecutorSupervisor " + instance_id_ +
                            ": invalid configuration [" + config_error_->code +
                            "]: " + config_error_->message);
    }
    CleanupRegistry::get().add(this);
}

ExecutorSupervisor::~ExecutorSupervisor() {
    shutdown();
}

core::errors::Result<ExecutionOutcome> ExecutorSupervisor::execute(
    const std::string& code, const std::optional<std::string>& input) {
    ExecutionRequest request;
    request.code = code;
    request.input = input;
    request.reset_modules = config_.isolation.reset_imported_modules;
    return execute(request);
}

core::errors::Result<ExecutionOutcome> ExecutorSupervisor::execute(
    const ExecutionRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return SupervisorError{ErrorCategory::Internal,
                               "Supervisor " + instance_id_ + " has been shut down.",
                               "supervisor_shut_down"};
    }
    if (config_error_.has_value()) {
        return config_error_.value();
    }

    auto ensured = ensure_worker_locked();
    if (core::errors::is_error(ensured)) {
        return core::errors::get_error(ensured);
    }
    if (worker_.state() != WorkerState::Ready) {
        discard_worker_locked("worker not ready before send");
        return SupervisorError{ErrorCategory::ProcessDied,
                               "Worker is not ready; it will be restarted on the next call.",
                               "worker_not_ready"};
    }

    ++execution_count_;
    ++total_executions_;
    const policy::PolicyDecision decision = policy_.evaluate(execution_count_);

    WireRequest wire;
    wire.code = request.code;
    wire.input = request.input;
    wire.reset_modules = request.reset_modules || config_.isolation.reset_imported_modules;
    wire.reset_search_path = config_.isolation.reset_search_path;
    wire.collect_garbage = decision.should_force_gc;

    auto written = worker_.write_line(protocol::encode_request(wire));
    if (core::errors::is_error(written)) {
        auto err = core::errors::get_error(written);
        discard_worker_locked("send failed: " + err.message);
        err.message = "Execution failed: " + err.message;
        return err;
    }

    auto line = worker_.read_line(config_.response_timeout_ms);
    if (core::errors::is_error(line)) {
        auto err = core::errors::get_error(line);
        discard_worker_locked("receive failed: " + err.message);
        err.message = "Execution failed: " + err.message;
        err.hint = "The worker was discarded; the next call starts a fresh one.";
        return err;
    }

    auto decoded = protocol::decode_response(core::errors::get_value(line));
    if (core::errors::is_error(decoded)) {
        auto err = core::errors::get_error(decoded);
        discard_worker_locked("protocol violation: " + err.message);
        err.message = "Execution failed: " + err.message;
        return err;
    }

    ExecutionOutcome outcome;
    outcome.result = std::move(std::get<protocol::ExecutionResult>(decoded));
    outcome.exit_code = protocol::succeeded(outcome) ? 0 : 1;
    outcome.execution_count = execution_count_;

    restart_due_ = decision.should_restart;
    if (restart_due_) {
        SNIPVISOR_LOG_DEBUG("ExecutorSupervisor " + instance_id_ + ": restart due after " +
                            std::to_string(execution_count_) + " executions");
    }
    return outcome;
}

SupervisorStats ExecutorSupervisor::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    SupervisorStats stats;
    stats.execution_count = execution_count_;
    stats.restart_count = restart_count_;
    stats.total_executions = total_executions_;
    stats.process_alive = worker_.is_alive();
    if (stats.process_alive) {
        stats.worker_pid = worker_.pid();
    }
    return stats;
}

void ExecutorSupervisor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        if (worker_.state() == WorkerState::Ready) {
            SNIPVISOR_LOG_INFO("ExecutorSupervisor " + instance_id_ +
                               ": shutting down worker after " +
                               std::to_string(total_executions_) + " executions");
        }
        worker_.shutdown(config_.shutdown_grace_ms);
    }
    CleanupRegistry::get().remove(this);
}

bool ExecutorSupervisor::is_shut_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shut_down_;
}

core::errors::Result<pid_t> ExecutorSupervisor::ensure_worker_locked() {
    if (worker_.state() == WorkerState::Unstarted) {
        return start_worker_locked(ever_started_ ? "previous worker was discarded"
                                                 : "first use");
    }

    if (restart_due_) {
        SNIPVISOR_LOG_INFO("ExecutorSupervisor " + instance_id_ + ": restarting worker after " +
                           std::to_string(execution_count_) + " executions");
        worker_.stop(config_.shutdown_grace_ms);
        return start_worker_locked("scheduled restart");
    }

    if (!worker_.is_alive()) {
        SNIPVISOR_LOG_WARN("ExecutorSupervisor " + instance_id_ +
                           ": worker exited between calls, restarting");
        worker_.kill();
        return start_worker_locked("worker exited");
    }

    return worker_.pid().value_or(-1);
}

core::errors::Result<pid_t> ExecutorSupervisor::start_worker_locked(const std::string& reason) {
    restart_due_ = false;
    execution_count_ = 0;

    auto started = worker_.start(config_.worker_command, config_.startup_timeout_ms);
    if (core::errors::is_error(started)) {
        const auto& err = core::errors::get_error(started);
        SNIPVISOR_LOG_ERROR("ExecutorSupervisor " + instance_id_ + ": worker start failed [" +
                            err.code + "]: " + err.message);
        return err;
    }

    if (ever_started_) {
        ++restart_count_;
    }
    ever_started_ = true;
    const pid_t pid = core::errors::get_value(started);
    SNIPVISOR_LOG_INFO("ExecutorSupervisor " + instance_id_ + ": worker pid " +
                       std::to_string(pid) + " ready (" + reason + ")");
    return pid;
}

void ExecutorSupervisor::discard_worker_locked(const std::string& reason) {
    SNIPVISOR_LOG_WARN("ExecutorSupervisor " + instance_id_ + ": discarding worker: " + reason);
    worker_.kill();
    restart_due_ = false;
}

}  // namespace snipvisor::runtime
