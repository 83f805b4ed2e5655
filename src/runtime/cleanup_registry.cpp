#include "runtime/cleanup_registry.hpp"

#include <cstdlib>
#include <vector>
#include "core/logging/logger.hpp"
#include "runtime/executor_supervisor.hpp"

namespace snipvisor::runtime {

namespace {

void run_exit_hook() {
    CleanupRegistry::get().shutdown_all();
}

}  // namespace

CleanupRegistry& CleanupRegistry::get() {
    // The exit hook logs, so the Logger must be constructed before the hook is
    // registered: statics are destroyed in reverse order of completion,
    // interleaved with atexit handlers.
    core::logging::Logger::get();
    // Leaked on purpose so the atexit hook never sees a destroyed registry.
    static CleanupRegistry* instance = new CleanupRegistry();
    return *instance;
}

void CleanupRegistry::add(ExecutorSupervisor* supervisor) {
    std::lock_guard<std::mutex> lock(mutex_);
    supervisors_.insert(supervisor);
    if (!hook_installed_) {
        if (std::atexit(run_exit_hook) == 0) {
            hook_installed_ = true;
        } else {
            SNIPVISOR_LOG_WARN("CleanupRegistry: failed to install exit hook");
        }
    }
}

void CleanupRegistry::remove(ExecutorSupervisor* supervisor) {
    std::lock_guard<std::mutex> lock(mutex_);
    supervisors_.erase(supervisor);
}

std::size_t CleanupRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return supervisors_.size();
}

void CleanupRegistry::shutdown_all() {
    std::vector<ExecutorSupervisor*> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.assign(supervisors_.begin(), supervisors_.end());
        supervisors_.clear();
    }
    for (auto* supervisor : pending) {
        supervisor->shutdown();
    }
}

}  // namespace snipvisor::runtime
