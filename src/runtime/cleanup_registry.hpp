#pragma once

#include <cstddef>
#include <mutex>
#include <unordered_set>

namespace snipvisor::runtime {

class ExecutorSupervisor;

// Last-resort shutdown hook. Live supervisors register here; the first
// registration installs a std::atexit handler that shuts down whatever is
// still registered when the process exits normally.
class CleanupRegistry {
public:
    static CleanupRegistry& get();

    void add(ExecutorSupervisor* supervisor);
    void remove(ExecutorSupervisor* supervisor);
    std::size_t size() const;

    // Shuts down every registered supervisor and clears the registry.
    void shutdown_all();

private:
    CleanupRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_set<ExecutorSupervisor*> supervisors_;
    bool hook_installed_ = false;
};

}  // namespace snipvisor::runtime
