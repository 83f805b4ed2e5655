#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/config/isolation_config.hpp"
#include "core/errors/supervisor_errors.hpp"

namespace snipvisor::core::config {

struct SupervisorConfig {
    // argv of the worker; element 0 is the executable.
    std::vector<std::string> worker_command;
    IsolationConfig isolation = preset(IsolationTier::PersistentIsolated);
    std::uint32_t startup_timeout_ms = 10000;
    // 0 waits for the response indefinitely.
    std::uint32_t response_timeout_ms = 0;
    std::uint32_t shutdown_grace_ms = 5000;
};

// Checks everything that can be checked without spawning the worker.
errors::Result<SupervisorConfig> validate(const SupervisorConfig& config);

}  // namespace snipvisor::core::config
