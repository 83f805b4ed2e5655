#include "core/config/supervisor_config.hpp"

#include <unistd.h>

namespace snipvisor::core::config {

using errors::ErrorCategory;
using errors::SupervisorError;

errors::Result<SupervisorConfig> validate(const SupervisorConfig& config) {
    if (config.worker_command.empty() || config.worker_command.front().empty()) {
        return SupervisorError{ErrorCategory::Configuration,
                               "Worker command is not configured.",
                               "missing_worker_command",
                               "Point --worker at the snipvisor_worker executable."};
    }

    const std::string& executable = config.worker_command.front();
    if (executable.find('/') != std::string::npos &&
        access(executable.c_str(), X_OK) != 0) {
        return SupervisorError{ErrorCategory::Configuration,
                               "Worker executable is not runnable: " + executable,
                               "worker_not_executable"};
    }

    if (config.startup_timeout_ms == 0) {
        return SupervisorError{ErrorCategory::Configuration,
                               "startup_timeout_ms must be greater than zero.",
                               "invalid_startup_timeout"};
    }

    auto isolation = validate(config.isolation);
    if (errors::is_error(isolation)) {
        return errors::get_error(isolation);
    }
    return config;
}

}  // namespace snipvisor::core::config
