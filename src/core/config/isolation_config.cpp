#include "core/config/isolation_config.hpp"

namespace snipvisor::core::config {

using errors::ErrorCategory;
using errors::SupervisorError;

IsolationConfig preset(const IsolationTier tier) {
    IsolationConfig config;
    switch (tier) {
        case IsolationTier::Ephemeral:
            config.max_executions_before_restart = 1;
            config.reset_search_path = true;
            config.reset_imported_modules = false;
            config.forced_gc_every_n = 0;
            break;
        case IsolationTier::PersistentUnsafe:
            config.max_executions_before_restart = kUnboundedExecutions;
            config.reset_search_path = false;
            config.reset_imported_modules = false;
            config.forced_gc_every_n = 0;
            break;
        case IsolationTier::PersistentIsolated:
            config.max_executions_before_restart = 1000;
            config.reset_search_path = true;
            config.reset_imported_modules = false;
            config.forced_gc_every_n = 100;
            break;
    }
    return config;
}

errors::Result<IsolationTier> parse_tier(const std::string& text) {
    if (text == "ephemeral") {
        return IsolationTier::Ephemeral;
    }
    if (text == "persistent-unsafe") {
        return IsolationTier::PersistentUnsafe;
    }
    if (text == "persistent-isolated") {
        return IsolationTier::PersistentIsolated;
    }
    return SupervisorError{
        ErrorCategory::Input, "Unknown isolation tier: " + text, "unknown_tier",
        "Use one of: ephemeral, persistent-unsafe, persistent-isolated."};
}

std::string to_string(const IsolationTier tier) {
    switch (tier) {
        case IsolationTier::Ephemeral:
            return "ephemeral";
        case IsolationTier::PersistentUnsafe:
            return "persistent-unsafe";
        case IsolationTier::PersistentIsolated:
            return "persistent-isolated";
        default:
            return "unknown";
    }
}

errors::Result<IsolationConfig> validate(const IsolationConfig& config) {
    if (config.max_executions_before_restart == 0) {
        return SupervisorError{ErrorCategory::Configuration,
                               "max_executions_before_restart must be at least 1.",
                               "invalid_isolation_config"};
    }
    return config;
}

}  // namespace snipvisor::core::config
