#pragma once

#include <cstdint>
#include "core/config/isolation_config.hpp"

namespace snipvisor::policy {

struct PolicyDecision {
    bool should_restart = false;
    bool should_force_gc = false;
};

// Pure decision function; holds nothing but its configuration.
class IsolationPolicy {
public:
    explicit IsolationPolicy(core::config::IsolationConfig config = {});

    // `execution_count` is the 1-based position of a call since the worker
    // last started.
    PolicyDecision evaluate(std::uint64_t execution_count) const;

    const core::config::IsolationConfig& config() const { return config_; }

private:
    core::config::IsolationConfig config_;
};

}  // namespace snipvisor::policy
