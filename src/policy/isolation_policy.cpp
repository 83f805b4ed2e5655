#include "policy/isolation_policy.hpp"

#include <utility>

namespace snipvisor::policy {

IsolationPolicy::IsolationPolicy(core::config::IsolationConfig config)
    : config_(std::move(config)) {}

PolicyDecision IsolationPolicy::evaluate(const std::uint64_t execution_count) const {
    PolicyDecision decision;
    if (execution_count == 0) {
        return decision;
    }

    const std::uint64_t restart_every = config_.max_executions_before_restart;
    decision.should_restart =
        restart_every != 0 && execution_count % restart_every == 0;
    decision.should_force_gc = config_.forced_gc_every_n > 0 &&
                               execution_count % config_.forced_gc_every_n == 0;
    return decision;
}

}  // namespace snipvisor::policy
