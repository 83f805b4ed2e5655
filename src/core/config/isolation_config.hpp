#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include "core/errors/supervisor_errors.hpp"

namespace snipvisor::core::config {

// Value used for "never restart".
constexpr std::uint64_t kUnboundedExecutions =
    std::numeric_limits<std::uint64_t>::max();

enum class IsolationTier {
    Ephemeral,
    PersistentUnsafe,
    PersistentIsolated
};

struct IsolationConfig {
    std::uint64_t max_executions_before_restart = 1000;
    bool reset_search_path = true;
    bool reset_imported_modules = false;
    std::uint64_t forced_gc_every_n = 100;
};

IsolationConfig preset(IsolationTier tier);

errors::Result<IsolationTier> parse_tier(const std::string& text);

std::string to_string(IsolationTier tier);

errors::Result<IsolationConfig> validate(const IsolationConfig& config);

}  // namespace snipvisor::core::config
