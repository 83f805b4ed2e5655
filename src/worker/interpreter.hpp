#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include "protocol/execution_contract.hpp"

namespace snipvisor::worker {

// Runtime-global state that survives between snippets unless reset.
struct AncillarySnapshot {
    std::size_t search_path_length = 0;
    // Only captured when module reset was requested.
    std::optional<std::set<std::string>> loaded_modules;
};

struct RestoreReport {
    std::size_t search_path_entries_removed = 0;
    std::size_t modules_unloaded = 0;
    std::size_t modules_skipped = 0;
};

// The evaluation engine behind the worker loop. Implementations run every
// snippet in a fresh local namespace and capture its standard streams.
class Interpreter {
public:
    virtual ~Interpreter() = default;

    virtual AncillarySnapshot snapshot(bool include_modules) = 0;

    // `input` becomes the snippet's standard input. Raised errors are returned
    // as ExecutionFailure.
    virtual protocol::ExecutionResult evaluate(const std::string& code,
                                               const std::string& input) = 0;

    virtual RestoreReport restore(const AncillarySnapshot& snapshot,
                                  bool reset_search_path) = 0;

    virtual void collect_garbage() = 0;
};

}  // namespace snipvisor::worker
