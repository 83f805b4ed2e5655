#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/supervisor_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace snipvisor::protocol {

// Literal line a worker prints once before accepting requests.
inline constexpr const char* kReadySentinel = "READY";

// A request as it travels on the wire. The supervisor fills the isolation
// switches from its configuration; callers only see ExecutionRequest.
struct WireRequest {
    std::string code;
    std::optional<std::string> input;
    bool reset_modules = false;
    bool reset_search_path = true;
    bool collect_garbage = false;
};

std::string encode_request(const WireRequest& request);

core::errors::Result<WireRequest> decode_request(const std::string& line);

std::string encode_response(const ExecutionResult& result);

core::errors::Result<ExecutionResult> decode_response(const std::string& line);

bool is_ready_line(const std::string& line);

// Outcome plus supervisor bookkeeping, as printed by the CLI.
nlohmann::json outcome_to_json(const ExecutionOutcome& outcome);

nlohmann::json stats_to_json(const SupervisorStats& stats);

nlohmann::json error_to_json(const core::errors::SupervisorError& error);

// Returns the body of the first fenced code block in `text`, preferring a
// ```python fence. Empty blocks yield nullopt.
std::optional<std::string> extract_code_block(const std::string& text);

}  // namespace snipvisor::protocol
