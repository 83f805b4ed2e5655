#include "protocol/wire_protocol.hpp"

#include <cctype>
#include <utility>

namespace snipvisor::protocol {

using core::errors::ErrorCategory;
using core::errors::SupervisorError;
using nlohmann::json;

namespace {

// Snippet output is arbitrary bytes; replace invalid UTF-8 instead of throwing.
std::string dump_line(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string strip_line_ending(const std::string& line) {
    std::string stripped = line;
    while (!stripped.empty() && (stripped.back() == '\n' || stripped.back() == '\r')) {
        stripped.pop_back();
    }
    return stripped;
}

SupervisorError protocol_error(const std::string& message) {
    return SupervisorError{ErrorCategory::Protocol, message, "malformed_response"};
}

bool read_string_field(const json& object, const char* key, std::string& out) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

json result_to_json(const ExecutionResult& result) {
    json payload;
    if (const auto* success = std::get_if<ExecutionSuccess>(&result)) {
        payload["stdout"] = success->stdout_text;
        payload["stderr"] = success->stderr_text;
        payload["bindings"] = success->bindings;
    } else {
        const auto& failure = std::get<ExecutionFailure>(result);
        payload["error"] = failure.message;
        payload["trace"] = failure.trace;
        payload["stdout"] = failure.stdout_text;
        payload["stderr"] = failure.stderr_text;
    }
    return payload;
}

}  // namespace

std::string encode_request(const WireRequest& request) {
    json payload;
    payload["code"] = request.code;
    if (request.input.has_value()) {
        payload["input"] = request.input.value();
    }
    payload["resetModules"] = request.reset_modules;
    payload["resetSearchPath"] = request.reset_search_path;
    payload["collectGarbage"] = request.collect_garbage;
    return dump_line(payload);
}

core::errors::Result<WireRequest> decode_request(const std::string& line) {
    const json payload = json::parse(strip_line_ending(line), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return SupervisorError{ErrorCategory::Protocol,
                               "Request line is not a JSON object.",
                               "malformed_request"};
    }

    WireRequest request;
    const auto code = payload.find("code");
    if (code != payload.end()) {
        if (!code->is_string()) {
            return SupervisorError{ErrorCategory::Protocol,
                                   "Request field 'code' must be a string.",
                                   "malformed_request"};
        }
        request.code = code->get<std::string>();
    }

    const auto input = payload.find("input");
    if (input != payload.end() && !input->is_null()) {
        if (!input->is_string()) {
            return SupervisorError{ErrorCategory::Protocol,
                                   "Request field 'input' must be a string.",
                                   "malformed_request"};
        }
        request.input = input->get<std::string>();
    }

    const std::pair<const char*, bool*> switches[] = {
        {"resetModules", &request.reset_modules},
        {"resetSearchPath", &request.reset_search_path},
        {"collectGarbage", &request.collect_garbage}};
    for (const auto& [key, target] : switches) {
        const auto it = payload.find(key);
        if (it == payload.end()) {
            continue;
        }
        if (!it->is_boolean()) {
            return SupervisorError{ErrorCategory::Protocol,
                                   std::string("Request field '") + key +
                                       "' must be a boolean.",
                                   "malformed_request"};
        }
        *target = it->get<bool>();
    }

    return request;
}

std::string encode_response(const ExecutionResult& result) {
    return dump_line(result_to_json(result));
}

core::errors::Result<ExecutionResult> decode_response(const std::string& line) {
    const json payload = json::parse(strip_line_ending(line), nullptr, false);
    if (payload.is_discarded()) {
        return protocol_error("Response line is not valid JSON.");
    }
    if (!payload.is_object()) {
        return protocol_error("Response line is not a JSON object.");
    }

    const auto error = payload.find("error");
    if (error != payload.end()) {
        if (!error->is_string()) {
            return protocol_error("Response field 'error' must be a string.");
        }
        ExecutionFailure failure;
        failure.message = error->get<std::string>();
        if (!read_string_field(payload, "trace", failure.trace) ||
            !read_string_field(payload, "stdout", failure.stdout_text) ||
            !read_string_field(payload, "stderr", failure.stderr_text)) {
            return protocol_error(
                "Failure response needs string fields trace, stdout, stderr.");
        }
        return ExecutionResult{std::move(failure)};
    }

    const auto out = payload.find("stdout");
    const auto err = payload.find("stderr");
    const auto bindings = payload.find("bindings");
    if (out == payload.end() || err == payload.end() || bindings == payload.end()) {
        return protocol_error(
            "Response is missing one of the required fields stdout, stderr, bindings.");
    }
    if (!out->is_string() || !err->is_string() || !bindings->is_object()) {
        return protocol_error("Success response has fields of the wrong type.");
    }

    ExecutionSuccess success;
    success.stdout_text = out->get<std::string>();
    success.stderr_text = err->get<std::string>();
    for (const auto& [name, value] : bindings->items()) {
        success.bindings.emplace(name, value.is_string() ? value.get<std::string>()
                                                         : dump_line(value));
    }
    return ExecutionResult{std::move(success)};
}

bool is_ready_line(const std::string& line) {
    return strip_line_ending(line) == kReadySentinel;
}

json outcome_to_json(const ExecutionOutcome& outcome) {
    json payload = result_to_json(outcome.result);
    payload["ok"] = succeeded(outcome);
    payload["exit_code"] = outcome.exit_code;
    payload["execution_count"] = outcome.execution_count;
    return payload;
}

json stats_to_json(const SupervisorStats& stats) {
    json payload;
    payload["execution_count"] = stats.execution_count;
    payload["restart_count"] = stats.restart_count;
    payload["process_alive"] = stats.process_alive;
    payload["total_executions"] = stats.total_executions;
    payload["worker_pid"] =
        stats.worker_pid.has_value() ? json(stats.worker_pid.value()) : json(nullptr);
    return payload;
}

json error_to_json(const SupervisorError& error) {
    json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    payload["retryable"] = core::errors::is_retryable(error);
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return payload;
}

std::optional<std::string> extract_code_block(const std::string& text) {
    const std::string fence = "```";
    const std::string python_fence = "```python";
    const std::string trimmed = trim(text);
    if (trimmed.find(fence) == std::string::npos) {
        return std::nullopt;
    }

    std::size_t body_start = std::string::npos;
    const auto python_pos = trimmed.find(python_fence);
    if (python_pos != std::string::npos) {
        body_start = python_pos + python_fence.size();
    } else {
        body_start = trimmed.find(fence) + fence.size();
    }

    const auto body_end = trimmed.find(fence, body_start);
    const std::string body = trimmed.substr(
        body_start, body_end == std::string::npos ? std::string::npos : body_end - body_start);
    std::string code = trim(body);
    if (code.empty()) {
        return std::nullopt;
    }
    return code;
}

}  // namespace snipvisor::protocol
