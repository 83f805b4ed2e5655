#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace snipvisor::protocol {

    // What a caller asks the supervisor to run.
    struct ExecutionRequest {
        std::string code;
        std::optional<std::string> input;
        bool reset_modules = false;
    };

    struct ExecutionSuccess {
        std::string stdout_text;
        std::string stderr_text;
        std::map<std::string, std::string> bindings;  // final locals, stringified
    };

    // The snippet raised. This is data, not a supervisor fault.
    struct ExecutionFailure {
        std::string message;
        std::string trace;
        std::string stdout_text;
        std::string stderr_text;
    };

    using ExecutionResult = std::variant<ExecutionSuccess, ExecutionFailure>;

    struct ExecutionOutcome {
        ExecutionResult result;
        int exit_code = 0;
        std::uint64_t execution_count = 0;  // position since the worker last started
    };

    inline bool succeeded(const ExecutionOutcome& outcome) {
        return std::holds_alternative<ExecutionSuccess>(outcome.result);
    }

    inline const ExecutionSuccess* as_success(const ExecutionOutcome& outcome) {
        return std::get_if<ExecutionSuccess>(&outcome.result);
    }

    inline const ExecutionFailure* as_failure(const ExecutionOutcome& outcome) {
        return std::get_if<ExecutionFailure>(&outcome.result);
    }

    inline const std::string& stdout_of(const ExecutionOutcome& outcome) {
        if (const auto* success = as_success(outcome)) {
            return success->stdout_text;
        }
        return std::get<ExecutionFailure>(outcome.result).stdout_text;
    }

    inline const std::string& stderr_of(const ExecutionOutcome& outcome) {
        if (const auto* success = as_success(outcome)) {
            return success->stderr_text;
        }
        return std::get<ExecutionFailure>(outcome.result).stderr_text;
    }

    struct SupervisorStats {
        std::uint64_t execution_count = 0;
        std::uint64_t restart_count = 0;
        bool process_alive = false;
        std::uint64_t total_executions = 0;
        std::optional<int> worker_pid;
    };

} // namespace snipvisor::protocol
