#pragma once
#include <string>
#include <variant>

namespace snipvisor::core::errors {

    enum class ErrorCategory {
        Startup,        // Worker never produced the READY sentinel
        ProcessDied,    // Pipe broke, EOF, timeout or the worker exited
        Protocol,       // Response line could not be decoded
        Configuration,  // Worker launch settings are missing or invalid
        Input,          // Caller or CLI supplied something unusable
        Internal        // System call failure or misuse of a shut down supervisor
    };

    struct SupervisorError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // Holds either a value of type T or a SupervisorError.
    template <typename T>
    using Result = std::variant<T, SupervisorError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<SupervisorError>(result);
    }

    template <typename T>
    const SupervisorError& get_error(const Result<T>& result) {
        return std::get<SupervisorError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Infrastructure failures clear up after a worker restart; everything
    // else needs the caller or the deployment to change.
    inline bool is_retryable(const SupervisorError& error) {
        switch (error.category) {
            case ErrorCategory::Startup:
            case ErrorCategory::ProcessDied:
            case ErrorCategory::Protocol:
                return true;
            default:
                return false;
        }
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Startup: return "startup";
            case ErrorCategory::ProcessDied: return "process_died";
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Configuration: return "configuration";
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace snipvisor::core::errors
