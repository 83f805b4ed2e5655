#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/errors/supervisor_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/wire_protocol.hpp"
#include "runtime/executor_supervisor.hpp"
#include "session/execution_journal.hpp"

namespace {

using snipvisor::core::errors::ErrorCategory;
using snipvisor::core::errors::SupervisorError;
using snipvisor::core::errors::get_error;
using snipvisor::core::errors::get_value;
using snipvisor::core::errors::is_error;

int exit_code_for(const SupervisorError& error) {
    switch (error.category) {
        case ErrorCategory::Input: return 2;
        case ErrorCategory::Configuration: return 4;
        default: return 3;
    }
}

void print_line(const nlohmann::json& record) {
    std::cout << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void journal_or_warn(const std::optional<snipvisor::session::ExecutionJournal>& journal,
                     const snipvisor::core::errors::Result<std::filesystem::path>& written) {
    if (journal && is_error(written)) {
        const auto& err = get_error(written);
        SNIPVISOR_LOG_WARN("Journal write failed [" + err.code + "]: " + err.message);
    }
}

// Runs one request and prints either the outcome or the error as one JSON line.
// Returns the process exit code for this request.
int run_one(snipvisor::runtime::ExecutorSupervisor& supervisor,
            const std::optional<snipvisor::session::ExecutionJournal>& journal,
            const snipvisor::protocol::ExecutionRequest& request) {
    if (journal) {
        journal_or_warn(journal, journal->write_request(supervisor.instance_id(), request));
    }

    auto executed = supervisor.execute(request);
    if (is_error(executed)) {
        const auto& err = get_error(executed);
        SNIPVISOR_LOG_ERROR("Execution failed [" + err.code + "]: " + err.message);
        if (journal) {
            journal_or_warn(journal, journal->write_error(supervisor.instance_id(), err));
        }
        print_line(snipvisor::protocol::error_to_json(err));
        return exit_code_for(err);
    }

    const auto& outcome = get_value(executed);
    if (journal) {
        journal_or_warn(journal, journal->write_outcome(supervisor.instance_id(), outcome));
    }
    print_line(snipvisor::protocol::outcome_to_json(outcome));
    return outcome.exit_code;
}

int run_session(snipvisor::runtime::ExecutorSupervisor& supervisor,
                const std::optional<snipvisor::session::ExecutionJournal>& journal) {
    int last_exit = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        auto decoded = snipvisor::protocol::decode_request(line);
        if (is_error(decoded)) {
            const auto& err = get_error(decoded);
            SNIPVISOR_LOG_WARN("Skipping malformed request: " + err.message);
            print_line(snipvisor::protocol::error_to_json(err));
            last_exit = 2;
            continue;
        }
        const auto& wire = get_value(decoded);
        snipvisor::protocol::ExecutionRequest request;
        request.code = wire.code;
        request.input = wire.input;
        request.reset_modules = wire.reset_modules;
        last_exit = run_one(supervisor, journal, request);
    }
    return last_exit;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = snipvisor::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        const auto& err = get_error(parsed);
        SNIPVISOR_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            SNIPVISOR_LOG_INFO("Hint: " + err.hint);
        }
        return exit_code_for(err);
    }

    const auto& options = get_value(parsed);
    if (options.verbose) {
        snipvisor::core::logging::Logger::get().set_min_level(
            snipvisor::core::logging::LogLevel::DEBUG);
    }

    snipvisor::runtime::ExecutorSupervisor supervisor(options.supervisor);
    snipvisor::core::logging::Logger::get().set_instance_tag(supervisor.instance_id());
    SNIPVISOR_LOG_DEBUG("Isolation tier settings: max_executions=" +
                        std::to_string(options.supervisor.isolation.max_executions_before_restart) +
                        " gc_every=" +
                        std::to_string(options.supervisor.isolation.forced_gc_every_n));

    std::optional<snipvisor::session::ExecutionJournal> journal;
    if (options.journal) {
        journal.emplace(options.journal.value());
        SNIPVISOR_LOG_INFO("Journal: " + journal->path().string());
    }

    int exit_code = 0;
    if (options.command == snipvisor::app::cli::Command::Exec) {
        snipvisor::protocol::ExecutionRequest request;
        request.code = options.code.value_or("");
        request.input = options.input;
        request.reset_modules = options.supervisor.isolation.reset_imported_modules;
        exit_code = run_one(supervisor, journal, request);
    } else {
        exit_code = run_session(supervisor, journal);
    }

    const auto stats = supervisor.stats();
    SNIPVISOR_LOG_INFO("Executions: " + std::to_string(stats.total_executions) +
                       ", restarts: " + std::to_string(stats.restart_count));
    if (journal) {
        journal_or_warn(journal, journal->write_stats(supervisor.instance_id(), stats));
    }

    supervisor.shutdown();
    return exit_code;
}
