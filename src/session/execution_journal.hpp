#pragma once

#include <filesystem>
#include <string>
#include "core/errors/supervisor_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace snipvisor::session {

// Append-only JSONL record of what a supervisor was asked to run and what
// came back. One event per line.
class ExecutionJournal {
public:
    explicit ExecutionJournal(std::filesystem::path journal_path);

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& instance_id, const protocol::ExecutionRequest& request) const;

    core::errors::Result<std::filesystem::path> write_outcome(
        const std::string& instance_id, const protocol::ExecutionOutcome& outcome) const;

    core::errors::Result<std::filesystem::path> write_error(
        const std::string& instance_id, const core::errors::SupervisorError& error) const;

    core::errors::Result<std::filesystem::path> write_stats(
        const std::string& instance_id, const protocol::SupervisorStats& stats) const;

    const std::filesystem::path& path() const { return journal_path_; }

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& event_json) const;

    std::filesystem::path journal_path_;
};

}  // namespace snipvisor::session
