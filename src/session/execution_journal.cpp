#include "session/execution_journal.hpp"

#include <chrono>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/wire_protocol.hpp"

namespace snipvisor::session {

using core::errors::ErrorCategory;
using core::errors::SupervisorError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json make_event(const std::string& kind, const std::string& instance_id, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = kind;
    event["instance_id"] = instance_id;
    event["payload"] = std::move(payload);
    return event;
}

std::string dump_line(const json& event) {
    return event.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

ExecutionJournal::ExecutionJournal(std::filesystem::path journal_path)
    : journal_path_(std::move(journal_path)) {}

core::errors::Result<std::filesystem::path> ExecutionJournal::append_event(
    const std::string& event_json) const {
    if (journal_path_.empty()) {
        return SupervisorError{ErrorCategory::Input, "Journal path cannot be empty.",
                               "invalid_journal_path"};
    }

    std::error_code ec;
    const auto parent = journal_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return SupervisorError{ErrorCategory::Internal,
                                   "Unable to create journal directory: " + parent.string(),
                                   "journal_dir_create_failed"};
        }
    }

    std::ofstream out(journal_path_, std::ios::app);
    if (!out.is_open()) {
        return SupervisorError{ErrorCategory::Internal,
                               "Unable to open journal file: " + journal_path_.string(),
                               "journal_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return SupervisorError{ErrorCategory::Internal,
                               "Unable to write journal event: " + journal_path_.string(),
                               "journal_write_failed"};
    }

    return journal_path_;
}

core::errors::Result<std::filesystem::path> ExecutionJournal::write_request(
    const std::string& instance_id, const protocol::ExecutionRequest& request) const {
    json payload;
    payload["code"] = request.code;
    payload["input"] = request.input.has_value() ? json(request.input.value()) : json(nullptr);
    payload["reset_modules"] = request.reset_modules;
    return append_event(dump_line(make_event("request", instance_id, std::move(payload))));
}

core::errors::Result<std::filesystem::path> ExecutionJournal::write_outcome(
    const std::string& instance_id, const protocol::ExecutionOutcome& outcome) const {
    return append_event(
        dump_line(make_event("outcome", instance_id, protocol::outcome_to_json(outcome))));
}

core::errors::Result<std::filesystem::path> ExecutionJournal::write_error(
    const std::string& instance_id, const core::errors::SupervisorError& error) const {
    return append_event(
        dump_line(make_event("error", instance_id, protocol::error_to_json(error))));
}

core::errors::Result<std::filesystem::path> ExecutionJournal::write_stats(
    const std::string& instance_id, const protocol::SupervisorStats& stats) const {
    return append_event(
        dump_line(make_event("stats", instance_id, protocol::stats_to_json(stats))));
}

}  // namespace snipvisor::session
