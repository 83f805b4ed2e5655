#include <string>
#include <variant>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/supervisor_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/wire_protocol.hpp"

namespace {

using snipvisor::core::errors::ErrorCategory;
using snipvisor::core::errors::SupervisorError;
using snipvisor::core::errors::get_error;
using snipvisor::core::errors::get_value;
using snipvisor::core::errors::is_error;
using snipvisor::protocol::ExecutionFailure;
using snipvisor::protocol::ExecutionOutcome;
using snipvisor::protocol::ExecutionSuccess;
using snipvisor::protocol::SupervisorStats;
using snipvisor::protocol::WireRequest;
using nlohmann::json;

namespace protocol = snipvisor::protocol;

TEST(WireProtocolTest, EncodesRequestWithWireFieldNames) {
    WireRequest request;
    request.code = "result = 1 + 1";
    request.input = "stdin text";
    request.reset_modules = true;
    request.reset_search_path = false;
    request.collect_garbage = true;

    const std::string line = protocol::encode_request(request);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    const auto payload = json::parse(line);
    EXPECT_EQ(payload.at("code").get<std::string>(), "result = 1 + 1");
    EXPECT_EQ(payload.at("input").get<std::string>(), "stdin text");
    EXPECT_TRUE(payload.at("resetModules").get<bool>());
    EXPECT_FALSE(payload.at("resetSearchPath").get<bool>());
    EXPECT_TRUE(payload.at("collectGarbage").get<bool>());
}

TEST(WireProtocolTest, OmitsAbsentInput) {
    WireRequest request;
    request.code = "x = 1";
    const auto payload = json::parse(protocol::encode_request(request));
    EXPECT_FALSE(payload.contains("input"));
}

TEST(WireProtocolTest, EscapesNewlinesInsideCode) {
    WireRequest request;
    request.code = "a = 1\nb = 2\n";
    const std::string line = protocol::encode_request(request);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    auto decoded = protocol::decode_request(line);
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded).code, "a = 1\nb = 2\n");
}

TEST(WireProtocolTest, DecodeRequestAppliesDefaults) {
    auto decoded = protocol::decode_request(R"({"code": "x = 1"})");
    ASSERT_FALSE(is_error(decoded));
    const auto& request = get_value(decoded);
    EXPECT_EQ(request.code, "x = 1");
    EXPECT_FALSE(request.input.has_value());
    EXPECT_FALSE(request.reset_modules);
    EXPECT_TRUE(request.reset_search_path);
    EXPECT_FALSE(request.collect_garbage);
}

TEST(WireProtocolTest, DecodeRequestRejectsWrongTypes) {
    auto not_json = protocol::decode_request("not json");
    ASSERT_TRUE(is_error(not_json));
    EXPECT_EQ(get_error(not_json).code, "malformed_request");

    auto bad_code = protocol::decode_request(R"({"code": 5})");
    ASSERT_TRUE(is_error(bad_code));
    EXPECT_EQ(get_error(bad_code).code, "malformed_request");

    auto bad_switch = protocol::decode_request(R"({"code": "x", "resetModules": "yes"})");
    ASSERT_TRUE(is_error(bad_switch));
    EXPECT_EQ(get_error(bad_switch).category, ErrorCategory::Protocol);
}

TEST(WireProtocolTest, DecodesSuccessResponse) {
    auto decoded = protocol::decode_response(
        R"({"stdout": "hi", "stderr": "", "bindings": {"result": "2", "n": 3}})");
    ASSERT_FALSE(is_error(decoded));
    const auto* success = std::get_if<ExecutionSuccess>(&get_value(decoded));
    ASSERT_NE(success, nullptr);
    EXPECT_EQ(success->stdout_text, "hi");
    EXPECT_EQ(success->bindings.at("result"), "2");
    EXPECT_EQ(success->bindings.at("n"), "3");
}

TEST(WireProtocolTest, DecodesCompleteFailureResponse) {
    auto decoded = protocol::decode_response(
        R"({"error": "division by zero", "trace": "tb", "stdout": "", "stderr": ""})");
    ASSERT_FALSE(is_error(decoded));
    const auto* failure = std::get_if<ExecutionFailure>(&get_value(decoded));
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->message, "division by zero");
    EXPECT_EQ(failure->trace, "tb");
    EXPECT_TRUE(failure->stdout_text.empty());
}

TEST(WireProtocolTest, FailureResponseRequiresEveryField) {
    const char* lines[] = {
        R"({"error": "x"})",
        R"({"error": "x", "trace": "tb", "stdout": ""})",
        R"({"error": "x", "stdout": "", "stderr": ""})"};
    for (const char* line : lines) {
        auto decoded = protocol::decode_response(line);
        ASSERT_TRUE(is_error(decoded)) << line;
        EXPECT_EQ(get_error(decoded).category, ErrorCategory::Protocol) << line;
        EXPECT_EQ(get_error(decoded).code, "malformed_response") << line;
    }
}

TEST(WireProtocolTest, ErrorFieldWinsOverSuccessFields) {
    auto decoded = protocol::decode_response(
        R"({"error": "boom", "trace": "tb", "stdout": "partial", "stderr": "", "bindings": {}})");
    ASSERT_FALSE(is_error(decoded));
    const auto* failure = std::get_if<ExecutionFailure>(&get_value(decoded));
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->trace, "tb");
    EXPECT_EQ(failure->stdout_text, "partial");
}

TEST(WireProtocolTest, RejectsMalformedResponses) {
    const char* lines[] = {
        "this is not json",
        "[1, 2, 3]",
        R"({"stdout": "only stdout"})",
        R"({"stdout": 1, "stderr": "", "bindings": {}})",
        R"({"stdout": "", "stderr": "", "bindings": []})",
        R"({"error": 42})",
        R"({"error": "x", "trace": 7, "stdout": "", "stderr": ""})"};
    for (const char* line : lines) {
        auto decoded = protocol::decode_response(line);
        ASSERT_TRUE(is_error(decoded)) << line;
        EXPECT_EQ(get_error(decoded).category, ErrorCategory::Protocol) << line;
        EXPECT_EQ(get_error(decoded).code, "malformed_response") << line;
    }
}

TEST(WireProtocolTest, EncodedResponseDecodesToSameResult) {
    ExecutionFailure failure{"name 'x' is not defined", "Traceback ...", "out", "err"};
    auto decoded = protocol::decode_response(protocol::encode_response(failure));
    ASSERT_FALSE(is_error(decoded));
    const auto* back = std::get_if<ExecutionFailure>(&get_value(decoded));
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(back->message, failure.message);
    EXPECT_EQ(back->trace, failure.trace);
    EXPECT_EQ(back->stdout_text, failure.stdout_text);
    EXPECT_EQ(back->stderr_text, failure.stderr_text);
}

TEST(WireProtocolTest, InvalidUtf8IsReplacedNotThrown) {
    ExecutionSuccess success;
    success.stdout_text = std::string("bad \xff byte");
    std::string line;
    EXPECT_NO_THROW(line = protocol::encode_response(success));
    EXPECT_FALSE(is_error(protocol::decode_response(line)));
}

TEST(WireProtocolTest, RecognizesReadySentinel) {
    EXPECT_TRUE(protocol::is_ready_line("READY"));
    EXPECT_TRUE(protocol::is_ready_line("READY\r\n"));
    EXPECT_FALSE(protocol::is_ready_line("READY!"));
    EXPECT_FALSE(protocol::is_ready_line(""));
}

TEST(WireProtocolTest, OutcomeJsonCarriesBookkeeping) {
    ExecutionOutcome outcome;
    ExecutionSuccess success;
    success.stdout_text = "hi";
    outcome.result = success;
    outcome.exit_code = 0;
    outcome.execution_count = 7;

    const auto payload = protocol::outcome_to_json(outcome);
    EXPECT_TRUE(payload.at("ok").get<bool>());
    EXPECT_EQ(payload.at("exit_code").get<int>(), 0);
    EXPECT_EQ(payload.at("execution_count").get<std::uint64_t>(), 7u);
    EXPECT_EQ(payload.at("stdout").get<std::string>(), "hi");
}

TEST(WireProtocolTest, StatsAndErrorJson) {
    SupervisorStats stats;
    stats.execution_count = 2;
    stats.restart_count = 1;
    const auto stats_json = protocol::stats_to_json(stats);
    EXPECT_EQ(stats_json.at("restart_count").get<std::uint64_t>(), 1u);
    EXPECT_TRUE(stats_json.at("worker_pid").is_null());

    const auto error_json = protocol::error_to_json(
        SupervisorError{ErrorCategory::ProcessDied, "gone", "worker_eof"});
    EXPECT_EQ(error_json.at("category").get<std::string>(), "process_died");
    EXPECT_EQ(error_json.at("code").get<std::string>(), "worker_eof");
    EXPECT_TRUE(error_json.at("retryable").get<bool>());
    EXPECT_FALSE(error_json.contains("hint"));
}

TEST(WireProtocolTest, ExtractsPythonFenceFirst) {
    const std::string text =
        "Here:\n```\nplain = 1\n```\nand\n```python\nresult = 2\n```\n";
    auto code = protocol::extract_code_block(text);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(code.value(), "result = 2");
}

TEST(WireProtocolTest, ExtractsPlainFence) {
    auto code = protocol::extract_code_block("```\nx = 1\n```");
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(code.value(), "x = 1");
}

TEST(WireProtocolTest, NoFenceOrEmptyFenceYieldsNothing) {
    EXPECT_FALSE(protocol::extract_code_block("just prose").has_value());
    EXPECT_FALSE(protocol::extract_code_block("```python\n   \n```").has_value());
}

}  // namespace
