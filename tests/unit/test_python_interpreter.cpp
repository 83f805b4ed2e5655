#include <memory>
#include <string>
#include <variant>
#include <gtest/gtest.h>
#include "core/errors/supervisor_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "worker/python_interpreter.hpp"

namespace {

using snipvisor::core::errors::is_error;
using snipvisor::protocol::ExecutionFailure;
using snipvisor::protocol::ExecutionSuccess;
using snipvisor::worker::PythonInterpreter;

// The embedded runtime can only be initialized once per process, so every
// test shares one interpreter.
class PythonInterpreterTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        auto created = PythonInterpreter::create();
        ASSERT_FALSE(is_error(created));
        interpreter_ = std::move(std::get<std::unique_ptr<PythonInterpreter>>(created));
    }

    static void TearDownTestSuite() { interpreter_.reset(); }

    static std::unique_ptr<PythonInterpreter> interpreter_;
};

std::unique_ptr<PythonInterpreter> PythonInterpreterTest::interpreter_;

TEST_F(PythonInterpreterTest, ReportsLocalsAsBindings) {
    ASSERT_NE(interpreter_, nullptr);
    const auto result = interpreter_->evaluate("result = 1 + 1\nname = 'x'", "");
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(result));
    const auto& success = std::get<ExecutionSuccess>(result);
    EXPECT_EQ(success.bindings.at("result"), "2");
    EXPECT_EQ(success.bindings.at("name"), "x");
    EXPECT_EQ(success.stdout_text, "");
}

TEST_F(PythonInterpreterTest, CapturesPrintedOutput) {
    ASSERT_NE(interpreter_, nullptr);
    const auto result = interpreter_->evaluate(
        "import sys\nprint('hi')\nprint('warn', file=sys.stderr)", "");
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(result));
    const auto& success = std::get<ExecutionSuccess>(result);
    EXPECT_EQ(success.stdout_text, "hi");
    EXPECT_EQ(success.stderr_text, "warn");
}

TEST_F(PythonInterpreterTest, RaisedExceptionsBecomeFailures) {
    ASSERT_NE(interpreter_, nullptr);
    const auto result = interpreter_->evaluate("print('before')\n1/0", "");
    ASSERT_TRUE(std::holds_alternative<ExecutionFailure>(result));
    const auto& failure = std::get<ExecutionFailure>(result);
    EXPECT_EQ(failure.message, "division by zero");
    EXPECT_NE(failure.trace.find("ZeroDivisionError"), std::string::npos);
    EXPECT_EQ(failure.stdout_text, "before");
}

TEST_F(PythonInterpreterTest, SyntaxErrorsBecomeFailures) {
    ASSERT_NE(interpreter_, nullptr);
    const auto result = interpreter_->evaluate("def broken(:\n    pass", "");
    ASSERT_TRUE(std::holds_alternative<ExecutionFailure>(result));
    EXPECT_NE(std::get<ExecutionFailure>(result).trace.find("SyntaxError"),
              std::string::npos);
}

TEST_F(PythonInterpreterTest, InputIsReadableAsStdin) {
    ASSERT_NE(interpreter_, nullptr);
    const auto result = interpreter_->evaluate("line = input()", "hello\nworld");
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(result));
    EXPECT_EQ(std::get<ExecutionSuccess>(result).bindings.at("line"), "hello");
}

TEST_F(PythonInterpreterTest, BindingsDoNotLeakBetweenSnippets) {
    ASSERT_NE(interpreter_, nullptr);
    const auto first = interpreter_->evaluate("leaked = 41", "");
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(first));

    const auto second = interpreter_->evaluate("value = leaked + 1", "");
    ASSERT_TRUE(std::holds_alternative<ExecutionFailure>(second));
    EXPECT_NE(std::get<ExecutionFailure>(second).trace.find("NameError"), std::string::npos);
}

TEST_F(PythonInterpreterTest, RestoreTruncatesSearchPath) {
    ASSERT_NE(interpreter_, nullptr);
    const auto snapshot = interpreter_->snapshot(false);
    const auto added = interpreter_->evaluate(
        "import sys\nsys.path.append('/tmp/snipvisor-a')\nsys.path.append('/tmp/snipvisor-b')",
        "");
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(added));

    const auto report = interpreter_->restore(snapshot, true);
    EXPECT_EQ(report.search_path_entries_removed, 2u);

    const auto check = interpreter_->evaluate(
        "import sys\nfound = '/tmp/snipvisor-a' in sys.path", "");
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(check));
    EXPECT_EQ(std::get<ExecutionSuccess>(check).bindings.at("found"), "False");
}

TEST_F(PythonInterpreterTest, SearchPathSurvivesWhenResetDisabled) {
    ASSERT_NE(interpreter_, nullptr);
    const auto snapshot = interpreter_->snapshot(false);
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(interpreter_->evaluate(
        "import sys\nsys.path.append('/tmp/snipvisor-keep')", "")));

    const auto report = interpreter_->restore(snapshot, false);
    EXPECT_EQ(report.search_path_entries_removed, 0u);

    const auto check = interpreter_->evaluate(
        "import sys\nfound = '/tmp/snipvisor-keep' in sys.path\n"
        "sys.path.remove('/tmp/snipvisor-keep')",
        "");
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(check));
    EXPECT_EQ(std::get<ExecutionSuccess>(check).bindings.at("found"), "True");
}

TEST_F(PythonInterpreterTest, RestoreUnloadsNewModules) {
    ASSERT_NE(interpreter_, nullptr);
    const auto snapshot = interpreter_->snapshot(true);
    ASSERT_TRUE(snapshot.loaded_modules.has_value());
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(
        interpreter_->evaluate("import colorsys", "")));

    const auto report = interpreter_->restore(snapshot, true);
    EXPECT_GE(report.modules_unloaded, 1u);

    const auto check = interpreter_->evaluate(
        "import sys\nloaded = 'colorsys' in sys.modules", "");
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(check));
    EXPECT_EQ(std::get<ExecutionSuccess>(check).bindings.at("loaded"), "False");
}

TEST_F(PythonInterpreterTest, CollectGarbageIsSafeBetweenSnippets) {
    ASSERT_NE(interpreter_, nullptr);
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(
        interpreter_->evaluate("a = []\na.append(a)\ndel a", "")));
    interpreter_->collect_garbage();
    const auto after = interpreter_->evaluate("ok = True", "");
    ASSERT_TRUE(std::holds_alternative<ExecutionSuccess>(after));
    EXPECT_EQ(std::get<ExecutionSuccess>(after).bindings.at("ok"), "True");
}

}  // namespace
