#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace snipvisor::app::cli {

    using namespace snipvisor::core::errors;
    using snipvisor::core::config::IsolationTier;

    // Raw option strings, before validation.
    struct RawCliOptions {
        std::optional<std::string> code;
        std::optional<std::string> code_file;
        std::optional<std::string> input;
        std::optional<std::string> tier;
        std::optional<std::string> max_executions;
        std::optional<std::string> gc_every;
        std::optional<std::string> worker;
        std::optional<std::string> startup_timeout_ms;
        std::optional<std::string> response_timeout_ms;
        std::optional<std::string> journal;
        bool reset_modules = false;
        bool no_reset_search_path = false;
        bool verbose = false;
    };

    namespace {

        Result<std::uint64_t> parse_unsigned(const std::string& text, const std::string& flag) {
            std::uint64_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end || text.empty()) {
                return SupervisorError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            return value;
        }

        Result<std::uint32_t> parse_timeout(const std::string& text, const std::string& flag, bool allow_zero) {
            auto parsed = parse_unsigned(text, flag);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            const std::uint64_t value = get_value(parsed);
            if ((!allow_zero && value == 0) || value > 3600000) {
                return SupervisorError{ErrorCategory::Input, flag + " out of bounds", "bounds_error", "Must be at most 3600000 milliseconds."};
            }
            return static_cast<std::uint32_t>(value);
        }

    } // namespace

    std::filesystem::path default_worker_path() {
        std::error_code ec;
        const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (ec) {
            return "snipvisor_worker";
        }
        return self.parent_path() / "snipvisor_worker";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return SupervisorError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: snipvisor exec --code \"...\" | snipvisor session"};
        }

        CliOptions options;
        std::string command = argv[1];
        if (command == "exec") {
            options.command = Command::Exec;
        } else if (command == "session") {
            options.command = Command::Session;
        } else {
            return SupervisorError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: exec, session."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 1. Parser phase: collect raw strings.
        const std::pair<const char*, std::optional<std::string>*> valued_flags[] = {
            {"--code", &raw.code},
            {"--code-file", &raw.code_file},
            {"--input", &raw.input},
            {"--tier", &raw.tier},
            {"--max-executions", &raw.max_executions},
            {"--gc-every", &raw.gc_every},
            {"--worker", &raw.worker},
            {"--startup-timeout-ms", &raw.startup_timeout_ms},
            {"--response-timeout-ms", &raw.response_timeout_ms},
            {"--journal", &raw.journal}};

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--reset-modules") {
                raw.reset_modules = true;
                continue;
            }
            if (args[i] == "--no-reset-search-path") {
                raw.no_reset_search_path = true;
                continue;
            }
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }

            bool matched = false;
            for (const auto& [flag, target] : valued_flags) {
                if (args[i] != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return SupervisorError{ErrorCategory::Input, std::string("Missing value for ") + flag, "missing_value"};
                }
                *target = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return SupervisorError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 2. Validator phase.
        options.verbose = raw.verbose;

        if (raw.code.has_value() && raw.code_file.has_value()) {
            return SupervisorError{ErrorCategory::Input, "Cannot provide both --code and --code-file", "conflicting_flags"};
        }
        if (options.command == Command::Session && (raw.code.has_value() || raw.code_file.has_value() || raw.input.has_value())) {
            return SupervisorError{ErrorCategory::Input, "session reads requests from stdin; --code, --code-file and --input are exec-only", "conflicting_flags"};
        }
        if (options.command == Command::Exec && !raw.code.has_value() && !raw.code_file.has_value() && !raw.input.has_value()) {
            return SupervisorError{ErrorCategory::Input, "Must provide --code, --code-file or --input", "missing_required_flag"};
        }

        if (raw.code) options.code = raw.code.value();
        if (raw.input) options.input = raw.input.value();
        if (raw.code_file) {
            std::ifstream in(raw.code_file.value());
            if (!in.is_open()) {
                return SupervisorError{ErrorCategory::Input, "Cannot read code file: " + raw.code_file.value(), "invalid_path"};
            }
            std::ostringstream buffer;
            buffer << in.rdbuf();
            options.code = buffer.str();
        }

        IsolationTier tier = IsolationTier::PersistentIsolated;
        if (raw.tier) {
            auto parsed = core::config::parse_tier(raw.tier.value());
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            tier = get_value(parsed);
        }
        auto& isolation = options.supervisor.isolation;
        isolation = core::config::preset(tier);

        if (raw.max_executions) {
            if (raw.max_executions.value() == "unbounded") {
                isolation.max_executions_before_restart = core::config::kUnboundedExecutions;
            } else {
                auto parsed = parse_unsigned(raw.max_executions.value(), "--max-executions");
                if (is_error(parsed)) {
                    return get_error(parsed);
                }
                if (get_value(parsed) == 0) {
                    return SupervisorError{ErrorCategory::Input, "--max-executions out of bounds", "bounds_error", "Must be at least 1, or 'unbounded'."};
                }
                isolation.max_executions_before_restart = get_value(parsed);
            }
        }
        if (raw.gc_every) {
            auto parsed = parse_unsigned(raw.gc_every.value(), "--gc-every");
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            isolation.forced_gc_every_n = get_value(parsed);
        }
        if (raw.reset_modules) isolation.reset_imported_modules = true;
        if (raw.no_reset_search_path) isolation.reset_search_path = false;

        if (raw.startup_timeout_ms) {
            auto parsed = parse_timeout(raw.startup_timeout_ms.value(), "--startup-timeout-ms", false);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            options.supervisor.startup_timeout_ms = get_value(parsed);
        }
        if (raw.response_timeout_ms) {
            auto parsed = parse_timeout(raw.response_timeout_ms.value(), "--response-timeout-ms", true);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            options.supervisor.response_timeout_ms = get_value(parsed);
        }

        // Worker path
        const std::filesystem::path worker = raw.worker ? std::filesystem::path(raw.worker.value()) : default_worker_path();
        options.supervisor.worker_command = {worker.string()};
        if (options.verbose) {
            options.supervisor.worker_command.push_back("--verbose");
        }

        auto validated = core::config::validate(options.supervisor);
        if (is_error(validated)) {
            return get_error(validated);
        }

        if (raw.journal) options.journal = std::filesystem::path(raw.journal.value());

        return options;
    }

} // namespace snipvisor::app::cli
