#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/config/supervisor_config.hpp"
#include "core/errors/supervisor_errors.hpp"

namespace snipvisor::app::cli {

    enum class Command {
        Exec,     // run one snippet and exit
        Session   // one request per stdin line, one supervisor for all of them
    };

    struct CliOptions {
        Command command = Command::Exec;
        std::optional<std::string> code;
        std::optional<std::string> input;
        core::config::SupervisorConfig supervisor;
        std::optional<std::filesystem::path> journal;
        bool verbose = false;
    };

    snipvisor::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    // snipvisor_worker next to the running executable.
    std::filesystem::path default_worker_path();
}
