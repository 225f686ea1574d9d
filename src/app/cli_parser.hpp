#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace harbor::app::cli {

    enum class CommandKind {
        Run,
        Cleanup
    };

    // Validated command line. Optional fields override the config file.
    struct CliCommand {
        CommandKind kind = CommandKind::Run;
        std::string task;
        std::optional<std::string> session_id;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> cache_root;
        std::optional<std::uint32_t> max_iterations;
        std::optional<std::uint32_t> max_retries;
        std::optional<std::string> backend_command;
        std::optional<std::filesystem::path> script_file;
        bool verbose = false;
    };

    harbor::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
