#include "cli_parser.hpp"
#include <charconv>
#include <system_error>
#include <vector>
#include "session/session_scope.hpp"

namespace harbor::app::cli {

    using namespace harbor::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> task;
        std::optional<std::string> session;
        std::optional<std::string> config;
        std::optional<std::string> cache_root;
        std::optional<std::string> max_iterations;
        std::optional<std::string> max_retries;
        std::optional<std::string> backend_cmd;
        std::optional<std::string> script;
        bool verbose = false;
    };

    namespace {

        // Exception-free integer parsing
        Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                            std::uint32_t min, std::uint32_t max) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            if (value < min || value > max) {
                return AgentError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                  "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

        bool is_run_only(const std::string& flag) {
            return flag == "--task" || flag == "--config" || flag == "--max-iterations" ||
                   flag == "--max-retries" || flag == "--backend-cmd" || flag == "--script";
        }

    }

    std::string usage() {
        return "Usage:\n"
               "  harbor run --task \"...\" (--backend-cmd CMD | --script FILE) [--session ID]\n"
               "             [--config FILE] [--cache-root DIR] [--max-iterations N]\n"
               "             [--max-retries N] [--verbose]\n"
               "  harbor cleanup --session ID [--cache-root DIR] [--verbose]";
    }

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        CliCommand cmd;
        std::string command = argv[1];
        if (command == "run") {
            cmd.kind = CommandKind::Run;
        } else if (command == "cleanup") {
            cmd.kind = CommandKind::Cleanup;
        } else {
            return AgentError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands are 'run' and 'cleanup'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (cmd.kind == CommandKind::Cleanup && is_run_only(flag)) {
                return AgentError{ErrorCategory::Input, "Argument not valid for cleanup: " + flag, "unknown_argument"};
            }

            std::optional<std::string>* target = nullptr;
            if (flag == "--task") target = &raw.task;
            else if (flag == "--session") target = &raw.session;
            else if (flag == "--config") target = &raw.config;
            else if (flag == "--cache-root") target = &raw.cache_root;
            else if (flag == "--max-iterations") target = &raw.max_iterations;
            else if (flag == "--max-retries") target = &raw.max_retries;
            else if (flag == "--backend-cmd") target = &raw.backend_cmd;
            else if (flag == "--script") target = &raw.script;
            else if (flag == "--verbose") {
                raw.verbose = true;
                continue;
            } else {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }

            if (i + 1 >= args.size()) {
                return AgentError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            *target = args[++i];
        }

        // 3. Validator Phase: Enforce logic and bounds
        cmd.verbose = raw.verbose;

        if (raw.session) {
            auto valid = harbor::session::SessionScope::validate_session_id(raw.session.value());
            if (is_error(valid)) {
                return get_error(valid);
            }
            cmd.session_id = raw.session.value();
        }
        if (raw.cache_root) {
            if (raw.cache_root->empty()) {
                return AgentError{ErrorCategory::Input, "--cache-root cannot be empty", "invalid_path"};
            }
            cmd.cache_root = std::filesystem::path(raw.cache_root.value());
        }

        if (cmd.kind == CommandKind::Cleanup) {
            if (!cmd.session_id) {
                return AgentError{ErrorCategory::Input, "cleanup requires --session", "missing_required_flag"};
            }
            return cmd;
        }

        if (!raw.task.has_value() || raw.task->empty()) {
            return AgentError{ErrorCategory::Input, "Must provide --task", "missing_required_flag"};
        }
        cmd.task = raw.task.value();

        // Mutual Exclusion XOR check
        if (!raw.backend_cmd.has_value() && !raw.script.has_value()) {
            return AgentError{ErrorCategory::Input, "Must provide either --backend-cmd or --script", "missing_required_flag"};
        }
        if (raw.backend_cmd.has_value() && raw.script.has_value()) {
            return AgentError{ErrorCategory::Input, "Cannot provide both --backend-cmd and --script", "conflicting_flags"};
        }

        if (raw.backend_cmd) {
            if (raw.backend_cmd->empty()) {
                return AgentError{ErrorCategory::Input, "--backend-cmd cannot be empty", "missing_value"};
            }
            cmd.backend_command = raw.backend_cmd.value();
        }

        // Path validation
        if (raw.script) {
            std::filesystem::path p(raw.script.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return AgentError{ErrorCategory::Input, "Script file does not exist or is not a regular file", "invalid_path"};
            }
            cmd.script_file = std::move(p);
        }
        if (raw.config) {
            std::filesystem::path p(raw.config.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return AgentError{ErrorCategory::Input, "Config file does not exist or is not a regular file", "invalid_path"};
            }
            cmd.config_file = std::move(p);
        }

        if (raw.max_iterations) {
            auto parsed = parse_bounded("--max-iterations", raw.max_iterations.value(), 1, 1000);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            cmd.max_iterations = get_value(parsed);
        }
        if (raw.max_retries) {
            auto parsed = parse_bounded("--max-retries", raw.max_retries.value(), 0, 20);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            cmd.max_retries = get_value(parsed);
        }

        return cmd;
    }

} // namespace harbor::app::cli
