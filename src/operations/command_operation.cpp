#include "operations/command_operation.hpp"

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"
#include "operations/filesystem_operations.hpp"
#include "session/session_scope.hpp"

namespace harbor::operations {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::OperationContext;
using protocol::OperationResult;

namespace {

constexpr std::size_t kMaxCapturedBytes = 16 * 1024;
constexpr const char* kDirectMethod = "direct_binary_execution";
constexpr const char* kLoginShellMethod = "login_shell_execution";

std::string truncate_output(const std::string& text) {
    if (text.size() <= kMaxCapturedBytes) {
        return text;
    }
    return text.substr(0, kMaxCapturedBytes) + "\n... [truncated]";
}

// "command" plus the optional "arguments" (string or array of strings).
std::optional<std::string> command_line(const OperationContext& context) {
    auto command = string_parameter(context, "command");
    if (!command.has_value()) {
        return std::nullopt;
    }
    std::string line = command.value();

    auto it = context.parameters.find("arguments");
    if (it != context.parameters.end()) {
        if (it->is_string() && !it->get<std::string>().empty()) {
            line += " " + it->get<std::string>();
        } else if (it->is_array()) {
            for (const auto& arg : *it) {
                line += " " + (arg.is_string() ? arg.get<std::string>() : arg.dump());
            }
        }
    }
    return line;
}

}  // namespace

ExternalCommandOperation::ExternalCommandOperation(
    const std::chrono::milliseconds default_timeout, policy::CommandGuard guard)
    : default_timeout_(default_timeout), guard_(std::move(guard)) {}

std::string ExternalCommandOperation::description() const {
    return "Runs a command line in the session working directory and returns its "
           "exit code, stdout and stderr.";
}

std::vector<std::string> ExternalCommandOperation::capabilities() const {
    return {"command:execute", "system:external", "fallback:operations"};
}

json ExternalCommandOperation::parameters() const {
    return {{"command", "required, command line to run"},
            {"arguments", "optional, extra arguments (string or array)"},
            {"workingDirectory", "optional, relative directory to run in"},
            {"timeoutSeconds", "optional, at most the engine timeout"}};
}

std::vector<std::string> ExternalCommandOperation::inference_keywords() const {
    return {"command", "shell", "execute", "terminal", "run "};
}

std::vector<std::string> ExternalCommandOperation::alternative_methods() const {
    return {kDirectMethod, kLoginShellMethod};
}

double ExternalCommandOperation::estimate_cost(const OperationContext& context) const {
    static_cast<void>(context);
    return 0.0;
}

bool ExternalCommandOperation::dry_run(const OperationContext& context) const {
    const auto line = command_line(context);
    if (!line.has_value()) {
        return false;
    }
    return !core::errors::is_error(guard_.validate_command(line.value()));
}

std::vector<std::string> ExternalCommandOperation::split_command_line(
    const std::string& command_line) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;
    char quote = '\0';

    for (std::size_t i = 0; i < command_line.size(); ++i) {
        const char c = command_line[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else if (c == '\\' && quote == '"' && i + 1 < command_line.size()) {
                current.push_back(command_line[++i]);
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_token = true;
            continue;
        }
        if (c == '\\' && i + 1 < command_line.size()) {
            current.push_back(command_line[++i]);
            in_token = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (in_token) {
                tokens.push_back(current);
                current.clear();
                in_token = false;
            }
            continue;
        }
        current.push_back(c);
        in_token = true;
    }
    if (in_token) {
        tokens.push_back(current);
    }
    return tokens;
}

std::chrono::milliseconds ExternalCommandOperation::timeout_for(
    const OperationContext& context) const {
    // A requested timeout may shorten the configured one, never extend it.
    auto it = context.parameters.find("timeoutSeconds");
    if (it != context.parameters.end() && it->is_number()) {
        const double requested_ms = it->get<double>() * 1000.0;
        if (requested_ms >= 1.0 &&
            requested_ms < static_cast<double>(default_timeout_.count())) {
            return std::chrono::milliseconds(static_cast<std::int64_t>(requested_ms));
        }
    }
    return default_timeout_;
}

core::errors::Result<OperationResult> ExternalCommandOperation::run(
    OperationContext& context) {
    return execute(Launch::Shell, context);
}

core::errors::Result<OperationResult> ExternalCommandOperation::run_alternative(
    const std::string& method, OperationContext& context) {
    if (method == kDirectMethod) {
        return execute(Launch::Direct, context);
    }
    if (method == kLoginShellMethod) {
        return execute(Launch::LoginShell, context);
    }
    return OperationResult::failure("Unknown alternative method: " + method);
}

core::errors::Result<OperationResult> ExternalCommandOperation::execute(
    const Launch launch, OperationContext& context) const {
    const auto line = command_line(context);
    if (!line.has_value()) {
        return OperationResult::failure("Missing required parameter: command");
    }

    auto validated = guard_.validate_command(line.value());
    if (core::errors::is_error(validated)) {
        const auto& error = core::errors::get_error(validated);
        if (core::errors::is_boundary_violation(error)) {
            return error;
        }
        return OperationResult::failure(error.message);
    }

    const std::string relative_cwd =
        string_parameter(context, "workingDirectory").value_or(".");
    auto cwd = resolve_session_path(context, relative_cwd.empty() ? "." : relative_cwd);
    if (core::errors::is_error(cwd)) {
        return core::errors::get_error(cwd);
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(core::errors::get_value(cwd), ec)) {
        return OperationResult::failure("Working directory does not exist: " +
                                        relative_cwd);
    }

    runtime::ProcessRequest request;
    request.working_directory = core::errors::get_value(cwd);
    request.timeout = timeout_for(context);
    request.cancel_token = context.cancel_token;
    switch (launch) {
        case Launch::Shell:
            request.argv = runtime::shell_argv(line.value());
            break;
        case Launch::Direct:
            request.argv = split_command_line(line.value());
            break;
        case Launch::LoginShell:
            request.argv = {"/bin/sh", "-lc", line.value()};
            break;
    }
    if (request.argv.empty()) {
        return OperationResult::failure("Command line has no executable.");
    }

    HARBOR_LOG_DEBUG("ExternalCommand: " + context.session_id + " running '" +
                     line.value() + "'");
    auto captured = runtime::run_process(request);
    if (core::errors::is_error(captured)) {
        return OperationResult::failure(core::errors::get_error(captured).message);
    }
    const auto& capture = core::errors::get_value(captured);

    if (capture.cancelled) {
        return AgentError{ErrorCategory::Cancelled, "Command cancelled.", "cancelled"};
    }

    json output;
    output["exit_code"] = capture.exit_code;
    output["stdout"] = truncate_output(capture.stdout_text);
    output["stderr"] = truncate_output(capture.stderr_text);
    output["working_directory"] = context.scope->to_display_path(request.working_directory);
    context.state["last_exit_code"] = capture.exit_code;

    if (capture.timed_out) {
        OperationResult result = OperationResult::failure(
            "Command timed out after " + std::to_string(request.timeout.count()) + " ms.");
        result.output = std::move(output);
        return result;
    }
    if (capture.exit_code != 0) {
        std::string message = "Command failed with exit code " +
                              std::to_string(capture.exit_code);
        if (!capture.stderr_text.empty()) {
            message += ": " + truncate_output(capture.stderr_text);
        }
        OperationResult result = OperationResult::failure(message);
        result.output = std::move(output);
        return result;
    }
    return OperationResult::ok(std::move(output));
}

}  // namespace harbor::operations
