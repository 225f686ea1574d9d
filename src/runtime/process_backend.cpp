#include "runtime/process_backend.hpp"

#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/process_runner.hpp"

namespace harbor::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;

ProcessBackend::ProcessBackend(ProcessBackendOptions options)
    : options_(std::move(options)) {}

std::string ProcessBackend::render_transcript(
    const std::string& prompt, const protocol::ConversationHistory& history) {
    std::ostringstream out;
    for (const auto& message : history) {
        out << "### " << protocol::to_string(message.role) << "\n"
            << message.content << "\n\n";
    }
    out << "### user\n" << prompt << "\n";
    return out.str();
}

core::errors::Result<std::string> ProcessBackend::send(
    const std::string& prompt, const protocol::ConversationHistory& history) {
    if (options_.command.empty()) {
        return AgentError{ErrorCategory::Input, "Backend command cannot be empty.",
                          "missing_backend_command"};
    }

    ProcessRequest request;
    request.argv = shell_argv(options_.command);
    request.stdin_text =
        options_.include_history ? render_transcript(prompt, history) : prompt;
    request.timeout = options_.timeout;
    request.cancel_token = options_.cancel_token;

    auto captured = run_process(request);
    if (core::errors::is_error(captured)) {
        const auto& error = core::errors::get_error(captured);
        return AgentError{ErrorCategory::Provider,
                          "Unable to start backend: " + error.message, "backend_failed"};
    }
    const auto& capture = core::errors::get_value(captured);

    if (capture.cancelled) {
        return AgentError{ErrorCategory::Cancelled, "Backend request cancelled.",
                          "cancelled"};
    }
    if (capture.timed_out) {
        return AgentError{ErrorCategory::Provider,
                          "Backend timed out after " +
                              std::to_string(options_.timeout.count()) + " ms.",
                          "backend_timeout"};
    }
    if (capture.exit_code != 0) {
        return AgentError{ErrorCategory::Provider,
                          "Backend exited with code " + std::to_string(capture.exit_code) +
                              (capture.stderr_text.empty() ? "" : ": " + capture.stderr_text),
                          "backend_failed"};
    }
    if (capture.stdout_text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return AgentError{ErrorCategory::Provider, "Backend returned an empty response.",
                          "empty_response"};
    }

    HARBOR_LOG_DEBUG("ProcessBackend: received " +
                     std::to_string(capture.stdout_text.size()) + " bytes in " +
                     std::to_string(capture.duration.count()) + " ms");
    return capture.stdout_text;
}

}  // namespace harbor::runtime
