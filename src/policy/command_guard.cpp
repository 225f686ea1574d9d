#include "policy/command_guard.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace harbor::policy {

using core::errors::AgentError;
using core::errors::ErrorCategory;

CommandGuard::CommandGuard(CommandPolicy command_policy)
    : command_policy_(std::move(command_policy)) {}

std::string CommandGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

core::errors::Result<std::string> CommandGuard::validate_command(
    const std::string& command) const {
    const bool blank = std::all_of(command.begin(), command.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        return AgentError{ErrorCategory::Input, "Command cannot be empty.",
                          "empty_command"};
    }

    const std::string lowered = lowercase(command);
    for (const auto& blocked : command_policy_.blocked_substrings) {
        const std::string blocked_lowered = lowercase(blocked);
        if (lowered.find(blocked_lowered) == std::string::npos) {
            continue;
        }
        return AgentError{ErrorCategory::Policy,
                          "Command contains blocked operation: " + blocked,
                          "blocked_command"};
    }

    return command;
}

}  // namespace harbor::policy
