#pragma once

#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace harbor::policy {

struct CommandPolicy {
    std::vector<std::string> blocked_substrings = {
        "sudo",
        "rm -rf /",
        "shutdown",
        "reboot",
        "mkfs",
        "dd if=",
        ":(){ :|:& };:"};
};

// Screens external commands before they are spawned inside a session.
class CommandGuard {
public:
    explicit CommandGuard(CommandPolicy command_policy = {});

    core::errors::Result<std::string> validate_command(
        const std::string& command) const;

private:
    static std::string lowercase(std::string value);

    CommandPolicy command_policy_;
};

}  // namespace harbor::policy
