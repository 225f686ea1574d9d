#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "operations/operation.hpp"
#include "policy/command_guard.hpp"
#include "runtime/process_runner.hpp"

namespace harbor::operations {

// Runs an external command inside the session working directory.
//
// Primary method: `/bin/sh -c`. Fallbacks: exec the binary directly without a
// shell, then a login shell (`/bin/sh -lc`) for commands that depend on the
// user's profile.
class ExternalCommandOperation : public Operation {
public:
    explicit ExternalCommandOperation(
        std::chrono::milliseconds default_timeout = std::chrono::milliseconds(30000),
        policy::CommandGuard guard = policy::CommandGuard());

    std::string name() const override { return "ExternalCommand"; }
    std::string description() const override;
    std::vector<std::string> capabilities() const override;
    nlohmann::json parameters() const override;
    bool requires_file_system() const override { return true; }
    std::vector<std::string> inference_keywords() const override;

    core::errors::Result<protocol::OperationResult> run(
        protocol::OperationContext& context) override;
    std::vector<std::string> alternative_methods() const override;
    core::errors::Result<protocol::OperationResult> run_alternative(
        const std::string& method, protocol::OperationContext& context) override;

    double estimate_cost(const protocol::OperationContext& context) const override;
    bool dry_run(const protocol::OperationContext& context) const override;

    // Splits a command line on whitespace, honoring single and double quotes
    // and backslash escapes.
    static std::vector<std::string> split_command_line(const std::string& command_line);

private:
    enum class Launch {
        Shell,
        Direct,
        LoginShell
    };

    core::errors::Result<protocol::OperationResult> execute(
        Launch launch, protocol::OperationContext& context) const;
    std::chrono::milliseconds timeout_for(const protocol::OperationContext& context) const;

    std::chrono::milliseconds default_timeout_;
    policy::CommandGuard guard_;
};

}  // namespace harbor::operations
