#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/operation_contract.hpp"

namespace harbor::operations {

// Capability contract every catalog entry implements. The engine depends only
// on this interface; retries and fallback live in ResilientInvoker.
//
// `run` and `run_alternative` report ordinary failures through
// OperationResult::failure. An AgentError return is reserved for conditions
// that must not be retried: policy rejections and cancellation.
class Operation {
public:
    virtual ~Operation() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual std::vector<std::string> capabilities() const = 0;

    // Parameter name -> short description, rendered into the catalog prompt.
    virtual nlohmann::json parameters() const { return nlohmann::json::object(); }

    virtual bool requires_network() const { return false; }
    virtual bool requires_file_system() const { return false; }

    // Lowercase words that, found in free-text reasoning, point at this
    // operation.
    virtual std::vector<std::string> inference_keywords() const { return {}; }

    virtual core::errors::Result<protocol::OperationResult> run(
        protocol::OperationContext& context) = 0;

    // Ordered fallback strategies tried after the primary method gives up.
    virtual std::vector<std::string> alternative_methods() const { return {}; }

    virtual core::errors::Result<protocol::OperationResult> run_alternative(
        const std::string& method, protocol::OperationContext& context) {
        static_cast<void>(context);
        return protocol::OperationResult::failure("Unknown alternative method: " + method);
    }

    virtual double estimate_cost(const protocol::OperationContext& context) const {
        static_cast<void>(context);
        return 0.0;
    }

    // True when `context` carries what `run` needs. Has no side effects.
    virtual bool dry_run(const protocol::OperationContext& context) const = 0;
};

}  // namespace harbor::operations
