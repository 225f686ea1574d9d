#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include "core/errors/agent_errors.hpp"
#include "operations/operation.hpp"
#include "protocol/operation_contract.hpp"

namespace harbor::runtime {

struct RetryPolicy {
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{500};
};

// Waits for `delay`; returns false if `cancel_token` fired first.
using Sleeper = std::function<bool(std::chrono::milliseconds delay,
                                   const std::shared_ptr<std::atomic_bool>& cancel_token)>;

// Runs one logical operation invocation: up to `max_retries + 1` primary
// attempts with exponential backoff, then each alternative method once, in
// order. Every attempt is appended to `context.execution_history`.
//
// Returns an AgentError only for policy rejections and cancellation; every
// other outcome, including exhausted alternatives, is an OperationResult.
class ResilientInvoker {
public:
    explicit ResilientInvoker(RetryPolicy policy = {}, Sleeper sleeper = {});

    core::errors::Result<protocol::OperationResult> invoke(
        operations::Operation& operation, protocol::OperationContext& context) const;

    core::errors::Result<protocol::OperationResult> invoke(
        operations::Operation& operation, protocol::OperationContext& context,
        std::uint32_t max_retries, std::chrono::milliseconds base_delay) const;

    const RetryPolicy& policy() const { return policy_; }

    // base_delay * 1.5^attempt
    static std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base_delay,
                                                   std::uint32_t attempt);

    // Sleeps in short slices so a cancellation is noticed promptly.
    static bool interruptible_sleep(std::chrono::milliseconds delay,
                                    const std::shared_ptr<std::atomic_bool>& cancel_token);

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
};

}  // namespace harbor::runtime
