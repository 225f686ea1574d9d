#include "runtime/resilient_invoker.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace harbor::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::AttemptRecord;
using protocol::OperationContext;
using protocol::OperationResult;

namespace {

constexpr const char* kPrimaryMethod = "primary";
constexpr const char* kExhaustedMethod = "alternatives_exhausted";
constexpr std::chrono::milliseconds kSleepSlice{25};

bool is_cancelled(const OperationContext& context) {
    return context.cancel_token && context.cancel_token->load();
}

AgentError cancelled_error(const std::string& operation_name) {
    return AgentError{ErrorCategory::Cancelled,
                      "Invocation of " + operation_name + " was cancelled.", "cancelled"};
}

// One call into the operation. Exceptions count as an ordinary failed attempt.
core::errors::Result<OperationResult> attempt_once(operations::Operation& operation,
                                                   const std::string& method,
                                                   OperationContext& context) {
    try {
        if (method == kPrimaryMethod) {
            return operation.run(context);
        }
        return operation.run_alternative(method, context);
    } catch (const std::exception& e) {
        return OperationResult::failure(e.what());
    }
}

// Normalizes a non-fatal AgentError into a failed result.
OperationResult as_result(core::errors::Result<OperationResult> outcome) {
    if (core::errors::is_error(outcome)) {
        return OperationResult::failure(core::errors::get_error(outcome).message);
    }
    OperationResult result = std::move(core::errors::get_value(outcome));
    if (!result.success && !result.error_message.has_value()) {
        result.error_message = "Operation reported failure without a message.";
    }
    if (result.success) {
        result.error_message.reset();
    }
    return result;
}

bool must_propagate(const core::errors::Result<OperationResult>& outcome) {
    if (!core::errors::is_error(outcome)) {
        return false;
    }
    const auto& error = core::errors::get_error(outcome);
    return core::errors::is_boundary_violation(error) || core::errors::is_cancellation(error);
}

}  // namespace

ResilientInvoker::ResilientInvoker(RetryPolicy policy, Sleeper sleeper)
    : policy_(policy), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = &ResilientInvoker::interruptible_sleep;
    }
}

std::chrono::milliseconds ResilientInvoker::backoff_delay(
    const std::chrono::milliseconds base_delay, const std::uint32_t attempt) {
    const double scaled =
        static_cast<double>(base_delay.count()) * std::pow(1.5, static_cast<double>(attempt));
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(scaled)));
}

bool ResilientInvoker::interruptible_sleep(
    const std::chrono::milliseconds delay,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (true) {
        if (cancel_token && cancel_token->load()) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining + std::chrono::milliseconds(1),
                                             kSleepSlice));
    }
}

core::errors::Result<OperationResult> ResilientInvoker::invoke(
    operations::Operation& operation, OperationContext& context) const {
    return invoke(operation, context, policy_.max_retries, policy_.base_delay);
}

core::errors::Result<OperationResult> ResilientInvoker::invoke(
    operations::Operation& operation, OperationContext& context,
    const std::uint32_t max_retries, const std::chrono::milliseconds base_delay) const {
    const std::string operation_name = operation.name();
    std::uint32_t attempts = 0;
    OperationResult last;

    const auto record = [&](const std::string& method, const OperationResult& result) {
        AttemptRecord entry;
        entry.method = method;
        entry.success = result.success;
        entry.error_message = result.error_message.value_or("");
        entry.duration = result.execution_time;
        entry.attempt_number = attempts;
        context.execution_history.push_back(std::move(entry));
    };

    const auto run_timed = [&](const std::string& method)
        -> core::errors::Result<OperationResult> {
        const auto started = std::chrono::steady_clock::now();
        auto outcome = attempt_once(operation, method, context);
        if (must_propagate(outcome)) {
            return outcome;
        }
        OperationResult result = as_result(std::move(outcome));
        result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        ++attempts;
        record(method, result);
        return result;
    };

    const auto alternatives = operation.alternative_methods();

    for (std::uint32_t attempt = 0; attempt <= max_retries; ++attempt) {
        if (is_cancelled(context)) {
            return cancelled_error(operation_name);
        }
        context.retry_attempt = attempt;

        auto outcome = run_timed(kPrimaryMethod);
        if (core::errors::is_error(outcome)) {
            const auto& error = core::errors::get_error(outcome);
            HARBOR_LOG_WARN("ResilientInvoker: " + operation_name + " stopped: " +
                            error.message);
            return error;
        }
        last = std::move(core::errors::get_value(outcome));
        if (last.success) {
            last.method_used = kPrimaryMethod;
            last.total_attempts = attempts;
            last.has_more_alternatives = !alternatives.empty();
            return last;
        }

        HARBOR_LOG_WARN("ResilientInvoker: " + operation_name + " attempt " +
                        std::to_string(attempt + 1) + "/" +
                        std::to_string(max_retries + 1) +
                        " failed: " + last.error_message.value_or(""));
        if (attempt < max_retries) {
            if (!sleeper_(backoff_delay(base_delay, attempt), context.cancel_token)) {
                return cancelled_error(operation_name);
            }
        }
    }

    if (alternatives.empty()) {
        last.method_used = kPrimaryMethod;
        last.total_attempts = attempts;
        last.has_more_alternatives = false;
        return last;
    }

    std::vector<std::string> failures;
    failures.push_back(std::string(kPrimaryMethod) + ": " + last.error_message.value_or(""));

    for (std::size_t i = 0; i < alternatives.size(); ++i) {
        if (is_cancelled(context)) {
            return cancelled_error(operation_name);
        }
        const std::string& method = alternatives[i];
        context.previous_failure_reason = last.error_message;
        HARBOR_LOG_INFO("ResilientInvoker: " + operation_name +
                        " falling back to " + method);

        auto outcome = run_timed(method);
        if (core::errors::is_error(outcome)) {
            const auto& error = core::errors::get_error(outcome);
            HARBOR_LOG_WARN("ResilientInvoker: " + operation_name + " stopped: " +
                            error.message);
            return error;
        }
        last = std::move(core::errors::get_value(outcome));
        if (last.success) {
            last.method_used = method;
            last.total_attempts = attempts;
            last.has_more_alternatives = i + 1 < alternatives.size();
            return last;
        }
        failures.push_back(method + ": " + last.error_message.value_or(""));
    }

    std::string combined;
    for (const auto& failure : failures) {
        combined += combined.empty() ? failure : "; " + failure;
    }
    HARBOR_LOG_ERROR("ResilientInvoker: " + operation_name +
                     " exhausted all methods: " + combined);

    OperationResult exhausted = OperationResult::failure(combined);
    exhausted.output = std::move(last.output);
    exhausted.execution_time = last.execution_time;
    exhausted.method_used = kExhaustedMethod;
    exhausted.total_attempts = attempts;
    exhausted.has_more_alternatives = false;
    return exhausted;
}

}  // namespace harbor::runtime
