#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/decision.hpp"

namespace harbor::protocol {

enum class ConversationState {
    Started,
    AwaitingDecision,
    InvokingOperation,
    Completed,
    Aborted,
    Cancelled,
    Failed
};

struct ConversationRequest {
    std::string session_id;
    std::string task;
};

struct ConversationOutcome {
    std::string session_id;
    ConversationState state = ConversationState::Started;

    // Final answer, or the best partial answer when completion was not confirmed.
    std::string response;
    bool completion_confirmed = false;

    std::uint32_t iterations = 0;
    std::uint32_t backend_round_trips = 0;
    std::optional<Decision> last_decision;
    std::optional<core::errors::AgentError> error;
};

inline std::string to_string(const ConversationState state) {
    switch (state) {
        case ConversationState::Started:
            return "started";
        case ConversationState::AwaitingDecision:
            return "awaiting_decision";
        case ConversationState::InvokingOperation:
            return "invoking_operation";
        case ConversationState::Completed:
            return "completed";
        case ConversationState::Aborted:
            return "aborted";
        case ConversationState::Cancelled:
            return "cancelled";
        case ConversationState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

}  // namespace harbor::protocol
