#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include "operations/operation_registry.hpp"
#include "protocol/backend_contract.hpp"
#include "protocol/conversation_contract.hpp"
#include "response/response_normalizer.hpp"
#include "runtime/resilient_invoker.hpp"
#include "session/session_scope.hpp"
#include "session/session_store.hpp"

namespace harbor::runtime {

// Drives one conversation: prompt the backend, interpret its decision, run the
// requested operation, report the result back, until the backend confirms
// completion or the iteration cap is reached.
//
// A loop object holds no per-conversation state and may serve several
// sessions at once; each `run` call is strictly sequential.
class ConversationLoop {
public:
    ConversationLoop(protocol::Backend& backend,
                     const operations::OperationRegistry& registry,
                     const ResilientInvoker& invoker,
                     const response::ResponseNormalizer& normalizer,
                     std::uint32_t max_iterations);

    protocol::ConversationOutcome run(const protocol::ConversationRequest& request,
                                      const std::shared_ptr<session::SessionScope>& scope,
                                      const std::shared_ptr<std::atomic_bool>& cancel_token) const;

    std::string initial_prompt(const std::string& task,
                               const session::SessionScope& scope) const;

    static std::string continue_prompt(const protocol::Decision& decision);

    static std::string operation_result_prompt(const std::string& operation_name,
                                               const protocol::OperationResult& result,
                                               const session::SessionScope& scope);

    static std::string operation_rejected_prompt(const std::string& operation_name,
                                                 const core::errors::AgentError& error);

    std::uint32_t max_iterations() const { return max_iterations_; }

private:
    protocol::Backend& backend_;
    const operations::OperationRegistry& registry_;
    const ResilientInvoker& invoker_;
    const response::ResponseNormalizer& normalizer_;
    std::uint32_t max_iterations_;
};

// Opens (or reopens) the session in `store`, runs the conversation with the
// session's cancellation token and records the terminal state.
protocol::ConversationOutcome run_session(session::SessionStore& store,
                                          const ConversationLoop& loop,
                                          const protocol::ConversationRequest& request);

// Runs the conversation on a session already opened in `store` and records
// its terminal state.
protocol::ConversationOutcome run_opened_session(session::SessionStore& store,
                                                 const ConversationLoop& loop,
                                                 const std::shared_ptr<session::SessionScope>& scope,
                                                 const std::string& task);

}  // namespace harbor::runtime
