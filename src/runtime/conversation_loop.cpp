#include "runtime/conversation_loop.hpp"

#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "session/session_journal.hpp"

namespace harbor::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ConversationOutcome;
using protocol::ConversationState;
using protocol::Decision;
using protocol::Message;
using protocol::OperationContext;
using protocol::OperationResult;
using protocol::Role;

namespace {

constexpr std::size_t kMaxNarratedOutput = 8 * 1024;

void check_journal(const core::errors::Result<std::filesystem::path>& written,
                   const std::string& session_id) {
    if (core::errors::is_error(written)) {
        HARBOR_LOG_WARN("ConversationLoop: " + session_id + " journal write failed: " +
                        core::errors::get_error(written).message);
    }
}

std::string render_output(const json& output) {
    std::string text = output.is_string() ? output.get<std::string>()
                                          : output.dump(2, ' ', false,
                                                        json::error_handler_t::replace);
    if (text.size() > kMaxNarratedOutput) {
        text = text.substr(0, kMaxNarratedOutput) + "\n... [truncated]";
    }
    return text;
}

bool is_cancelled(const std::shared_ptr<std::atomic_bool>& cancel_token) {
    return cancel_token && cancel_token->load();
}

}  // namespace

ConversationLoop::ConversationLoop(protocol::Backend& backend,
                                   const operations::OperationRegistry& registry,
                                   const ResilientInvoker& invoker,
                                   const response::ResponseNormalizer& normalizer,
                                   const std::uint32_t max_iterations)
    : backend_(backend),
      registry_(registry),
      invoker_(invoker),
      normalizer_(normalizer),
      max_iterations_(max_iterations) {}

std::string ConversationLoop::initial_prompt(const std::string& task,
                                             const session::SessionScope& scope) const {
    std::ostringstream out;
    out << "You are an autonomous agent working inside a private session directory.\n"
        << "All paths are relative to the session working directory (currently '"
        << scope.to_display_path(scope.working_directory()) << "'). Absolute paths and "
        << "paths that leave the session are rejected.\n\n"
        << "AVAILABLE OPERATIONS:\n"
        << registry_.describe_catalog() << "\n"
        << "Reply with exactly one JSON object and nothing else:\n"
        << "{\n"
        << "  \"taskCompleted\": false,\n"
        << "  \"reasoning\": \"why this is the right next step\",\n"
        << "  \"nextStep\": {\n"
        << "    \"requiresOperation\": true,\n"
        << "    \"operationName\": \"DirectoryCreate\",\n"
        << "    \"parameters\": {\"path\": \"out\"},\n"
        << "    \"confidence\": 0.9,\n"
        << "    \"assumptions\": [],\n"
        << "    \"risks\": []\n"
        << "  },\n"
        << "  \"response\": \"what you tell the user\"\n"
        << "}\n"
        << "When the task is done set \"taskCompleted\": true, \"nextStep\": null, a "
        << "\"confidence\" of at least " << normalizer_.settings().min_completion_confidence
        << " and put the final answer in \"response\".\n\n"
        << "USER REQUEST:\n"
        << task << "\n";
    return out.str();
}

std::string ConversationLoop::continue_prompt(const Decision& decision) {
    std::ostringstream out;
    out << "The task is not confirmed as complete.";
    if (!decision.reasoning.empty()) {
        out << " Your last reasoning was: " << decision.reasoning;
    }
    out << "\nContinue with the next step. If the task is finished, reply with "
        << "\"taskCompleted\": true, \"nextStep\": null and your final answer in "
        << "\"response\". Reply with one JSON object only.";
    return out.str();
}

std::string ConversationLoop::operation_result_prompt(const std::string& operation_name,
                                                      const OperationResult& result,
                                                      const session::SessionScope& scope) {
    std::ostringstream out;
    out << "OPERATION RESULT\n"
        << "Operation: " << operation_name << "\n"
        << "Status: " << (result.success ? "SUCCESS" : "FAILED") << "\n"
        << "Method: " << result.method_used << "\n"
        << "Attempts: " << result.total_attempts << "\n"
        << "Working directory: " << scope.to_display_path(scope.working_directory())
        << "\n";
    if (!result.success) {
        out << "Error: " << result.error_message.value_or("unknown error") << "\n";
    }
    if (!result.output.is_null()) {
        out << "Output:\n" << render_output(result.output) << "\n";
    }
    out << "\n";
    if (result.success) {
        out << "Use this result to decide the next step, or finish the task if it is done.";
    } else {
        out << "The operation failed after all retries and fallbacks. Reconsider the "
            << "approach: change the parameters, pick another operation, or split the "
            << "task into smaller steps.";
    }
    out << " Reply with one JSON object only.";
    return out.str();
}

std::string ConversationLoop::operation_rejected_prompt(const std::string& operation_name,
                                                        const AgentError& error) {
    std::ostringstream out;
    out << "OPERATION REJECTED\n"
        << "Operation: " << (operation_name.empty() ? "<none>" : operation_name) << "\n"
        << "Reason: " << error.message << "\n";
    if (!error.hint.empty()) {
        out << "Hint: " << error.hint << "\n";
    }
    out << "\nNothing was executed. Choose a different step. Reply with one JSON object "
        << "only.";
    return out.str();
}

ConversationOutcome ConversationLoop::run(
    const protocol::ConversationRequest& request,
    const std::shared_ptr<session::SessionScope>& scope,
    const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    ConversationOutcome outcome;
    outcome.session_id = request.session_id;
    outcome.state = ConversationState::Started;

    if (!scope) {
        outcome.state = ConversationState::Failed;
        outcome.error = AgentError{ErrorCategory::Internal, "Conversation has no session scope.",
                                   "missing_session_scope"};
        return outcome;
    }

    const std::string& session_id = scope->session_id();
    outcome.session_id = session_id;
    const session::SessionJournal journal(scope->root(), session_id);
    check_journal(journal.write_request(request.task), session_id);

    protocol::ConversationHistory history;
    json shared_state = json::object();
    std::string partial_response;
    std::string prompt = initial_prompt(request.task, *scope);
    std::uint32_t step = 0;

    const auto finish = [&](const ConversationState state) {
        outcome.state = state;
        outcome.iterations = step;
        if (state == ConversationState::Completed) {
            outcome.completion_confirmed = true;
        } else {
            outcome.response = partial_response;
        }
        check_journal(journal.write_final(step, outcome), session_id);
        HARBOR_LOG_INFO("ConversationLoop: " + session_id + " finished as " +
                        protocol::to_string(state) + " after " + std::to_string(step) +
                        " iteration(s)");
        return outcome;
    };

    HARBOR_LOG_INFO("ConversationLoop: " + session_id + " started");
    while (true) {
        if (is_cancelled(cancel_token)) {
            outcome.error = AgentError{ErrorCategory::Cancelled, "Conversation cancelled.",
                                       "cancelled"};
            return finish(ConversationState::Cancelled);
        }
        if (step >= max_iterations_) {
            HARBOR_LOG_WARN("ConversationLoop: " + session_id + " reached the iteration cap (" +
                            std::to_string(max_iterations_) + ")");
            return finish(ConversationState::Aborted);
        }

        ++step;
        outcome.state = ConversationState::AwaitingDecision;
        check_journal(journal.write_prompt(step, prompt), session_id);

        auto sent = backend_.send(prompt, history);
        if (core::errors::is_error(sent)) {
            const auto& error = core::errors::get_error(sent);
            outcome.error = error;
            if (core::errors::is_cancellation(error)) {
                return finish(ConversationState::Cancelled);
            }
            HARBOR_LOG_ERROR("ConversationLoop: " + session_id + " backend failed: " +
                             error.message);
            return finish(ConversationState::Failed);
        }
        ++outcome.backend_round_trips;
        const std::string raw = core::errors::get_value(sent);
        history.push_back(Message{Role::User, prompt});
        history.push_back(Message{Role::Assistant, raw});

        bool malformed = false;
        auto interpreted = normalizer_.interpret(raw);
        Decision decision;
        if (core::errors::is_error(interpreted)) {
            malformed = true;
            const auto& error = core::errors::get_error(interpreted);
            HARBOR_LOG_WARN("ConversationLoop: " + session_id + " step " +
                            std::to_string(step) + ": " + error.message);
            decision = response::ResponseNormalizer::error_decision(error.message);
        } else {
            decision = core::errors::get_value(interpreted);
        }
        check_journal(journal.write_decision(step, decision, raw, malformed), session_id);
        outcome.last_decision = decision;
        if (!malformed && !decision.response.empty()) {
            partial_response = decision.response;
        }

        if (decision.task_completed) {
            outcome.response =
                decision.response.empty() ? decision.reasoning : decision.response;
            return finish(ConversationState::Completed);
        }

        if (!decision.next_step.has_value() || !decision.next_step->requires_operation) {
            prompt = continue_prompt(decision);
            continue;
        }

        outcome.state = ConversationState::InvokingOperation;
        const auto& next_step = decision.next_step.value();
        const std::string operation_name = next_step.operation_name.value_or("");

        auto found = registry_.get(operation_name);
        if (core::errors::is_error(found)) {
            const auto& error = core::errors::get_error(found);
            HARBOR_LOG_WARN("ConversationLoop: " + session_id + " " + error.message);
            check_journal(journal.write_operation_error(step, operation_name, error),
                          session_id);
            prompt = operation_rejected_prompt(operation_name, error);
            continue;
        }
        operations::Operation& operation = *core::errors::get_value(found);

        OperationContext context;
        context.parameters =
            next_step.parameters.is_object() ? next_step.parameters : json::object();
        context.state = shared_state;
        context.session_id = session_id;
        context.scope = scope;
        context.cancel_token = cancel_token;

        HARBOR_LOG_INFO("ConversationLoop: " + session_id + " step " + std::to_string(step) +
                        " invoking " + operation.name());
        auto invoked = invoker_.invoke(operation, context);
        if (core::errors::is_error(invoked)) {
            const auto& error = core::errors::get_error(invoked);
            check_journal(journal.write_operation_error(step, operation.name(), error),
                          session_id);
            if (core::errors::is_cancellation(error)) {
                outcome.error = error;
                return finish(ConversationState::Cancelled);
            }
            prompt = operation_rejected_prompt(operation.name(), error);
            continue;
        }

        const OperationResult& result = core::errors::get_value(invoked);
        shared_state = context.state;
        check_journal(journal.write_operation(step, operation.name(), context, result),
                      session_id);
        prompt = operation_result_prompt(operation.name(), result, *scope);
    }
}

protocol::ConversationOutcome run_session(session::SessionStore& store,
                                          const ConversationLoop& loop,
                                          const protocol::ConversationRequest& request) {
    ConversationOutcome outcome;
    outcome.session_id = request.session_id;

    auto opened = request.session_id.empty() ? store.create_session()
                                             : store.open_session(request.session_id);
    if (core::errors::is_error(opened)) {
        outcome.state = ConversationState::Failed;
        outcome.error = core::errors::get_error(opened);
        return outcome;
    }
    return run_opened_session(store, loop, core::errors::get_value(opened), request.task);
}

protocol::ConversationOutcome run_opened_session(session::SessionStore& store,
                                                 const ConversationLoop& loop,
                                                 const std::shared_ptr<session::SessionScope>& scope,
                                                 const std::string& task) {
    ConversationOutcome outcome;
    outcome.session_id = scope->session_id();

    auto token = store.get_cancel_token(scope->session_id());
    if (core::errors::is_error(token)) {
        outcome.state = ConversationState::Failed;
        outcome.error = core::errors::get_error(token);
        return outcome;
    }

    const protocol::ConversationRequest scoped{scope->session_id(), task};
    outcome = loop.run(scoped, scope, core::errors::get_value(token));

    core::errors::Result<session::SessionState> marked = session::SessionState::Active;
    switch (outcome.state) {
        case ConversationState::Completed:
            marked = store.mark_completed(outcome.session_id);
            break;
        case ConversationState::Aborted:
            marked = store.mark_aborted(outcome.session_id);
            break;
        case ConversationState::Cancelled:
            // cancel_session already moved the record when it fired the token.
            marked = store.get_state(outcome.session_id);
            if (!core::errors::is_error(marked) &&
                core::errors::get_value(marked) == session::SessionState::Active) {
                marked = store.cancel_session(outcome.session_id);
            }
            break;
        default:
            marked = store.mark_failed(outcome.session_id,
                                       outcome.error.has_value() ? outcome.error->message
                                                                 : "conversation failed");
            break;
    }
    if (core::errors::is_error(marked)) {
        HARBOR_LOG_WARN("ConversationLoop: " + outcome.session_id +
                        " state not recorded: " + core::errors::get_error(marked).message);
    }
    return outcome;
}

}  // namespace harbor::runtime
