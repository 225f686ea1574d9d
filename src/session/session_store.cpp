#include "session/session_store.hpp"

#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"

namespace harbor::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;

std::string to_string(const SessionState state) {
    switch (state) {
        case SessionState::Active:
            return "active";
        case SessionState::Completed:
            return "completed";
        case SessionState::Aborted:
            return "aborted";
        case SessionState::Cancelled:
            return "cancelled";
        case SessionState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

SessionStore::SessionStore(std::filesystem::path cache_root)
    : cache_root_(std::move(cache_root)) {}

bool SessionStore::is_terminal(const SessionState state) {
    return state != SessionState::Active;
}

AgentError SessionStore::not_found(const std::string& session_id) {
    return AgentError{ErrorCategory::Input, "Session not found: " + session_id,
                      "session_not_found"};
}

core::errors::Result<std::shared_ptr<SessionScope>> SessionStore::open_session(
    const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        if (!is_terminal(it->second.state)) {
            return AgentError{ErrorCategory::Input,
                              "Session is already active: " + session_id, "session_busy",
                              "Wait for the running conversation to finish or cancel it."};
        }
        HARBOR_LOG_INFO("SessionStore: session " + session_id + " transition " +
                        to_string(it->second.state) + " -> active");
        it->second.state = SessionState::Active;
        it->second.failure_reason.reset();
        it->second.cancel_token = std::make_shared<std::atomic_bool>(false);
        return it->second.scope;
    }

    auto scope = SessionScope::create(cache_root_, session_id);
    if (core::errors::is_error(scope)) {
        return core::errors::get_error(scope);
    }

    SessionRecord record;
    record.session_id = session_id;
    record.scope = core::errors::get_value(scope);
    record.state = SessionState::Active;
    record.cancel_token = std::make_shared<std::atomic_bool>(false);
    auto inserted = sessions_.emplace(session_id, std::move(record));
    HARBOR_LOG_INFO("SessionStore: session " + session_id + " created");
    return inserted.first->second.scope;
}

core::errors::Result<std::shared_ptr<SessionScope>> SessionStore::create_session() {
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string session_id = core::config::generate_session_id();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (sessions_.find(session_id) != sessions_.end()) {
                continue;
            }
        }
        std::error_code ec;
        if (std::filesystem::exists(cache_root_ / session_id, ec)) {
            continue;
        }
        return open_session(session_id);
    }

    return AgentError{ErrorCategory::Internal,
                      "Unable to allocate unique session ID.",
                      "session_id_generation_failed"};
}

core::errors::Result<SessionState> SessionStore::cancel_session(
    const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return not_found(session_id);
        }
        if (!is_terminal(it->second.state) && it->second.cancel_token) {
            it->second.cancel_token->store(true);
        }
    }
    return transition_to_terminal(session_id, SessionState::Cancelled, std::nullopt);
}

core::errors::Result<SessionState> SessionStore::mark_completed(
    const std::string& session_id) {
    return transition_to_terminal(session_id, SessionState::Completed, std::nullopt);
}

core::errors::Result<SessionState> SessionStore::mark_aborted(
    const std::string& session_id) {
    return transition_to_terminal(session_id, SessionState::Aborted, std::nullopt);
}

core::errors::Result<SessionState> SessionStore::mark_failed(
    const std::string& session_id, const std::string& reason) {
    return transition_to_terminal(session_id, SessionState::Failed, reason);
}

core::errors::Result<SessionState> SessionStore::transition_to_terminal(
    const std::string& session_id, const SessionState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return not_found(session_id);
    }

    if (is_terminal(it->second.state)) {
        return AgentError{ErrorCategory::Input,
                          "Session is already terminal: " +
                              to_string(it->second.state),
                          "invalid_state_transition"};
    }

    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    HARBOR_LOG_INFO("SessionStore: session " + session_id +
                    " transition active -> " + to_string(next_state));
    return it->second.state;
}

core::errors::Result<SessionState> SessionStore::get_state(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return not_found(session_id);
    }
    return it->second.state;
}

core::errors::Result<std::optional<std::string>> SessionStore::get_failure_reason(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return not_found(session_id);
    }
    return it->second.failure_reason;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> SessionStore::get_cancel_token(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return not_found(session_id);
    }
    return it->second.cancel_token;
}

core::errors::Result<bool> SessionStore::cleanup_session(const std::string& session_id) {
    std::shared_ptr<SessionScope> scope;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            if (!is_terminal(it->second.state) && it->second.cancel_token) {
                it->second.cancel_token->store(true);
            }
            scope = it->second.scope;
            sessions_.erase(it);
        }
    }

    if (!scope) {
        auto created = SessionScope::create(cache_root_, session_id);
        if (core::errors::is_error(created)) {
            return core::errors::get_error(created);
        }
        scope = core::errors::get_value(created);
    }
    return scope->cleanup();
}

std::size_t SessionStore::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace harbor::session
