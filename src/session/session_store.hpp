#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/agent_errors.hpp"
#include "session/session_scope.hpp"

namespace harbor::session {

enum class SessionState {
    Active,
    Completed,
    Aborted,
    Cancelled,
    Failed
};

struct SessionRecord {
    std::string session_id;
    std::shared_ptr<SessionScope> scope;
    SessionState state = SessionState::Active;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

std::string to_string(SessionState state);

// Session-id keyed registry of live scopes. Owned by the caller and passed by
// reference; there is no process-wide instance.
class SessionStore {
public:
    explicit SessionStore(std::filesystem::path cache_root);

    // Returns the scope for `session_id`, creating it on first use. A session
    // that already reached a terminal state is reactivated with a fresh
    // cancellation token; an active one is refused with `session_busy`.
    core::errors::Result<std::shared_ptr<SessionScope>> open_session(
        const std::string& session_id);

    // Opens a session under a newly generated id.
    core::errors::Result<std::shared_ptr<SessionScope>> create_session();

    core::errors::Result<SessionState> cancel_session(const std::string& session_id);
    core::errors::Result<SessionState> mark_completed(const std::string& session_id);
    core::errors::Result<SessionState> mark_aborted(const std::string& session_id);
    core::errors::Result<SessionState> mark_failed(const std::string& session_id,
                                                   const std::string& reason);

    core::errors::Result<SessionState> get_state(const std::string& session_id) const;
    core::errors::Result<std::optional<std::string>> get_failure_reason(
        const std::string& session_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& session_id) const;

    // Deletes the session subtree and forgets the session. Cleaning up an
    // unknown or already removed session succeeds.
    core::errors::Result<bool> cleanup_session(const std::string& session_id);

    const std::filesystem::path& cache_root() const { return cache_root_; }
    std::size_t session_count() const;

private:
    core::errors::Result<SessionState> transition_to_terminal(
        const std::string& session_id, SessionState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(SessionState state);
    static core::errors::AgentError not_found(const std::string& session_id);

    std::filesystem::path cache_root_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionRecord> sessions_;
};

}  // namespace harbor::session
