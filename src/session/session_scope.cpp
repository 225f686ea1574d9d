#include "session/session_scope.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/path_boundary.hpp"

namespace harbor::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using policy::PathBoundary;

namespace {

constexpr std::size_t kMaxSessionIdLength = 128;

AgentError invalid_session_id(const std::string& message) {
    return AgentError{ErrorCategory::Input, message, "invalid_session_id",
                      "Session ids may contain letters, digits, '-', '_' and '.'."};
}

}  // namespace

SessionScope::SessionScope(ConstructionTag, std::string session_id, std::filesystem::path root)
    : session_id_(std::move(session_id)),
      root_(std::move(root)),
      working_directory_(root_) {}

core::errors::Result<std::string> SessionScope::validate_session_id(
    const std::string& session_id) {
    if (session_id.empty()) {
        return invalid_session_id("Session id cannot be empty.");
    }
    if (session_id.size() > kMaxSessionIdLength) {
        return invalid_session_id("Session id is too long.");
    }
    if (session_id == "." || session_id.find("..") != std::string::npos) {
        return invalid_session_id("Session id cannot contain '..': " + session_id);
    }
    const bool bad_char =
        std::any_of(session_id.begin(), session_id.end(), [](const unsigned char c) {
            return c == '/' || c == '\\' || c == ':' || std::iscntrl(c) != 0;
        });
    if (bad_char) {
        return invalid_session_id("Session id contains a forbidden character.");
    }
    return session_id;
}

core::errors::Result<std::shared_ptr<SessionScope>> SessionScope::create(
    const std::filesystem::path& cache_root, const std::string& session_id) {
    auto validated = validate_session_id(session_id);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    if (cache_root.empty()) {
        return AgentError{ErrorCategory::Input, "Cache root cannot be empty.",
                          "invalid_cache_root"};
    }

    std::error_code ec;
    std::filesystem::path absolute_cache = std::filesystem::absolute(cache_root, ec);
    if (ec) {
        return AgentError{ErrorCategory::Input,
                          "Unable to resolve cache root: " + cache_root.string(),
                          "invalid_cache_root"};
    }

    const auto root = PathBoundary::normalize(absolute_cache / session_id);
    return std::make_shared<SessionScope>(ConstructionTag{}, session_id, root);
}

std::filesystem::path SessionScope::working_directory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return working_directory_;
}

core::errors::Result<std::filesystem::path> SessionScope::ensure_root() const {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to create session root: " + ec.message(),
                          "session_root_create_failed"};
    }
    return root_;
}

core::errors::Result<std::filesystem::path> SessionScope::resolve(
    const std::filesystem::path& relative_path) const {
    auto root = ensure_root();
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }

    auto resolved =
        PathBoundary::resolve(root_, working_directory(), relative_path);
    if (core::errors::is_error(resolved)) {
        HARBOR_LOG_WARN("SessionScope: " + session_id_ + " rejected path '" +
                        relative_path.string() + "'");
    }
    return resolved;
}

core::errors::Result<std::filesystem::path> SessionScope::navigate(
    const std::filesystem::path& relative_path) {
    auto resolved = resolve(relative_path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto target = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::exists(target, ec) &&
        !std::filesystem::is_directory(target, ec)) {
        return AgentError{ErrorCategory::Execution,
                          "Not a directory: " + to_display_path(target),
                          "not_a_directory"};
    }
    std::filesystem::create_directories(target, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to create directory " + to_display_path(target) +
                              ": " + ec.message(),
                          "directory_create_failed"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    working_directory_ = target;
    HARBOR_LOG_DEBUG("SessionScope: " + session_id_ + " working directory -> " +
                     PathBoundary::to_display_path(root_, target));
    return working_directory_;
}

std::string SessionScope::to_display_path(
    const std::filesystem::path& absolute_path) const {
    return PathBoundary::to_display_path(root_, absolute_path);
}

core::errors::Result<bool> SessionScope::cleanup() {
    std::error_code ec;
    const bool existed = std::filesystem::exists(root_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to inspect session root: " + ec.message(),
                          "session_cleanup_failed"};
    }

    if (existed) {
        std::filesystem::remove_all(root_, ec);
        if (ec) {
            return AgentError{ErrorCategory::Internal,
                              "Unable to remove session root: " + ec.message(),
                              "session_cleanup_failed"};
        }
        HARBOR_LOG_INFO("SessionScope: removed session " + session_id_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    working_directory_ = root_;
    return existed;
}

}  // namespace harbor::session
