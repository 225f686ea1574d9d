#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace harbor::session {

// Private sandbox for one conversation. Every filesystem effect requested on
// behalf of the session is resolved through this object.
//
// The working directory always lies inside `root()`; calls that would move it
// outside fail with a `boundary_violation` error and leave it unchanged.
class SessionScope {
    struct ConstructionTag {};

public:
    // Use create(); the tag keeps construction inside the class.
    SessionScope(ConstructionTag, std::string session_id, std::filesystem::path root);

    static core::errors::Result<std::shared_ptr<SessionScope>> create(
        const std::filesystem::path& cache_root, const std::string& session_id);

    // Session ids become a directory name under the cache root.
    static core::errors::Result<std::string> validate_session_id(
        const std::string& session_id);

    const std::string& session_id() const { return session_id_; }
    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path working_directory() const;

    // Creates the root directory if missing. Safe to call repeatedly.
    core::errors::Result<std::filesystem::path> ensure_root() const;

    // Resolves `relative_path` against the current working directory.
    core::errors::Result<std::filesystem::path> resolve(
        const std::filesystem::path& relative_path) const;

    // Moves the working directory, creating the target directory if needed.
    core::errors::Result<std::filesystem::path> navigate(
        const std::filesystem::path& relative_path);

    std::string to_display_path(const std::filesystem::path& absolute_path) const;

    // Removes the whole session subtree. Returns false when there was nothing
    // to remove.
    core::errors::Result<bool> cleanup();

private:
    std::string session_id_;
    std::filesystem::path root_;

    mutable std::mutex mutex_;
    std::filesystem::path working_directory_;
};

}  // namespace harbor::session
