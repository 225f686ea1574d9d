#pragma once

#include <filesystem>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace harbor::policy {

#if defined(_WIN32) || defined(__APPLE__)
inline constexpr bool kCaseInsensitivePaths = true;
#else
inline constexpr bool kCaseInsensitivePaths = false;
#endif

// Rendered instead of any path that lies outside a session root.
inline constexpr const char* kOutsideSessionSentinel = "<path outside session>";

// Stateless path containment rules shared by every session.
class PathBoundary {
public:
    // Resolves `relative_path` against `working_directory` and requires the
    // result to equal `root` or lie beneath it. Absolute inputs are rejected.
    static core::errors::Result<std::filesystem::path> resolve(
        const std::filesystem::path& root,
        const std::filesystem::path& working_directory,
        const std::filesystem::path& relative_path);

    // Element-wise prefix test; `child` equal to `root` counts as inside.
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child,
                               bool case_insensitive = kCaseInsensitivePaths);

    // Path relative to `root` ("." for the root itself), or the sentinel.
    static std::string to_display_path(const std::filesystem::path& root,
                                       const std::filesystem::path& absolute_path);

    // Lexical normalization plus symlink resolution for the existing prefix.
    static std::filesystem::path normalize(const std::filesystem::path& path);
};

}  // namespace harbor::policy
