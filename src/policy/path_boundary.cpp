#include "policy/path_boundary.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <system_error>

namespace harbor::policy {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool same_element(const std::filesystem::path& a, const std::filesystem::path& b,
                  const bool case_insensitive) {
    if (!case_insensitive) {
        return a == b;
    }
    return lowercase(a.string()) == lowercase(b.string());
}

// "a/b/" iterates as {"a", "b", ""}; drop the trailing empty element.
std::filesystem::path strip_trailing_separator(std::filesystem::path path) {
    while (path.has_relative_path() && path.filename().empty()) {
        path = path.parent_path();
    }
    return path;
}

AgentError boundary_violation(const std::string& message) {
    return AgentError{ErrorCategory::Policy, message, "boundary_violation",
                      "Use paths relative to the session working directory."};
}

}  // namespace

std::filesystem::path PathBoundary::normalize(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        resolved = path.lexically_normal();
    }
    return strip_trailing_separator(resolved);
}

bool PathBoundary::is_within_root(const std::filesystem::path& root,
                                  const std::filesystem::path& child,
                                  const bool case_insensitive) {
    const auto clean_root = strip_trailing_separator(root);
    const auto clean_child = strip_trailing_separator(child);

    auto root_it = clean_root.begin();
    auto child_it = clean_child.begin();
    for (; root_it != clean_root.end() && child_it != clean_child.end();
         ++root_it, ++child_it) {
        if (!same_element(*root_it, *child_it, case_insensitive)) {
            return false;
        }
    }
    if (root_it != clean_root.end()) {
        return false;
    }

    // Remaining elements must descend; a leftover ".." would climb back out.
    for (; child_it != clean_child.end(); ++child_it) {
        if (*child_it == "..") {
            return false;
        }
    }
    return true;
}

core::errors::Result<std::filesystem::path> PathBoundary::resolve(
    const std::filesystem::path& root,
    const std::filesystem::path& working_directory,
    const std::filesystem::path& relative_path) {
    if (!root.is_absolute()) {
        return AgentError{ErrorCategory::Internal,
                          "Session root must be absolute: " + root.string(),
                          "invalid_session_root"};
    }
    if (relative_path.has_root_directory() || relative_path.has_root_name()) {
        return boundary_violation("Absolute paths are not allowed: " +
                                  relative_path.string());
    }

    const std::filesystem::path canonical_root = normalize(root);
    std::filesystem::path base = working_directory.empty() ? canonical_root
                                                           : normalize(working_directory);
    if (!is_within_root(canonical_root, base)) {
        return boundary_violation("Working directory lies outside the session root.");
    }

    const std::filesystem::path candidate =
        relative_path.empty() ? base : normalize(base / relative_path);
    if (!is_within_root(canonical_root, candidate)) {
        return boundary_violation("Path '" + relative_path.string() +
                                  "' would escape the session boundary.");
    }
    return candidate;
}

std::string PathBoundary::to_display_path(const std::filesystem::path& root,
                                          const std::filesystem::path& absolute_path) {
    if (!absolute_path.is_absolute()) {
        return kOutsideSessionSentinel;
    }

    const std::filesystem::path canonical_root = normalize(root);
    const std::filesystem::path candidate = normalize(absolute_path);
    if (!is_within_root(canonical_root, candidate)) {
        return kOutsideSessionSentinel;
    }

    const auto root_depth =
        std::distance(canonical_root.begin(), canonical_root.end());
    auto child_it = candidate.begin();
    std::advance(child_it, root_depth);

    std::filesystem::path relative;
    for (; child_it != candidate.end(); ++child_it) {
        relative /= *child_it;
    }
    return relative.empty() ? std::string(".") : relative.generic_string();
}

}  // namespace harbor::policy
