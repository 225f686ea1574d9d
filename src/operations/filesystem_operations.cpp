#include "operations/filesystem_operations.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include "core/logging/logger.hpp"
#include "policy/path_boundary.hpp"
#include "session/session_scope.hpp"

namespace harbor::operations {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::OperationContext;
using protocol::OperationResult;

namespace {

constexpr std::uintmax_t kMaxReadBytes = 1024 * 1024;
constexpr std::size_t kMaxListEntries = 500;

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

std::string display(const OperationContext& context, const std::filesystem::path& path) {
    return context.scope->to_display_path(path);
}

OperationResult missing_parameter(const std::string& key) {
    return OperationResult::failure("Missing required parameter: " + key);
}

bool has_path_parameter(const OperationContext& context) {
    const auto path = string_parameter(context, "path");
    return path.has_value() && !path->empty();
}

std::string entry_type(const std::filesystem::directory_entry& entry) {
    std::error_code ec;
    if (entry.is_symlink(ec)) {
        return "symlink";
    }
    if (entry.is_directory(ec)) {
        return "directory";
    }
    if (entry.is_regular_file(ec)) {
        return "file";
    }
    return "other";
}

}  // namespace

core::errors::Result<std::filesystem::path> resolve_session_path(
    const OperationContext& context, const std::filesystem::path& relative_path) {
    if (!context.scope) {
        return AgentError{ErrorCategory::Internal,
                          "Operation requires a session scope.",
                          "missing_session_scope"};
    }
    auto root = context.scope->ensure_root();
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }

    std::filesystem::path base = context.scope->working_directory();
    if (context.working_directory.has_value() && !context.working_directory->empty()) {
        base = context.working_directory->is_absolute()
                   ? context.working_directory.value()
                   : base / context.working_directory.value();
    }
    return policy::PathBoundary::resolve(context.scope->root(), base, relative_path);
}

std::optional<std::string> string_parameter(const OperationContext& context,
                                            const std::string& key) {
    if (!context.parameters.is_object()) {
        return std::nullopt;
    }
    auto it = context.parameters.find(key);
    if (it == context.parameters.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number() || it->is_boolean()) {
        return it->dump();
    }
    return std::nullopt;
}

bool bool_parameter(const OperationContext& context, const std::string& key,
                    const bool fallback) {
    if (!context.parameters.is_object()) {
        return fallback;
    }
    auto it = context.parameters.find(key);
    if (it == context.parameters.end()) {
        return fallback;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_string()) {
        const auto value = it->get<std::string>();
        return value == "true" || value == "True" || value == "1" || value == "yes";
    }
    if (it->is_number_integer()) {
        return it->get<std::int64_t>() != 0;
    }
    return fallback;
}

// DirectoryCreate

std::string DirectoryCreateOperation::description() const {
    return "Creates a directory and any missing parents (like 'mkdir -p').";
}

std::vector<std::string> DirectoryCreateOperation::capabilities() const {
    return {"dir:create", "directory:make", "fs:mkdir", "folder:create"};
}

json DirectoryCreateOperation::parameters() const {
    return {{"path", "required, directory to create"}};
}

std::vector<std::string> DirectoryCreateOperation::inference_keywords() const {
    return {"mkdir", "create directory", "create a directory", "create folder",
            "new folder"};
}

bool DirectoryCreateOperation::dry_run(const OperationContext& context) const {
    return has_path_parameter(context);
}

core::errors::Result<OperationResult> DirectoryCreateOperation::run(
    OperationContext& context) {
    const auto path = string_parameter(context, "path");
    if (!path.has_value() || path->empty()) {
        return missing_parameter("path");
    }
    auto resolved = resolve_session_path(context, path.value());
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto target = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(target, ec)) {
        context.state["last_path"] = display(context, target);
        return OperationResult::ok(
            {{"message", "Directory already exists"},
             {"path", display(context, target)},
             {"created", false}});
    }
    if (std::filesystem::exists(target, ec)) {
        return OperationResult::failure("A file already exists at " +
                                        display(context, target));
    }

    std::filesystem::create_directories(target, ec);
    if (ec) {
        return OperationResult::failure("Directory creation failed: " + ec.message());
    }

    HARBOR_LOG_DEBUG("DirectoryCreate: " + context.session_id + " created " +
                     display(context, target));
    context.state["last_path"] = display(context, target);
    return OperationResult::ok({{"message", "Directory created"},
                                {"path", display(context, target)},
                                {"created", true}});
}

// DirectoryList

std::string DirectoryListOperation::description() const {
    return "Lists directory contents (like 'ls').";
}

std::vector<std::string> DirectoryListOperation::capabilities() const {
    return {"dir:list", "directory:contents", "fs:explore", "fs:ls"};
}

json DirectoryListOperation::parameters() const {
    return {{"path", "optional, defaults to the working directory"},
            {"recursive", "optional boolean"},
            {"includeHidden", "optional boolean"}};
}

std::vector<std::string> DirectoryListOperation::inference_keywords() const {
    return {"list", "ls", "directory contents", "show files"};
}

bool DirectoryListOperation::dry_run(const OperationContext& context) const {
    return static_cast<bool>(context.scope);
}

core::errors::Result<OperationResult> DirectoryListOperation::run(OperationContext& context) {
    const std::string path = string_parameter(context, "path").value_or(".");
    const bool recursive = bool_parameter(context, "recursive", false);
    const bool include_hidden = bool_parameter(context, "includeHidden", false);

    auto resolved = resolve_session_path(context, path.empty() ? "." : path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto target = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_directory(target, ec)) {
        return OperationResult::failure("Not a directory: " + display(context, target));
    }

    json entries = json::array();
    bool truncated = false;
    const auto add_entry = [&](const std::filesystem::directory_entry& entry) {
        json item;
        item["name"] = entry.path().lexically_relative(target).generic_string();
        item["type"] = entry_type(entry);
        std::error_code size_ec;
        if (entry.is_regular_file(size_ec)) {
            item["size"] = entry.file_size(size_ec);
        }
        entries.push_back(std::move(item));
    };

    const auto options = std::filesystem::directory_options::skip_permission_denied;
    if (recursive) {
        std::filesystem::recursive_directory_iterator it(target, options, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            const bool hidden = it->path().filename().string().rfind('.', 0) == 0;
            if (hidden && !include_hidden) {
                it.disable_recursion_pending();
                continue;
            }
            if (entries.size() >= kMaxListEntries) {
                truncated = true;
                break;
            }
            add_entry(*it);
        }
    } else {
        std::filesystem::directory_iterator it(target, options, ec);
        for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            const bool hidden = it->path().filename().string().rfind('.', 0) == 0;
            if (hidden && !include_hidden) {
                continue;
            }
            if (entries.size() >= kMaxListEntries) {
                truncated = true;
                break;
            }
            add_entry(*it);
        }
    }
    if (ec) {
        return OperationResult::failure("Unable to list directory: " + ec.message());
    }

    std::sort(entries.begin(), entries.end(), [](const json& a, const json& b) {
        return a["name"].get<std::string>() < b["name"].get<std::string>();
    });

    context.state["last_path"] = display(context, target);
    return OperationResult::ok({{"path", display(context, target)},
                                {"entries", entries},
                                {"truncated", truncated}});
}

// DirectoryDelete

std::string DirectoryDeleteOperation::description() const {
    return "Deletes a directory. Non-empty directories need recursive=true.";
}

std::vector<std::string> DirectoryDeleteOperation::capabilities() const {
    return {"dir:delete", "directory:remove", "fs:rmdir"};
}

json DirectoryDeleteOperation::parameters() const {
    return {{"path", "required, directory to delete"},
            {"recursive", "optional boolean, delete contents too"}};
}

std::vector<std::string> DirectoryDeleteOperation::inference_keywords() const {
    return {"rmdir", "delete directory", "remove directory", "delete folder"};
}

bool DirectoryDeleteOperation::dry_run(const OperationContext& context) const {
    return has_path_parameter(context);
}

core::errors::Result<OperationResult> DirectoryDeleteOperation::run(
    OperationContext& context) {
    const auto path = string_parameter(context, "path");
    if (!path.has_value() || path->empty()) {
        return missing_parameter("path");
    }
    auto resolved = resolve_session_path(context, path.value());
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto target = core::errors::get_value(resolved);

    if (policy::PathBoundary::normalize(target) ==
        policy::PathBoundary::normalize(context.scope->root())) {
        return OperationResult::failure("Refusing to delete the session root.");
    }

    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        return OperationResult::failure("Directory does not exist: " +
                                        display(context, target));
    }
    if (!std::filesystem::is_directory(target, ec)) {
        return OperationResult::failure("Not a directory: " + display(context, target));
    }

    const bool recursive = bool_parameter(context, "recursive", false);
    std::uintmax_t removed = 0;
    if (recursive) {
        removed = std::filesystem::remove_all(target, ec);
    } else {
        removed = std::filesystem::remove(target, ec) ? 1 : 0;
    }
    if (ec) {
        return OperationResult::failure("Directory deletion failed: " + ec.message());
    }

    return OperationResult::ok({{"message", "Directory deleted"},
                                {"path", display(context, target)},
                                {"removed_entries", removed}});
}

// FileRead

std::string FileReadOperation::description() const {
    return "Reads a text file (like 'cat').";
}

std::vector<std::string> FileReadOperation::capabilities() const {
    return {"file:read", "file:content", "fs:cat"};
}

json FileReadOperation::parameters() const {
    return {{"path", "required, file to read"}};
}

std::vector<std::string> FileReadOperation::inference_keywords() const {
    return {"read file", "read the file", "cat ", "open file", "file contents"};
}

bool FileReadOperation::dry_run(const OperationContext& context) const {
    return has_path_parameter(context);
}

core::errors::Result<OperationResult> FileReadOperation::run(OperationContext& context) {
    const auto path = string_parameter(context, "path");
    if (!path.has_value() || path->empty()) {
        return missing_parameter("path");
    }
    auto resolved = resolve_session_path(context, path.value());
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return OperationResult::failure("File does not exist: " +
                                        display(context, file_path));
    }
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return OperationResult::failure("Path is not a regular file: " +
                                        display(context, file_path));
    }
    const auto size = std::filesystem::file_size(file_path, ec);
    if (ec || size > kMaxReadBytes) {
        return OperationResult::failure("File is too large to read: " +
                                        display(context, file_path));
    }
    if (is_probably_binary(file_path)) {
        return OperationResult::failure("Refusing to read binary file: " +
                                        display(context, file_path));
    }

    std::ifstream in(file_path);
    if (!in.is_open()) {
        return OperationResult::failure("Failed to open file: " +
                                        display(context, file_path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return OperationResult::failure("I/O error while reading file: " +
                                        display(context, file_path));
    }

    context.state["last_path"] = display(context, file_path);
    return OperationResult::ok({{"path", display(context, file_path)},
                                {"content", buffer.str()},
                                {"size", size}});
}

// FileWrite

std::string FileWriteOperation::description() const {
    return "Writes text to a file, creating parent directories as needed.";
}

std::vector<std::string> FileWriteOperation::capabilities() const {
    return {"file:write", "file:create", "fs:write"};
}

json FileWriteOperation::parameters() const {
    return {{"path", "required, file to write"},
            {"content", "required, text to write"},
            {"append", "optional boolean, append instead of overwrite"}};
}

std::vector<std::string> FileWriteOperation::inference_keywords() const {
    return {"write file", "write to", "create file", "create a file", "save"};
}

bool FileWriteOperation::dry_run(const OperationContext& context) const {
    return has_path_parameter(context) &&
           string_parameter(context, "content").has_value();
}

core::errors::Result<OperationResult> FileWriteOperation::run(OperationContext& context) {
    const auto path = string_parameter(context, "path");
    if (!path.has_value() || path->empty()) {
        return missing_parameter("path");
    }
    const auto content = string_parameter(context, "content");
    if (!content.has_value()) {
        return missing_parameter("content");
    }
    auto resolved = resolve_session_path(context, path.value());
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return OperationResult::failure("Path is a directory: " +
                                        display(context, file_path));
    }
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return OperationResult::failure("Unable to create parent directory: " +
                                        ec.message());
    }

    const bool append = bool_parameter(context, "append", false);
    std::ofstream out(file_path, append ? std::ios::app : std::ios::trunc);
    if (!out.is_open()) {
        return OperationResult::failure("Failed to open file for writing: " +
                                        display(context, file_path));
    }
    out << content.value();
    if (!out.good()) {
        return OperationResult::failure("Failed to write file: " +
                                        display(context, file_path));
    }

    context.state["last_path"] = display(context, file_path);
    return OperationResult::ok({{"message", append ? "Content appended" : "File written"},
                                {"path", display(context, file_path)},
                                {"bytes_written", content->size()}});
}

// FileDelete

std::string FileDeleteOperation::description() const {
    return "Deletes a single file (like 'rm').";
}

std::vector<std::string> FileDeleteOperation::capabilities() const {
    return {"file:delete", "file:remove", "fs:rm"};
}

json FileDeleteOperation::parameters() const {
    return {{"path", "required, file to delete"}};
}

std::vector<std::string> FileDeleteOperation::inference_keywords() const {
    return {"delete file", "remove file", "rm "};
}

bool FileDeleteOperation::dry_run(const OperationContext& context) const {
    return has_path_parameter(context);
}

core::errors::Result<OperationResult> FileDeleteOperation::run(OperationContext& context) {
    const auto path = string_parameter(context, "path");
    if (!path.has_value() || path->empty()) {
        return missing_parameter("path");
    }
    auto resolved = resolve_session_path(context, path.value());
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto file_path = core::errors::get_value(resolved);

    std::error_code ec;
    const auto status = std::filesystem::symlink_status(file_path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return OperationResult::failure("File does not exist: " +
                                        display(context, file_path));
    }
    if (std::filesystem::is_directory(status)) {
        return OperationResult::failure("Path is a directory, use DirectoryDelete: " +
                                        display(context, file_path));
    }
    if (!std::filesystem::remove(file_path, ec) || ec) {
        return OperationResult::failure("File deletion failed: " +
                                        (ec ? ec.message() : display(context, file_path)));
    }

    return OperationResult::ok({{"message", "File deleted"},
                                {"path", display(context, file_path)}});
}

// ChangeDirectory

std::string ChangeDirectoryOperation::description() const {
    return "Changes the session working directory (like 'cd'), creating it if missing.";
}

std::vector<std::string> ChangeDirectoryOperation::capabilities() const {
    return {"nav:cd", "directory:change", "cursor:navigate"};
}

json ChangeDirectoryOperation::parameters() const {
    return {{"path", "required, relative target directory"}};
}

std::vector<std::string> ChangeDirectoryOperation::inference_keywords() const {
    return {"cd ", "change directory", "navigate", "move into"};
}

bool ChangeDirectoryOperation::dry_run(const OperationContext& context) const {
    return has_path_parameter(context);
}

core::errors::Result<OperationResult> ChangeDirectoryOperation::run(
    OperationContext& context) {
    const auto path = string_parameter(context, "path");
    if (!path.has_value() || path->empty()) {
        return missing_parameter("path");
    }
    if (!context.scope) {
        return AgentError{ErrorCategory::Internal,
                          "Operation requires a session scope.",
                          "missing_session_scope"};
    }

    auto navigated = context.scope->navigate(path.value());
    if (core::errors::is_error(navigated)) {
        const auto& error = core::errors::get_error(navigated);
        if (core::errors::is_boundary_violation(error)) {
            return error;
        }
        return OperationResult::failure(error.message);
    }

    const auto working_directory = display(context, core::errors::get_value(navigated));
    context.working_directory.reset();
    context.state["working_directory"] = working_directory;
    return OperationResult::ok({{"working_directory", working_directory}});
}

// PrintWorkingDirectory

std::string PrintWorkingDirectoryOperation::description() const {
    return "Shows the session working directory relative to the session root (like 'pwd').";
}

std::vector<std::string> PrintWorkingDirectoryOperation::capabilities() const {
    return {"nav:pwd", "directory:current"};
}

std::vector<std::string> PrintWorkingDirectoryOperation::inference_keywords() const {
    return {"pwd", "working directory", "current directory"};
}

bool PrintWorkingDirectoryOperation::dry_run(const OperationContext& context) const {
    return static_cast<bool>(context.scope);
}

core::errors::Result<OperationResult> PrintWorkingDirectoryOperation::run(
    OperationContext& context) {
    if (!context.scope) {
        return AgentError{ErrorCategory::Internal,
                          "Operation requires a session scope.",
                          "missing_session_scope"};
    }
    const auto working_directory = display(context, context.scope->working_directory());
    context.state["working_directory"] = working_directory;
    return OperationResult::ok({{"working_directory", working_directory}});
}

}  // namespace harbor::operations
