#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "operations/operation.hpp"

namespace harbor::operations {

// Resolves `relative_path` inside the session carried by `context`, honoring
// the context's working directory override.
core::errors::Result<std::filesystem::path> resolve_session_path(
    const protocol::OperationContext& context, const std::filesystem::path& relative_path);

// String view of a parameter; numbers and booleans are rendered as JSON.
std::optional<std::string> string_parameter(const protocol::OperationContext& context,
                                            const std::string& key);
bool bool_parameter(const protocol::OperationContext& context, const std::string& key,
                    bool fallback);

class DirectoryCreateOperation : public Operation {
public:
    std::string name() const override { return "DirectoryCreate"; }
    std::string description() const override;
    std::vector<std::string> capabilities() const override;
    nlohmann::json parameters() const override;
    bool requires_file_system() const override { return true; }
    std::vector<std::string> inference_keywords() const override;
    core::errors::Result<protocol::OperationResult> run(
        protocol::OperationContext& context) override;
    bool dry_run(const protocol::OperationContext& context) const override;
};

class DirectoryListOperation : public Operation {
public:
    std::string name() const override { return "DirectoryList"; }
    std::string description() const override;
    std::vector<std::string> capabilities() const override;
    nlohmann::json parameters() const override;
    bool requires_file_system() const override { return true; }
    std::vector<std::string> inference_keywords() const override;
    core::errors::Result<protocol::OperationResult> run(
        protocol::OperationContext& context) override;
    bool dry_run(const protocol::OperationContext& context) const override;
};

class DirectoryDeleteOperation : public Operation {
public:
    std::string name() const override { return "DirectoryDelete"; }
    std::string description() const override;
    std::vector<std::string> capabilities() const override;
    nlohmann::json parameters() const override;
    bool requires_file_system() const override { return true; }
    std::vector<std::string> inference_keywords() const override;
    core::errors::Result<protocol::OperationResult> run(
        protocol::OperationContext& context) override;
    bool dry_run(const protocol::OperationContext& context) const override;
};

class FileReadOperation : public Operation {
public:
    std::string name() const override { return "FileRead"; }
    std::string description() const override;
    std::vector<std::string> capabilities() const override;
    nlohmann::json parameters() const override;
    bool requires_file_system() const override { return true; }
    std::vector<std::string> inference_keywords() const override;
    core::errors::Result<protocol::OperationResult> run(
        protocol::OperationContext& context) override;
    bool dry_run(const protocol::OperationContext& context) const override;
};

class FileWriteOperation : public Operation {
public:
    std::string name() const override { return "FileWrite"; }
    std::string description() const override;
    std::vector<std::string> capabilities() const override;
    nlohmann::json parameters() const override;
    bool requires_file_system() const override { return true; }
    std::vector<std::string> inference_keywords() const override;
    core::errors::Result<protocol::OperationResult> run(
        protocol::OperationContext& context) override;
    bool dry_run(const protocol::OperationContext& context) const override;
};

class FileDeleteOperation : public Operation {
public:
    std::string name() const override { return "FileDelete"; }
    std::string description() const override;
    std::vector<std::string> capabilities() const override;
    nlohmann::json parameters() const override;
    bool requires_file_system() const override { return true; }
    std::vector<std::string> inference_keywords() const override;
    core::errors::Result<protocol::OperationResult> run(
        protocol::OperationContext& context) override;
    bool dry_run(const protocol::OperationContext& context) const override;
};

class ChangeDirectoryOperation : public Operation {
public:
    std::string name() const override { return "ChangeDirectory"; }
    std::string description() const override;
    std::vector<std::string> capabilities() const override;
    nlohmann::json parameters() const override;
    bool requires_file_system() const override { return true; }
    std::vector<std::string> inference_keywords() const override;
    core::errors::Result<protocol::OperationResult> run(
        protocol::OperationContext& context) override;
    bool dry_run(const protocol::OperationContext& context) const override;
};

class PrintWorkingDirectoryOperation : public Operation {
public:
    std::string name() const override { return "PrintWorkingDirectory"; }
    std::string description() const override;
    std::vector<std::string> capabilities() const override;
    bool requires_file_system() const override { return true; }
    std::vector<std::string> inference_keywords() const override;
    core::errors::Result<protocol::OperationResult> run(
        protocol::OperationContext& context) override;
    bool dry_run(const protocol::OperationContext& context) const override;
};

}  // namespace harbor::operations
