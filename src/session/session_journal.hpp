#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/conversation_contract.hpp"
#include "protocol/decision.hpp"
#include "protocol/operation_contract.hpp"

namespace harbor::session {

// Append-only JSONL audit log for one session, stored at
// `<session root>/<journal_subdir>/conversation.jsonl`. Every record carries
// `ts_unix_ms`, `event`, `session_id` and `step`.
class SessionJournal {
public:
    explicit SessionJournal(std::filesystem::path session_root,
                            std::string session_id,
                            std::filesystem::path journal_subdir = ".harbor");

    core::errors::Result<std::filesystem::path> journal_path() const;

    core::errors::Result<std::filesystem::path> write_request(const std::string& task) const;

    core::errors::Result<std::filesystem::path> write_prompt(
        std::uint32_t step, const std::string& prompt) const;

    core::errors::Result<std::filesystem::path> write_decision(
        std::uint32_t step, const protocol::Decision& decision,
        const std::string& raw_response, bool malformed) const;

    core::errors::Result<std::filesystem::path> write_operation(
        std::uint32_t step, const std::string& operation_name,
        const protocol::OperationContext& context,
        const protocol::OperationResult& result) const;

    core::errors::Result<std::filesystem::path> write_operation_error(
        std::uint32_t step, const std::string& operation_name,
        const core::errors::AgentError& error) const;

    core::errors::Result<std::filesystem::path> write_final(
        std::uint32_t step, const protocol::ConversationOutcome& outcome) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& event, std::uint32_t step, nlohmann::json payload) const;

    std::filesystem::path session_root_;
    std::string session_id_;
    std::filesystem::path journal_subdir_;
    mutable std::mutex mutex_;
};

}  // namespace harbor::session
