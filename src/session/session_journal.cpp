#include "session/session_journal.hpp"

#include <chrono>
#include <fstream>
#include <utility>

namespace harbor::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxRecordedText = 64 * 1024;

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

std::string clip(const std::string& text) {
    if (text.size() <= kMaxRecordedText) {
        return text;
    }
    return text.substr(0, kMaxRecordedText) + "...";
}

json attempt_to_json(const protocol::AttemptRecord& attempt) {
    json payload;
    payload["attempt"] = attempt.attempt_number;
    payload["method"] = attempt.method;
    payload["success"] = attempt.success;
    payload["error_message"] = attempt.error_message;
    payload["duration_ms"] = attempt.duration.count();
    return payload;
}

}  // namespace

SessionJournal::SessionJournal(std::filesystem::path session_root, std::string session_id,
                               std::filesystem::path journal_subdir)
    : session_root_(std::move(session_root)),
      session_id_(std::move(session_id)),
      journal_subdir_(std::move(journal_subdir)) {}

core::errors::Result<std::filesystem::path> SessionJournal::journal_path() const {
    if (session_id_.empty()) {
        return AgentError{ErrorCategory::Input, "Session ID cannot be empty.",
                          "invalid_session_id"};
    }

    std::error_code ec;
    const auto journal_dir = session_root_ / journal_subdir_;
    std::filesystem::create_directories(journal_dir, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to create journal directory: " + journal_dir.string(),
                          "journal_dir_create_failed"};
    }
    return journal_dir / "conversation.jsonl";
}

core::errors::Result<std::filesystem::path> SessionJournal::append_event(
    const std::string& event, const std::uint32_t step, json payload) const {
    json record;
    record["ts_unix_ms"] = now_unix_ms();
    record["event"] = event;
    record["session_id"] = session_id_;
    record["step"] = step;
    record["payload"] = std::move(payload);

    std::lock_guard<std::mutex> lock(mutex_);
    auto path_result = journal_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto journal_file = core::errors::get_value(path_result);

    std::ofstream out(journal_file, std::ios::app);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to open journal file: " + journal_file.string(),
                          "journal_open_failed"};
    }

    // Invalid UTF-8 from a backend or a command must not abort the write.
    out << record.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to write journal event: " + journal_file.string(),
                          "journal_write_failed"};
    }
    return journal_file;
}

core::errors::Result<std::filesystem::path> SessionJournal::write_request(
    const std::string& task) const {
    json payload;
    payload["task"] = task;
    return append_event("request", 0, std::move(payload));
}

core::errors::Result<std::filesystem::path> SessionJournal::write_prompt(
    const std::uint32_t step, const std::string& prompt) const {
    json payload;
    payload["prompt"] = clip(prompt);
    return append_event("prompt", step, std::move(payload));
}

core::errors::Result<std::filesystem::path> SessionJournal::write_decision(
    const std::uint32_t step, const protocol::Decision& decision,
    const std::string& raw_response, const bool malformed) const {
    json payload;
    payload["raw_response"] = clip(raw_response);
    payload["malformed"] = malformed;
    payload["decision"] = protocol::to_json(decision);
    return append_event("decision", step, std::move(payload));
}

core::errors::Result<std::filesystem::path> SessionJournal::write_operation(
    const std::uint32_t step, const std::string& operation_name,
    const protocol::OperationContext& context,
    const protocol::OperationResult& result) const {
    json payload;
    payload["operation"] = operation_name;
    payload["parameters"] = context.parameters;
    payload["success"] = result.success;
    payload["method_used"] = result.method_used;
    payload["total_attempts"] = result.total_attempts;
    payload["execution_time_ms"] = result.execution_time.count();
    payload["error_message"] = result.error_message.value_or("");
    payload["output"] = result.output;
    json attempts = json::array();
    for (const auto& attempt : context.execution_history) {
        attempts.push_back(attempt_to_json(attempt));
    }
    payload["attempts"] = std::move(attempts);
    return append_event("operation", step, std::move(payload));
}

core::errors::Result<std::filesystem::path> SessionJournal::write_operation_error(
    const std::uint32_t step, const std::string& operation_name,
    const core::errors::AgentError& error) const {
    json payload;
    payload["operation"] = operation_name;
    payload["success"] = false;
    payload["error_category"] = core::errors::to_string(error.category);
    payload["error_code"] = error.code;
    payload["error_message"] = error.message;
    return append_event("operation", step, std::move(payload));
}

core::errors::Result<std::filesystem::path> SessionJournal::write_final(
    const std::uint32_t step, const protocol::ConversationOutcome& outcome) const {
    json payload;
    payload["state"] = protocol::to_string(outcome.state);
    payload["response"] = clip(outcome.response);
    payload["completion_confirmed"] = outcome.completion_confirmed;
    payload["iterations"] = outcome.iterations;
    payload["backend_round_trips"] = outcome.backend_round_trips;
    payload["error_message"] = outcome.error.has_value() ? outcome.error->message : "";
    return append_event("final", step, std::move(payload));
}

}  // namespace harbor::session
