#include "runtime/scripted_backend.hpp"

#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace harbor::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

ScriptedBackend::ScriptedBackend(std::vector<std::string> responses)
    : responses_(std::move(responses)) {}

core::errors::Result<std::vector<std::string>> ScriptedBackend::load_script(
    const std::filesystem::path& script_file) {
    std::ifstream in(script_file);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input,
                          "Unable to open script file: " + script_file.string(),
                          "invalid_script"};
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        return AgentError{ErrorCategory::Input,
                          std::string("Script file is not valid JSON: ") + e.what(),
                          "invalid_script"};
    }
    if (!doc.is_array() || doc.empty()) {
        return AgentError{ErrorCategory::Input,
                          "Script file must contain a non-empty JSON array.",
                          "invalid_script"};
    }

    std::vector<std::string> responses;
    responses.reserve(doc.size());
    for (const auto& entry : doc) {
        responses.push_back(entry.is_string() ? entry.get<std::string>() : entry.dump());
    }
    return responses;
}

core::errors::Result<std::string> ScriptedBackend::send(
    const std::string& prompt, const protocol::ConversationHistory& history) {
    static_cast<void>(history);
    std::lock_guard<std::mutex> lock(mutex_);
    prompts_.push_back(prompt);
    if (next_ >= responses_.size()) {
        return AgentError{ErrorCategory::Provider,
                          "Scripted backend has no more responses.", "script_exhausted"};
    }
    return responses_[next_++];
}

std::vector<std::string> ScriptedBackend::prompts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prompts_;
}

std::size_t ScriptedBackend::calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prompts_.size();
}

}  // namespace harbor::runtime
