#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "protocol/backend_contract.hpp"

namespace harbor::runtime {

// Replays canned responses in order. Used for offline runs and tests.
class ScriptedBackend : public protocol::Backend {
public:
    explicit ScriptedBackend(std::vector<std::string> responses);

    // Script file: a JSON array whose elements are response strings, or
    // objects that are sent back serialized.
    static core::errors::Result<std::vector<std::string>> load_script(
        const std::filesystem::path& script_file);

    std::string name() const override { return "scripted"; }

    core::errors::Result<std::string> send(
        const std::string& prompt, const protocol::ConversationHistory& history) override;

    std::vector<std::string> prompts() const;
    std::size_t calls() const;

private:
    std::vector<std::string> responses_;
    mutable std::mutex mutex_;
    std::size_t next_ = 0;
    std::vector<std::string> prompts_;
};

}  // namespace harbor::runtime
