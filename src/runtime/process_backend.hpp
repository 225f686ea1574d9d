#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include "protocol/backend_contract.hpp"

namespace harbor::runtime {

struct ProcessBackendOptions {
    std::string command;  // run through /bin/sh -c
    std::chrono::milliseconds timeout{120000};
    bool include_history = true;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Backend adapter for any local command that reads a prompt on stdin and
// writes its answer to stdout.
class ProcessBackend : public protocol::Backend {
public:
    explicit ProcessBackend(ProcessBackendOptions options);

    std::string name() const override { return "process"; }

    core::errors::Result<std::string> send(
        const std::string& prompt, const protocol::ConversationHistory& history) override;

    // Plain-text transcript: one "### <role>" header per turn, then the prompt.
    static std::string render_transcript(const std::string& prompt,
                                         const protocol::ConversationHistory& history);

private:
    ProcessBackendOptions options_;
};

}  // namespace harbor::runtime
