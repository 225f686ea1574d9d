#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace harbor::runtime {

struct ProcessRequest {
    std::vector<std::string> argv;  // argv[0] is looked up on PATH
    std::filesystem::path working_directory;
    std::string stdin_text;
    std::chrono::milliseconds timeout{0};  // 0 disables the deadline
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds duration{0};
};

// Spawns `argv` with pipes on all three standard streams and waits for it,
// killing the child on timeout or cancellation. Only failures to set up the
// process are errors; a non-zero exit is reported through the capture.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

// "/bin/sh -c <command>"
std::vector<std::string> shell_argv(const std::string& command);

}  // namespace harbor::runtime
