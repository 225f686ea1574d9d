#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace harbor::session {
class SessionScope;
}

namespace harbor::protocol {

    // One entry in the attempt log of a single logical invocation.
    // Appended by the invoker, never edited afterwards.
    struct AttemptRecord {
        std::string method;            // "primary" or an alternative's name
        bool success = false;
        std::string error_message;
        std::chrono::milliseconds duration{0};
        std::uint32_t attempt_number = 0;  // 1-based, across retries and fallbacks
    };

    // What an operation receives for one invocation.
    struct OperationContext {
        nlohmann::json parameters = nlohmann::json::object();

        // Intermediate results shared between chained operations.
        nlohmann::json state = nlohmann::json::object();

        std::string session_id;
        std::optional<std::filesystem::path> working_directory;
        std::shared_ptr<session::SessionScope> scope;
        std::shared_ptr<std::atomic_bool> cancel_token;

        // Owned by the invoker; operations only read these.
        std::uint32_t retry_attempt = 0;
        std::vector<AttemptRecord> execution_history;
        std::optional<std::string> previous_failure_reason;
    };

    struct OperationResult {
        bool success = false;
        nlohmann::json output;
        std::optional<std::string> error_message;  // set iff !success
        std::chrono::milliseconds execution_time{0};
        std::uint32_t total_attempts = 0;
        std::string method_used;
        bool has_more_alternatives = false;

        static OperationResult ok(nlohmann::json output) {
            OperationResult result;
            result.success = true;
            result.output = std::move(output);
            return result;
        }

        static OperationResult failure(std::string message) {
            OperationResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

} // namespace harbor::protocol
