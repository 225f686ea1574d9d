#include "core/config/engine_config.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace harbor::core::config {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError invalid_config(const std::string& message) {
    return AgentError{ErrorCategory::Input, message, "invalid_config",
                      "Check the engine configuration file."};
}

bool read_unsigned(const json& doc, const char* key, std::uint64_t& out,
                   std::string& failure) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return true;
    }
    if (!it->is_number_unsigned()) {
        failure = std::string("Config key '") + key +
                  "' must be a non-negative integer.";
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

}  // namespace

core::errors::Result<EngineConfig> parse_engine_config(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return invalid_config(std::string("Config is not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        return invalid_config("Config root must be a JSON object.");
    }

    EngineConfig config;
    std::string failure;

    if (auto it = doc.find("cache_root"); it != doc.end()) {
        if (!it->is_string() || it->get<std::string>().empty()) {
            return invalid_config("Config key 'cache_root' must be a non-empty string.");
        }
        config.cache_root = it->get<std::string>();
    }

    std::uint64_t max_retries = config.max_retries;
    std::uint64_t base_delay_ms = static_cast<std::uint64_t>(config.base_delay.count());
    std::uint64_t max_iterations = config.max_iterations;
    std::uint64_t min_reasoning_length = config.min_reasoning_length;
    std::uint64_t operation_timeout_ms =
        static_cast<std::uint64_t>(config.operation_timeout.count());
    std::uint64_t backend_timeout_ms =
        static_cast<std::uint64_t>(config.backend_timeout.count());

    if (!read_unsigned(doc, "max_retries", max_retries, failure) ||
        !read_unsigned(doc, "base_delay_ms", base_delay_ms, failure) ||
        !read_unsigned(doc, "max_iterations", max_iterations, failure) ||
        !read_unsigned(doc, "min_reasoning_length", min_reasoning_length, failure) ||
        !read_unsigned(doc, "operation_timeout_ms", operation_timeout_ms, failure) ||
        !read_unsigned(doc, "backend_timeout_ms", backend_timeout_ms, failure)) {
        return invalid_config(failure);
    }

    if (auto it = doc.find("min_completion_confidence"); it != doc.end()) {
        if (!it->is_number()) {
            return invalid_config(
                "Config key 'min_completion_confidence' must be a number.");
        }
        config.min_completion_confidence = it->get<double>();
    }

    // Clamp before narrowing; bounds are enforced by validate_engine_config.
    config.max_retries = static_cast<std::uint32_t>(std::min<std::uint64_t>(max_retries, 1000));
    config.base_delay = std::chrono::milliseconds(
        static_cast<std::int64_t>(std::min<std::uint64_t>(base_delay_ms, 3600000)));
    config.max_iterations =
        static_cast<std::uint32_t>(std::min<std::uint64_t>(max_iterations, 100000));
    config.min_reasoning_length = static_cast<std::size_t>(min_reasoning_length);
    config.operation_timeout = std::chrono::milliseconds(
        static_cast<std::int64_t>(std::min<std::uint64_t>(operation_timeout_ms, 86400000)));
    config.backend_timeout = std::chrono::milliseconds(
        static_cast<std::int64_t>(std::min<std::uint64_t>(backend_timeout_ms, 86400000)));

    return validate_engine_config(std::move(config));
}

core::errors::Result<EngineConfig> load_engine_config(
    const std::filesystem::path& config_file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_file, ec) || ec) {
        return AgentError{ErrorCategory::Input,
                          "Config file does not exist: " + config_file.string(),
                          "invalid_config"};
    }

    std::ifstream in(config_file);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input,
                          "Unable to open config file: " + config_file.string(),
                          "invalid_config"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_engine_config(buffer.str());
}

core::errors::Result<EngineConfig> validate_engine_config(EngineConfig config) {
    if (config.cache_root.empty()) {
        return invalid_config("cache_root cannot be empty.");
    }
    if (config.max_retries > 20) {
        return invalid_config("max_retries must be between 0 and 20.");
    }
    if (config.base_delay.count() < 0 || config.base_delay.count() > 60000) {
        return invalid_config("base_delay_ms must be between 0 and 60000.");
    }
    if (config.max_iterations == 0 || config.max_iterations > 1000) {
        return invalid_config("max_iterations must be between 1 and 1000.");
    }
    if (config.min_completion_confidence < 0.0 ||
        config.min_completion_confidence > 1.0) {
        return invalid_config("min_completion_confidence must be within [0, 1].");
    }
    if (config.operation_timeout.count() <= 0 || config.backend_timeout.count() <= 0) {
        return invalid_config("Timeouts must be greater than zero.");
    }

    std::error_code ec;
    if (config.cache_root.is_relative()) {
        config.cache_root = std::filesystem::absolute(config.cache_root, ec);
        if (ec) {
            return invalid_config("Unable to resolve cache_root: " +
                                  config.cache_root.string());
        }
    }
    config.cache_root = config.cache_root.lexically_normal();
    return config;
}

}  // namespace harbor::core::config
