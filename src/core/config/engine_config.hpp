#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace harbor::core::config {

// Tunables consumed by the conversation engine.
struct EngineConfig {
    std::filesystem::path cache_root = std::filesystem::current_path() / "cache";
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{500};
    std::uint32_t max_iterations = 10;
    double min_completion_confidence = 0.8;
    std::size_t min_reasoning_length = 30;
    std::chrono::milliseconds operation_timeout{30000};
    std::chrono::milliseconds backend_timeout{120000};
};

// Reads an EngineConfig from a JSON file. Keys that are absent keep their
// defaults; unknown keys are ignored.
core::errors::Result<EngineConfig> load_engine_config(
    const std::filesystem::path& config_file);

// Parses the same format from an in-memory document.
core::errors::Result<EngineConfig> parse_engine_config(const std::string& text);

core::errors::Result<EngineConfig> validate_engine_config(EngineConfig config);

}  // namespace harbor::core::config
