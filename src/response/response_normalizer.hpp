#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/decision.hpp"

namespace harbor::operations {
class OperationRegistry;
}

namespace harbor::response {

enum class CanonicalField {
    TaskCompleted,
    Reasoning,
    NextStep,
    RequiresOperation,
    OperationName,
    Parameters,
    Confidence,
    Assumptions,
    Risks,
    Response,
    Ignored,  // known legacy keys with no canonical meaning
    Unknown
};

struct NormalizerSettings {
    double min_completion_confidence = 0.8;
    std::size_t min_reasoning_length = 30;
};

// Maps a parsed backend object onto the Decision schema and applies the
// acceptance gate.
//
// Field names are matched after lowercasing and dropping ' ', '_' and '-', so
// "task_completed", "TaskCompleted" and "task-completed" are the same key.
// A nested nextStep object wins over flattened top-level fields.
//
// A response that claims completion while still carrying a nextStep is
// treated as not complete: backends routinely set the flag early while
// describing more work.
class ResponseNormalizer {
public:
    explicit ResponseNormalizer(NormalizerSettings settings = {},
                                const operations::OperationRegistry* registry = nullptr);

    protocol::Decision normalize(const nlohmann::json& parsed) const;

    // Completion with a stated confidence below the threshold is downgraded;
    // reasoning shorter than the minimum is replaced by an error decision.
    protocol::Decision validate(protocol::Decision decision) const;

    // extract -> normalize -> validate. Fails only with `malformed_response`.
    core::errors::Result<protocol::Decision> interpret(const std::string& raw_text) const;

    static protocol::Decision error_decision(const std::string& message);

    static std::string fold_key(const std::string& key);
    static CanonicalField canonical_field(const std::string& key);

    const NormalizerSettings& settings() const { return settings_; }

private:
    NormalizerSettings settings_;
    const operations::OperationRegistry* registry_;
};

}  // namespace harbor::response
