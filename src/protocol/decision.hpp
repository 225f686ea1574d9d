#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace harbor::protocol {

    struct NextStep {
        bool requires_operation = false;
        std::optional<std::string> operation_name;
        nlohmann::json parameters = nlohmann::json::object();
        double confidence = 0.5;  // always within [0, 1]
        std::vector<std::string> assumptions;
        std::vector<std::string> risks;
    };

    // Canonical interpretation of one backend response.
    // If task_completed is true then next_step is empty.
    struct Decision {
        bool task_completed = false;
        std::string reasoning;
        std::optional<NextStep> next_step;
        std::string response;

        // Top-level confidence, when the backend stated one outside next_step.
        std::optional<double> confidence;
    };

    inline nlohmann::json to_json(const NextStep& step) {
        nlohmann::json out;
        out["requiresOperation"] = step.requires_operation;
        out["operationName"] = step.operation_name.has_value()
                                   ? nlohmann::json(step.operation_name.value())
                                   : nlohmann::json(nullptr);
        out["parameters"] = step.parameters;
        out["confidence"] = step.confidence;
        out["assumptions"] = step.assumptions;
        out["risks"] = step.risks;
        return out;
    }

    inline nlohmann::json to_json(const Decision& decision) {
        nlohmann::json out;
        out["taskCompleted"] = decision.task_completed;
        out["reasoning"] = decision.reasoning;
        out["nextStep"] = decision.next_step.has_value()
                              ? to_json(decision.next_step.value())
                              : nlohmann::json(nullptr);
        out["response"] = decision.response;
        if (decision.confidence.has_value()) {
            out["confidence"] = decision.confidence.value();
        }
        return out;
    }

} // namespace harbor::protocol
