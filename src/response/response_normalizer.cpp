#include "response/response_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "operations/operation_registry.hpp"
#include "response/response_extractor.hpp"

namespace harbor::response {

using nlohmann::json;
using protocol::Decision;
using protocol::NextStep;

namespace {

constexpr double kDefaultStepConfidence = 0.5;
constexpr double kErrorConfidence = 0.1;

const std::unordered_map<std::string, CanonicalField>& synonym_table() {
    static const std::unordered_map<std::string, CanonicalField> table = {
        {"taskcompleted", CanonicalField::TaskCompleted},
        {"taskcomplete", CanonicalField::TaskCompleted},
        {"complete", CanonicalField::TaskCompleted},
        {"completed", CanonicalField::TaskCompleted},
        {"finished", CanonicalField::TaskCompleted},
        {"done", CanonicalField::TaskCompleted},
        {"taskstatus", CanonicalField::TaskCompleted},

        {"reasoning", CanonicalField::Reasoning},
        {"thought", CanonicalField::Reasoning},
        {"analysis", CanonicalField::Reasoning},
        {"thinking", CanonicalField::Reasoning},

        {"nextstep", CanonicalField::NextStep},
        {"nextaction", CanonicalField::NextStep},
        {"action", CanonicalField::NextStep},
        {"step", CanonicalField::NextStep},
        {"next", CanonicalField::NextStep},

        {"requirestool", CanonicalField::RequiresOperation},
        {"requiresoperation", CanonicalField::RequiresOperation},
        {"needstool", CanonicalField::RequiresOperation},
        {"usetool", CanonicalField::RequiresOperation},
        {"toolrequired", CanonicalField::RequiresOperation},

        {"tool", CanonicalField::OperationName},
        {"toolname", CanonicalField::OperationName},
        {"operation", CanonicalField::OperationName},
        {"operationname", CanonicalField::OperationName},

        {"parameters", CanonicalField::Parameters},
        {"params", CanonicalField::Parameters},
        {"args", CanonicalField::Parameters},
        {"arguments", CanonicalField::Parameters},

        {"confidence", CanonicalField::Confidence},
        {"certainty", CanonicalField::Confidence},
        {"probability", CanonicalField::Confidence},

        {"assumptions", CanonicalField::Assumptions},
        {"assumption", CanonicalField::Assumptions},

        {"risks", CanonicalField::Risks},
        {"risk", CanonicalField::Risks},
        {"concerns", CanonicalField::Risks},
        {"issues", CanonicalField::Risks},

        {"response", CanonicalField::Response},
        {"answer", CanonicalField::Response},
        {"result", CanonicalField::Response},
        {"message", CanonicalField::Response},
        {"output", CanonicalField::Response},

        {"userquery", CanonicalField::Ignored},
        {"query", CanonicalField::Ignored},
        {"request", CanonicalField::Ignored},
        {"stepcompleted", CanonicalField::Ignored},
        {"stepfinished", CanonicalField::Ignored},
        {"stepdone", CanonicalField::Ignored},
    };
    return table;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::optional<bool> to_bool(const json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        const std::string text = lowercase(value.get<std::string>());
        if (text == "true" || text == "yes" || text == "1" || text == "done" ||
            text == "complete" || text == "completed" || text == "finished") {
            return true;
        }
        if (text == "false" || text == "no" || text == "0" || text == "pending" ||
            text == "incomplete" || text == "in_progress" || text == "in progress") {
            return false;
        }
    }
    return std::nullopt;
}

std::optional<double> to_number(const json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        char* end = nullptr;
        const double number = std::strtod(text.c_str(), &end);
        if (!text.empty() && end != text.c_str()) {
            // "85%" style confidences
            if (*end == '%') {
                return number / 100.0;
            }
            if (*end == '\0') {
                return number;
            }
        }
    }
    return std::nullopt;
}

std::string to_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

std::vector<std::string> to_string_list(const json& value) {
    std::vector<std::string> items;
    if (value.is_array()) {
        for (const auto& item : value) {
            const std::string text = to_text(item);
            if (!text.empty()) {
                items.push_back(text);
            }
        }
    } else if (!value.is_null()) {
        const std::string text = to_text(value);
        if (!text.empty()) {
            items.push_back(text);
        }
    }
    return items;
}

std::optional<json> to_parameters(const json& value) {
    if (value.is_object()) {
        return value;
    }
    if (value.is_string()) {
        auto parsed = json::parse(value.get<std::string>(), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            return parsed;
        }
    }
    return std::nullopt;
}

double clamp_confidence(const double value) {
    return std::min(1.0, std::max(0.0, value));
}

// Fields collected from one level of the object, before merging.
struct FieldSet {
    std::optional<bool> task_completed;
    std::optional<std::string> reasoning;
    std::optional<std::string> response;
    std::optional<bool> requires_operation;
    std::optional<std::string> operation_name;
    std::optional<json> parameters;
    std::optional<double> confidence;
    std::optional<std::vector<std::string>> assumptions;
    std::optional<std::vector<std::string>> risks;
    std::optional<json> nested_step;  // object, or null when explicitly null
};

FieldSet collect(const json& object) {
    FieldSet fields;
    for (auto it = object.begin(); it != object.end(); ++it) {
        const json& value = it.value();
        switch (ResponseNormalizer::canonical_field(it.key())) {
            case CanonicalField::TaskCompleted:
                if (!fields.task_completed.has_value()) {
                    fields.task_completed = to_bool(value);
                }
                break;
            case CanonicalField::Reasoning:
                if (!fields.reasoning.has_value()) {
                    fields.reasoning = to_text(value);
                }
                break;
            case CanonicalField::NextStep:
                if (!fields.nested_step.has_value() && (value.is_object() || value.is_null())) {
                    fields.nested_step = value;
                }
                break;
            case CanonicalField::RequiresOperation:
                if (!fields.requires_operation.has_value()) {
                    fields.requires_operation = to_bool(value);
                }
                break;
            case CanonicalField::OperationName:
                if (!fields.operation_name.has_value() && value.is_string() &&
                    !value.get<std::string>().empty()) {
                    fields.operation_name = value.get<std::string>();
                }
                break;
            case CanonicalField::Parameters:
                if (!fields.parameters.has_value()) {
                    fields.parameters = to_parameters(value);
                }
                break;
            case CanonicalField::Confidence:
                if (!fields.confidence.has_value()) {
                    fields.confidence = to_number(value);
                }
                break;
            case CanonicalField::Assumptions:
                if (!fields.assumptions.has_value()) {
                    fields.assumptions = to_string_list(value);
                }
                break;
            case CanonicalField::Risks:
                if (!fields.risks.has_value()) {
                    fields.risks = to_string_list(value);
                }
                break;
            case CanonicalField::Response:
                if (!fields.response.has_value()) {
                    fields.response = to_text(value);
                }
                break;
            case CanonicalField::Ignored:
            case CanonicalField::Unknown:
                break;
        }
    }
    return fields;
}

template <typename T>
std::optional<T> first_of(const std::optional<T>& preferred, const std::optional<T>& fallback) {
    return preferred.has_value() ? preferred : fallback;
}

bool implies_operation_use(const std::string& reasoning) {
    const std::string lowered = lowercase(reasoning);
    return lowered.find("use ") != std::string::npos &&
           (lowered.find("tool") != std::string::npos ||
            lowered.find("operation") != std::string::npos);
}

}  // namespace

ResponseNormalizer::ResponseNormalizer(NormalizerSettings settings,
                                       const operations::OperationRegistry* registry)
    : settings_(settings), registry_(registry) {}

std::string ResponseNormalizer::fold_key(const std::string& key) {
    std::string folded;
    folded.reserve(key.size());
    for (const char c : key) {
        if (c == ' ' || c == '_' || c == '-') {
            continue;
        }
        folded.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return folded;
}

CanonicalField ResponseNormalizer::canonical_field(const std::string& key) {
    const auto& table = synonym_table();
    auto it = table.find(fold_key(key));
    return it == table.end() ? CanonicalField::Unknown : it->second;
}

Decision ResponseNormalizer::normalize(const json& parsed) const {
    Decision decision;
    if (!parsed.is_object()) {
        return error_decision("response was not a JSON object");
    }

    const FieldSet top = collect(parsed);
    FieldSet nested;
    const bool has_nested = top.nested_step.has_value() && top.nested_step->is_object();
    if (has_nested) {
        nested = collect(top.nested_step.value());
    }

    decision.task_completed = top.task_completed.value_or(false);
    decision.reasoning = first_of(top.reasoning, nested.reasoning).value_or("");
    decision.response = first_of(top.response, nested.response).value_or("");
    if (top.confidence.has_value()) {
        decision.confidence = clamp_confidence(top.confidence.value());
    }

    const auto requires_operation = first_of(nested.requires_operation, top.requires_operation);
    const auto operation_name = first_of(nested.operation_name, top.operation_name);
    const auto parameters = first_of(nested.parameters, top.parameters);
    const bool flattened_step = top.requires_operation.value_or(false) ||
                                top.operation_name.has_value() ||
                                (top.parameters.has_value() && !top.parameters->empty());

    if (has_nested || flattened_step) {
        NextStep step;
        step.operation_name = operation_name;
        step.requires_operation =
            requires_operation.value_or(operation_name.has_value());
        step.parameters = parameters.value_or(json::object());
        step.confidence = clamp_confidence(
            first_of(nested.confidence, top.confidence).value_or(kDefaultStepConfidence));
        step.assumptions = first_of(nested.assumptions, top.assumptions)
                               .value_or(std::vector<std::string>{});
        step.risks = first_of(nested.risks, top.risks).value_or(std::vector<std::string>{});
        decision.next_step = std::move(step);
    }

    if (decision.task_completed && decision.next_step.has_value()) {
        HARBOR_LOG_DEBUG("ResponseNormalizer: completion claimed alongside a next step; "
                         "treating as not complete");
        decision.task_completed = false;
    }

    if (!decision.task_completed && !requires_operation.has_value() &&
        implies_operation_use(decision.reasoning)) {
        if (!decision.next_step.has_value()) {
            decision.next_step = NextStep{};
        }
        decision.next_step->requires_operation = true;
        if (!decision.next_step->operation_name.has_value() && registry_ != nullptr) {
            decision.next_step->operation_name = registry_->infer_from_text(decision.reasoning);
        }
        HARBOR_LOG_DEBUG("ResponseNormalizer: inferred operation request " +
                         decision.next_step->operation_name.value_or("<unknown>"));
    }

    return decision;
}

Decision ResponseNormalizer::validate(Decision decision) const {
    if (!decision.reasoning.empty() &&
        decision.reasoning.size() < settings_.min_reasoning_length) {
        HARBOR_LOG_WARN("ResponseNormalizer: reasoning too short (" +
                        std::to_string(decision.reasoning.size()) + " chars)");
        Decision rejected = error_decision(
            "reasoning was shorter than " + std::to_string(settings_.min_reasoning_length) +
            " characters");
        if (!decision.response.empty()) {
            rejected.response = decision.response;
        }
        return rejected;
    }

    if (decision.task_completed && decision.confidence.has_value() &&
        decision.confidence.value() < settings_.min_completion_confidence) {
        HARBOR_LOG_WARN("ResponseNormalizer: completion confidence " +
                        std::to_string(decision.confidence.value()) +
                        " is below the threshold; continuing");
        decision.task_completed = false;
    }
    return decision;
}

core::errors::Result<Decision> ResponseNormalizer::interpret(const std::string& raw_text) const {
    auto parsed = ResponseExtractor::parse_object(raw_text);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    return validate(normalize(core::errors::get_value(parsed)));
}

Decision ResponseNormalizer::error_decision(const std::string& message) {
    Decision decision;
    decision.task_completed = false;
    decision.reasoning = "Error encountered: " + message + ". Need to reassess the situation.";
    decision.response = "I encountered an issue: " + message +
                        ". Let me reconsider the approach.";
    decision.confidence = kErrorConfidence;

    NextStep step;
    step.requires_operation = false;
    step.confidence = kErrorConfidence;
    decision.next_step = std::move(step);
    return decision;
}

}  // namespace harbor::response
