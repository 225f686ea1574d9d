#include "operations/operation_registry.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace harbor::operations {

using core::errors::AgentError;
using core::errors::ErrorCategory;

std::string OperationRegistry::fold(const std::string& name) {
    std::string folded = name;
    std::transform(folded.begin(), folded.end(), folded.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return folded;
}

core::errors::Result<std::string> OperationRegistry::register_operation(
    std::unique_ptr<Operation> operation) {
    if (frozen_) {
        return AgentError{ErrorCategory::Internal,
                          "Operation registry is frozen.", "registry_frozen"};
    }
    if (!operation) {
        return AgentError{ErrorCategory::Internal, "Cannot register a null operation.",
                          "invalid_operation"};
    }

    std::string name = operation->name();
    if (name.empty()) {
        return AgentError{ErrorCategory::Internal, "Operation name cannot be empty.",
                          "invalid_operation"};
    }
    const std::string key = fold(name);
    if (index_.find(key) != index_.end()) {
        return AgentError{ErrorCategory::Internal,
                          "Operation already registered: " + name,
                          "duplicate_operation"};
    }

    index_.emplace(key, operations_.size());
    operations_.push_back(std::move(operation));
    HARBOR_LOG_DEBUG("OperationRegistry: registered " + name);
    return name;
}

Operation* OperationRegistry::find(const std::string& name) const {
    auto it = index_.find(fold(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return operations_[it->second].get();
}

core::errors::Result<Operation*> OperationRegistry::get(const std::string& name) const {
    Operation* operation = find(name);
    if (operation == nullptr) {
        std::string known;
        for (const auto& entry : list()) {
            known += known.empty() ? entry : ", " + entry;
        }
        return AgentError{ErrorCategory::Input, "Operation not found: " + name,
                          "operation_not_found", "Choose one of: " + known};
    }
    return operation;
}

bool OperationRegistry::has(const std::string& name) const {
    return find(name) != nullptr;
}

std::vector<std::string> OperationRegistry::list() const {
    std::vector<std::string> names;
    names.reserve(operations_.size());
    for (const auto& operation : operations_) {
        names.push_back(operation->name());
    }
    return names;
}

std::string OperationRegistry::describe_catalog() const {
    std::ostringstream out;
    for (const auto& operation : operations_) {
        out << "- " << operation->name() << ": " << operation->description();
        const auto params = operation->parameters();
        if (params.is_object() && !params.empty()) {
            out << "\n  parameters:";
            for (auto it = params.begin(); it != params.end(); ++it) {
                out << "\n    " << it.key() << ": "
                    << (it.value().is_string() ? it.value().get<std::string>()
                                               : it.value().dump());
            }
        }
        const auto alternatives = operation->alternative_methods();
        if (!alternatives.empty()) {
            out << "\n  fallbacks:";
            for (const auto& method : alternatives) {
                out << " " << method;
            }
        }
        out << "\n";
    }
    return out.str();
}

std::optional<std::string> OperationRegistry::infer_from_text(const std::string& text) const {
    const std::string haystack = fold(text);
    for (const auto& operation : operations_) {
        if (haystack.find(fold(operation->name())) != std::string::npos) {
            return operation->name();
        }
    }
    for (const auto& operation : operations_) {
        for (const auto& keyword : operation->inference_keywords()) {
            if (!keyword.empty() && haystack.find(fold(keyword)) != std::string::npos) {
                return operation->name();
            }
        }
    }
    return std::nullopt;
}

}  // namespace harbor::operations
