#pragma once

#include <string>
#include <vector>
#include "operations/operation.hpp"

namespace harbor::operations {

// Evaluates an arithmetic expression: numbers, + - * / % ^, parentheses and
// unary minus. `^` is right-associative and binds tighter than unary minus.
core::errors::Result<double> evaluate_expression(const std::string& expression);

class MathEvaluatorOperation : public Operation {
public:
    std::string name() const override { return "MathEvaluator"; }
    std::string description() const override;
    std::vector<std::string> capabilities() const override;
    nlohmann::json parameters() const override;
    std::vector<std::string> inference_keywords() const override;
    core::errors::Result<protocol::OperationResult> run(
        protocol::OperationContext& context) override;
    bool dry_run(const protocol::OperationContext& context) const override;
};

}  // namespace harbor::operations
