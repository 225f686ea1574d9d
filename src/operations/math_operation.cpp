#include "operations/math_operation.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <utility>
#include "operations/filesystem_operations.hpp"

namespace harbor::operations {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::OperationContext;
using protocol::OperationResult;

namespace {

constexpr int kMaxNesting = 64;

class ExpressionParser {
public:
    explicit ExpressionParser(const std::string& text) : text_(text) {}

    core::errors::Result<double> parse() {
        auto value = parse_sum();
        if (core::errors::is_error(value)) {
            return value;
        }
        skip_spaces();
        if (pos_ != text_.size()) {
            return error("Unexpected '" + std::string(1, text_[pos_]) + "' at position " +
                         std::to_string(pos_));
        }
        return value;
    }

private:
    static AgentError error(const std::string& message) {
        return AgentError{ErrorCategory::Input, message, "invalid_expression"};
    }

    void skip_spaces() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
            ++pos_;
        }
    }

    bool consume(const char c) {
        skip_spaces();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    // sum := product (('+' | '-') product)*
    core::errors::Result<double> parse_sum() {
        auto lhs = parse_product();
        if (core::errors::is_error(lhs)) {
            return lhs;
        }
        double value = core::errors::get_value(lhs);
        while (true) {
            if (consume('+')) {
                auto rhs = parse_product();
                if (core::errors::is_error(rhs)) {
                    return rhs;
                }
                value += core::errors::get_value(rhs);
            } else if (consume('-')) {
                auto rhs = parse_product();
                if (core::errors::is_error(rhs)) {
                    return rhs;
                }
                value -= core::errors::get_value(rhs);
            } else {
                return value;
            }
        }
    }

    // product := unary (('*' | '/' | '%') unary)*
    core::errors::Result<double> parse_product() {
        auto lhs = parse_unary();
        if (core::errors::is_error(lhs)) {
            return lhs;
        }
        double value = core::errors::get_value(lhs);
        while (true) {
            char op = '\0';
            if (consume('*')) {
                op = '*';
            } else if (consume('/')) {
                op = '/';
            } else if (consume('%')) {
                op = '%';
            } else {
                return value;
            }

            auto rhs = parse_unary();
            if (core::errors::is_error(rhs)) {
                return rhs;
            }
            const double divisor = core::errors::get_value(rhs);
            if (op == '*') {
                value *= divisor;
                continue;
            }
            if (divisor == 0.0) {
                return error(op == '/' ? "Division by zero." : "Modulo by zero.");
            }
            value = op == '/' ? value / divisor : std::fmod(value, divisor);
        }
    }

    // unary := ('-' | '+') unary | power
    core::errors::Result<double> parse_unary() {
        if (++depth_ > kMaxNesting) {
            return error("Expression is nested too deeply.");
        }
        core::errors::Result<double> result = 0.0;
        if (consume('-')) {
            result = parse_unary();
            if (!core::errors::is_error(result)) {
                result = -core::errors::get_value(result);
            }
        } else if (consume('+')) {
            result = parse_unary();
        } else {
            result = parse_power();
        }
        --depth_;
        return result;
    }

    // power := primary ('^' unary)?
    core::errors::Result<double> parse_power() {
        auto base = parse_primary();
        if (core::errors::is_error(base) || !consume('^')) {
            return base;
        }
        auto exponent = parse_unary();
        if (core::errors::is_error(exponent)) {
            return exponent;
        }
        return std::pow(core::errors::get_value(base), core::errors::get_value(exponent));
    }

    // primary := number | '(' sum ')'
    core::errors::Result<double> parse_primary() {
        if (consume('(')) {
            auto inner = parse_sum();
            if (core::errors::is_error(inner)) {
                return inner;
            }
            if (!consume(')')) {
                return error("Missing closing parenthesis.");
            }
            return inner;
        }

        skip_spaces();
        if (pos_ >= text_.size()) {
            return error("Unexpected end of expression.");
        }
        const char c = text_[pos_];
        if (std::isdigit(static_cast<unsigned char>(c)) == 0 && c != '.') {
            return error("Unexpected '" + std::string(1, c) + "' at position " +
                         std::to_string(pos_));
        }

        const char* begin = text_.c_str() + pos_;
        char* end = nullptr;
        const double value = std::strtod(begin, &end);
        if (end == begin) {
            return error("Invalid number at position " + std::to_string(pos_));
        }
        pos_ += static_cast<std::size_t>(end - begin);
        return value;
    }

    const std::string& text_;
    std::size_t pos_ = 0;
    int depth_ = 0;
};

}  // namespace

core::errors::Result<double> evaluate_expression(const std::string& expression) {
    if (expression.find_first_not_of(" \t\r\n") == std::string::npos) {
        return AgentError{ErrorCategory::Input, "Expression cannot be empty.",
                          "invalid_expression"};
    }
    ExpressionParser parser(expression);
    auto value = parser.parse();
    if (core::errors::is_error(value)) {
        return value;
    }
    if (!std::isfinite(core::errors::get_value(value))) {
        return AgentError{ErrorCategory::Input, "Expression result is not finite.",
                          "invalid_expression"};
    }
    return value;
}

std::string MathEvaluatorOperation::description() const {
    return "Evaluates an arithmetic expression (+ - * / % ^ and parentheses).";
}

std::vector<std::string> MathEvaluatorOperation::capabilities() const {
    return {"math:evaluate", "arithmetic:calculate"};
}

json MathEvaluatorOperation::parameters() const {
    return {{"expression", "required, e.g. \"(2 + 3) * 4\""}};
}

std::vector<std::string> MathEvaluatorOperation::inference_keywords() const {
    return {"calculate", "compute", "math", "arithmetic", "evaluate"};
}

bool MathEvaluatorOperation::dry_run(const OperationContext& context) const {
    const auto expression = string_parameter(context, "expression");
    return expression.has_value() &&
           !core::errors::is_error(evaluate_expression(expression.value()));
}

core::errors::Result<OperationResult> MathEvaluatorOperation::run(OperationContext& context) {
    const auto expression = string_parameter(context, "expression");
    if (!expression.has_value()) {
        return OperationResult::failure("Missing required parameter: expression");
    }

    auto value = evaluate_expression(expression.value());
    if (core::errors::is_error(value)) {
        return OperationResult::failure("Error evaluating expression: " +
                                        core::errors::get_error(value).message);
    }

    const double result = core::errors::get_value(value);
    json output;
    output["expression"] = expression.value();
    constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53
    if (std::trunc(result) == result && std::fabs(result) < kMaxExactInteger) {
        output["result"] = static_cast<std::int64_t>(result);
    } else {
        output["result"] = result;
    }
    context.state["last_result"] = output["result"];
    return OperationResult::ok(std::move(output));
}

}  // namespace harbor::operations
