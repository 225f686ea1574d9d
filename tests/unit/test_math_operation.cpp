#include <string>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "operations/math_operation.hpp"

namespace {

using harbor::core::errors::get_error;
using harbor::core::errors::get_value;
using harbor::core::errors::is_error;
using harbor::operations::evaluate_expression;

double eval(const std::string& expression) {
    auto result = evaluate_expression(expression);
    EXPECT_FALSE(is_error(result)) << expression;
    return is_error(result) ? 0.0 : get_value(result);
}

TEST(MathOperationTest, RespectsPrecedence) {
    EXPECT_DOUBLE_EQ(eval("1 + 2 * 3"), 7.0);
    EXPECT_DOUBLE_EQ(eval("(1 + 2) * 3"), 9.0);
    EXPECT_DOUBLE_EQ(eval("10 - 4 - 3"), 3.0);
    EXPECT_DOUBLE_EQ(eval("7 % 4"), 3.0);
    EXPECT_DOUBLE_EQ(eval("1.5 * 4"), 6.0);
}

TEST(MathOperationTest, PowerIsRightAssociativeAndBindsTighterThanUnary) {
    EXPECT_DOUBLE_EQ(eval("2 ^ 3 ^ 2"), 512.0);
    EXPECT_DOUBLE_EQ(eval("-2 ^ 2"), -4.0);
    EXPECT_DOUBLE_EQ(eval("2 ^ -1"), 0.5);
}

TEST(MathOperationTest, RejectsBadInput) {
    for (const std::string expression : {"", "   ", "1 / 0", "5 % 0", "(1 + 2", "2 + x",
                                         "3 4"}) {
        auto result = evaluate_expression(expression);
        ASSERT_TRUE(is_error(result)) << expression;
        EXPECT_EQ(get_error(result).code, "invalid_expression");
    }
}

TEST(MathOperationTest, OperationReturnsIntegralResultAsInteger) {
    harbor::operations::MathEvaluatorOperation op;
    harbor::protocol::OperationContext ctx;
    ctx.parameters = {{"expression", "6 * 7"}};
    ASSERT_TRUE(op.dry_run(ctx));

    auto result = op.run(ctx);
    ASSERT_FALSE(is_error(result));
    ASSERT_TRUE(get_value(result).success);
    EXPECT_TRUE(get_value(result).output["result"].is_number_integer());
    EXPECT_EQ(get_value(result).output["result"], 42);
    EXPECT_EQ(ctx.state["last_result"], 42);
}

TEST(MathOperationTest, OperationReportsEvaluationFailure) {
    harbor::operations::MathEvaluatorOperation op;
    harbor::protocol::OperationContext ctx;
    ctx.parameters = {{"expression", "1 / 0"}};
    auto result = op.run(ctx);
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).success);

    harbor::protocol::OperationContext empty;
    EXPECT_FALSE(op.dry_run(empty));
}

}  // namespace
