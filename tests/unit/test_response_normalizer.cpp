#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "operations/filesystem_operations.hpp"
#include "operations/math_operation.hpp"
#include "operations/operation_registry.hpp"
#include "response/response_normalizer.hpp"

namespace {

using harbor::core::errors::get_error;
using harbor::core::errors::get_value;
using harbor::core::errors::is_error;
using harbor::protocol::Decision;
using harbor::response::CanonicalField;
using harbor::response::NormalizerSettings;
using harbor::response::ResponseNormalizer;
using nlohmann::json;

const std::string kReasoning = "The folder does not exist yet, so it must be created first.";

TEST(ResponseNormalizerTest, ReadsCanonicalDecision) {
    ResponseNormalizer normalizer;
    const json parsed = {
        {"taskCompleted", false},
        {"reasoning", kReasoning},
        {"nextStep",
         {{"requiresOperation", true},
          {"operationName", "DirectoryCreate"},
          {"parameters", {{"path", "out"}}},
          {"confidence", 0.9},
          {"assumptions", json::array({"cwd is the session root"})},
          {"risks", json::array()}}},
        {"response", "Creating the folder."}};

    const Decision decision = normalizer.normalize(parsed);
    EXPECT_FALSE(decision.task_completed);
    EXPECT_EQ(decision.reasoning, kReasoning);
    EXPECT_EQ(decision.response, "Creating the folder.");
    ASSERT_TRUE(decision.next_step.has_value());
    EXPECT_TRUE(decision.next_step->requires_operation);
    EXPECT_EQ(decision.next_step->operation_name.value(), "DirectoryCreate");
    EXPECT_EQ(decision.next_step->parameters["path"], "out");
    EXPECT_DOUBLE_EQ(decision.next_step->confidence, 0.9);
    ASSERT_EQ(decision.next_step->assumptions.size(), 1u);
    EXPECT_FALSE(decision.confidence.has_value());
}

TEST(ResponseNormalizerTest, SynonymKeysAreFolded) {
    EXPECT_EQ(ResponseNormalizer::fold_key("Task_Completed"), "taskcompleted");
    EXPECT_EQ(ResponseNormalizer::canonical_field("task-completed"), CanonicalField::TaskCompleted);
    EXPECT_EQ(ResponseNormalizer::canonical_field("Next Action"), CanonicalField::NextStep);
    EXPECT_EQ(ResponseNormalizer::canonical_field("tool_name"), CanonicalField::OperationName);
    EXPECT_EQ(ResponseNormalizer::canonical_field("params"), CanonicalField::Parameters);
    EXPECT_EQ(ResponseNormalizer::canonical_field("answer"), CanonicalField::Response);
    EXPECT_EQ(ResponseNormalizer::canonical_field("user_query"), CanonicalField::Ignored);
    EXPECT_EQ(ResponseNormalizer::canonical_field("colour"), CanonicalField::Unknown);

    ResponseNormalizer normalizer;
    const Decision decision = normalizer.normalize(
        {{"task_status", "completed"}, {"thought", kReasoning}, {"answer", "All done."}});
    EXPECT_TRUE(decision.task_completed);
    EXPECT_EQ(decision.reasoning, kReasoning);
    EXPECT_EQ(decision.response, "All done.");
    EXPECT_FALSE(decision.next_step.has_value());
}

TEST(ResponseNormalizerTest, FlattenedFieldsBuildNextStep) {
    ResponseNormalizer normalizer;
    const Decision decision = normalizer.normalize({{"taskCompleted", false},
                                                    {"reasoning", kReasoning},
                                                    {"tool", "FileWrite"},
                                                    {"args", "{\"path\": \"a.txt\"}"}});
    ASSERT_TRUE(decision.next_step.has_value());
    EXPECT_TRUE(decision.next_step->requires_operation);
    EXPECT_EQ(decision.next_step->operation_name.value(), "FileWrite");
    EXPECT_EQ(decision.next_step->parameters["path"], "a.txt");
    EXPECT_DOUBLE_EQ(decision.next_step->confidence, 0.5);
}

TEST(ResponseNormalizerTest, NestedStepWinsOverFlattenedFields) {
    ResponseNormalizer normalizer;
    const Decision decision = normalizer.normalize(
        {{"reasoning", kReasoning},
         {"operationName", "FileRead"},
         {"nextStep", {{"operationName", "FileWrite"}, {"requiresOperation", true}}}});
    ASSERT_TRUE(decision.next_step.has_value());
    EXPECT_EQ(decision.next_step->operation_name.value(), "FileWrite");
}

TEST(ResponseNormalizerTest, CompletionWithNextStepIsNotComplete) {
    ResponseNormalizer normalizer;
    const Decision decision = normalizer.normalize(
        {{"taskCompleted", true}, {"nextStep", {{"confidence", 0.5}}}});
    EXPECT_FALSE(decision.task_completed);
    ASSERT_TRUE(decision.next_step.has_value());
    EXPECT_FALSE(decision.next_step->requires_operation);
}

TEST(ResponseNormalizerTest, NullNextStepAllowsCompletion) {
    ResponseNormalizer normalizer;
    auto decision = normalizer.interpret(
        R"({"taskCompleted": true, "reasoning": ")" + kReasoning +
        R"(", "nextStep": null, "response": "Folder created."})");
    ASSERT_FALSE(is_error(decision));
    EXPECT_TRUE(get_value(decision).task_completed);
    EXPECT_FALSE(get_value(decision).next_step.has_value());
    EXPECT_EQ(get_value(decision).response, "Folder created.");
}

TEST(ResponseNormalizerTest, LowConfidenceCompletionIsDowngraded) {
    ResponseNormalizer normalizer(NormalizerSettings{0.8, 30});
    Decision decision;
    decision.task_completed = true;
    decision.reasoning = kReasoning;
    decision.confidence = 0.5;
    EXPECT_FALSE(normalizer.validate(decision).task_completed);

    decision.confidence = 0.95;
    EXPECT_TRUE(normalizer.validate(decision).task_completed);

    decision.confidence.reset();
    EXPECT_TRUE(normalizer.validate(decision).task_completed);
}

TEST(ResponseNormalizerTest, PercentConfidenceIsParsed) {
    ResponseNormalizer normalizer;
    auto decision = normalizer.interpret(
        R"({"done": true, "reasoning": ")" + kReasoning + R"(", "certainty": "60%"})");
    ASSERT_FALSE(is_error(decision));
    ASSERT_TRUE(get_value(decision).confidence.has_value());
    EXPECT_DOUBLE_EQ(get_value(decision).confidence.value(), 0.6);
    EXPECT_FALSE(get_value(decision).task_completed);
}

TEST(ResponseNormalizerTest, ShortReasoningBecomesErrorDecision) {
    ResponseNormalizer normalizer(NormalizerSettings{0.8, 30});
    Decision decision;
    decision.task_completed = true;
    decision.reasoning = "too short";
    decision.response = "Keep me.";

    const Decision validated = normalizer.validate(decision);
    EXPECT_FALSE(validated.task_completed);
    EXPECT_EQ(validated.reasoning.rfind("Error encountered:", 0), 0u);
    EXPECT_EQ(validated.response, "Keep me.");
    ASSERT_TRUE(validated.confidence.has_value());
    EXPECT_DOUBLE_EQ(validated.confidence.value(), 0.1);

    decision.reasoning.clear();
    EXPECT_TRUE(normalizer.validate(decision).task_completed);
}

TEST(ResponseNormalizerTest, InfersOperationFromReasoning) {
    harbor::operations::OperationRegistry registry;
    ASSERT_FALSE(is_error(registry.register_operation(
        std::make_unique<harbor::operations::DirectoryCreateOperation>())));
    ASSERT_FALSE(is_error(registry.register_operation(
        std::make_unique<harbor::operations::MathEvaluatorOperation>())));
    registry.freeze();

    ResponseNormalizer normalizer(NormalizerSettings{}, &registry);
    const Decision inferred = normalizer.normalize(
        {{"taskCompleted", false},
         {"reasoning", "I will use the tool that can calculate the sum of these values."}});
    ASSERT_TRUE(inferred.next_step.has_value());
    EXPECT_TRUE(inferred.next_step->requires_operation);
    EXPECT_EQ(inferred.next_step->operation_name.value(), "MathEvaluator");

    const Decision explicit_no = normalizer.normalize(
        {{"reasoning", "I will use the tool that can calculate the sum of these values."},
         {"nextStep", {{"requiresOperation", false}}}});
    ASSERT_TRUE(explicit_no.next_step.has_value());
    EXPECT_FALSE(explicit_no.next_step->requires_operation);
}

TEST(ResponseNormalizerTest, MalformedTextIsReported) {
    ResponseNormalizer normalizer;
    auto decision = normalizer.interpret("just some prose without structure");
    ASSERT_TRUE(is_error(decision));
    EXPECT_EQ(get_error(decision).code, "malformed_response");

    const Decision fallback = ResponseNormalizer::error_decision("bad output");
    EXPECT_EQ(fallback.reasoning, "Error encountered: bad output. Need to reassess the situation.");
    EXPECT_EQ(fallback.response, "I encountered an issue: bad output. Let me reconsider the approach.");
    EXPECT_FALSE(fallback.task_completed);
}

}  // namespace
