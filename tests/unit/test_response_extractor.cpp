#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "response/response_extractor.hpp"

namespace {

using harbor::core::errors::ErrorCategory;
using harbor::core::errors::get_error;
using harbor::core::errors::get_value;
using harbor::core::errors::is_error;
using harbor::response::ResponseExtractor;

TEST(ResponseExtractorTest, IgnoresBracesInsideStrings) {
    const std::string raw = R"(prefix text {"a": "text with { and } inside"} suffix)";
    const auto extracted = ResponseExtractor::extract_json(raw);
    ASSERT_TRUE(extracted.has_value());
    EXPECT_EQ(extracted.value(), R"({"a": "text with { and } inside"})");
}

TEST(ResponseExtractorTest, HandlesEscapedQuotesAndNesting) {
    const std::string raw = R"(Here: {"a": "say \"}\" now", "b": {"c": 1}} trailing })";
    const auto extracted = ResponseExtractor::extract_json(raw);
    ASSERT_TRUE(extracted.has_value());
    EXPECT_EQ(extracted.value(), R"({"a": "say \"}\" now", "b": {"c": 1}})");
}

TEST(ResponseExtractorTest, NoBalancedRegionYieldsNothing) {
    EXPECT_FALSE(ResponseExtractor::extract_json("no braces at all").has_value());
    EXPECT_FALSE(ResponseExtractor::extract_json(R"({"open": "never closed")").has_value());
}

TEST(ResponseExtractorTest, SanitizeDropsCommentsAndTrailingCommas) {
    const std::string candidate = "{\n  \"a\": 1, // first\n  \"b\": [1, 2,],\n  \"url\": \"http://x\",\n}";
    const auto cleaned = ResponseExtractor::sanitize(candidate);
    const auto parsed = nlohmann::json::parse(cleaned);
    EXPECT_EQ(parsed["a"], 1);
    EXPECT_EQ(parsed["b"].size(), 2u);
    EXPECT_EQ(parsed["url"], "http://x");
}

TEST(ResponseExtractorTest, ParsesFencedJson) {
    const std::string raw =
        "Sure, here is my decision:\n```json\n{\"taskCompleted\": false, \"reasoning\": \"x\"}\n```\n";
    auto parsed = ResponseExtractor::parse_object(raw);
    ASSERT_FALSE(is_error(parsed));
    EXPECT_FALSE(get_value(parsed)["taskCompleted"].get<bool>());
}

TEST(ResponseExtractorTest, SkipsUnparseableFragment) {
    const std::string raw = R"(Set {x} aside. {"taskCompleted": true})";
    auto parsed = ResponseExtractor::parse_object(raw);
    ASSERT_FALSE(is_error(parsed));
    EXPECT_TRUE(get_value(parsed)["taskCompleted"].get<bool>());
}

TEST(ResponseExtractorTest, FallsBackToKeyValueLines) {
    const std::string raw =
        "Task Completed: yes\n"
        "Reasoning: The directory was created in the previous step already.\n"
        "Confidence = 0.9\n"
        "Mood: cheerful\n";
    auto parsed = ResponseExtractor::parse_object(raw);
    ASSERT_FALSE(is_error(parsed));
    const auto& object = get_value(parsed);
    EXPECT_EQ(object["Task Completed"], "yes");
    EXPECT_DOUBLE_EQ(object["Confidence"].get<double>(), 0.9);
    EXPECT_FALSE(object.contains("Mood"));
}

TEST(ResponseExtractorTest, PlainProseIsMalformed) {
    auto parsed = ResponseExtractor::parse_object("I think we should create the folder next.");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).category, ErrorCategory::Provider);
    EXPECT_EQ(get_error(parsed).code, "malformed_response");
}

}  // namespace
