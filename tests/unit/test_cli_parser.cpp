#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/agent_errors.hpp"

namespace {

using harbor::app::cli::CliCommand;
using harbor::app::cli::CommandKind;
using harbor::app::cli::parse_and_validate;
using harbor::core::errors::ErrorCategory;
using harbor::core::errors::get_error;
using harbor::core::errors::get_value;
using harbor::core::errors::is_error;

harbor::core::errors::Result<CliCommand> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("harbor");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

class TempScript {
public:
    TempScript() {
        path_ = std::filesystem::current_path() /
                (".tmp_cli_" + harbor::core::config::generate_id("script") + ".json");
        std::ofstream(path_) << "[]";
    }

    ~TempScript() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenTaskMissing) {
    auto result = parse_tokens({"run", "--backend-cmd", "cat"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenNoBackendGiven) {
    auto result = parse_tokens({"run", "--task", "make a folder"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenBothBackendsGiven) {
    TempScript script;
    auto result = parse_tokens({"run", "--task", "make a folder", "--backend-cmd", "cat",
                                "--script", script.str()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"run", "--task"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"run", "--task", "x", "--backend-cmd", "cat", "--plan"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenMaxIterationsNotNumeric) {
    auto result = parse_tokens({"run", "--task", "x", "--backend-cmd", "cat",
                                "--max-iterations", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenBoundsExceeded) {
    auto iterations = parse_tokens({"run", "--task", "x", "--backend-cmd", "cat",
                                    "--max-iterations", "0"});
    ASSERT_TRUE(is_error(iterations));
    EXPECT_EQ(get_error(iterations).code, "bounds_error");

    auto retries = parse_tokens({"run", "--task", "x", "--backend-cmd", "cat",
                                 "--max-retries", "21"});
    ASSERT_TRUE(is_error(retries));
    EXPECT_EQ(get_error(retries).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenScriptMissing) {
    const auto missing =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_script__.json";
    auto result = parse_tokens({"run", "--task", "x", "--script", missing.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, RejectsUnsafeSessionId) {
    auto result = parse_tokens({"run", "--task", "x", "--backend-cmd", "cat",
                                "--session", "../escape"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_session_id");
}

TEST(CliParserTest, ParsesValidRunCommand) {
    auto result = parse_tokens({"run", "--task", "make a folder", "--backend-cmd",
                                "my-model --json", "--session", "demo", "--max-iterations",
                                "5", "--max-retries", "0", "--cache-root", "/tmp/hc",
                                "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& cmd = get_value(result);
    EXPECT_EQ(cmd.kind, CommandKind::Run);
    EXPECT_EQ(cmd.task, "make a folder");
    ASSERT_TRUE(cmd.backend_command.has_value());
    EXPECT_EQ(cmd.backend_command.value(), "my-model --json");
    EXPECT_FALSE(cmd.script_file.has_value());
    EXPECT_EQ(cmd.session_id.value(), "demo");
    EXPECT_EQ(cmd.max_iterations.value(), 5u);
    EXPECT_EQ(cmd.max_retries.value(), 0u);
    EXPECT_EQ(cmd.cache_root->string(), "/tmp/hc");
    EXPECT_TRUE(cmd.verbose);
}

TEST(CliParserTest, ParsesScriptedRunWithDefaults) {
    TempScript script;
    auto result = parse_tokens({"run", "--task", "x", "--script", script.str()});
    ASSERT_FALSE(is_error(result));

    const auto& cmd = get_value(result);
    ASSERT_TRUE(cmd.script_file.has_value());
    EXPECT_FALSE(cmd.session_id.has_value());
    EXPECT_FALSE(cmd.max_iterations.has_value());
    EXPECT_FALSE(cmd.verbose);
}

TEST(CliParserTest, CleanupRequiresSession) {
    auto missing = parse_tokens({"cleanup"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_required_flag");

    auto ok = parse_tokens({"cleanup", "--session", "demo"});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).kind, CommandKind::Cleanup);
    EXPECT_EQ(get_value(ok).session_id.value(), "demo");
}

TEST(CliParserTest, CleanupRejectsRunFlags) {
    auto result = parse_tokens({"cleanup", "--session", "demo", "--task", "x"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

}  // namespace
