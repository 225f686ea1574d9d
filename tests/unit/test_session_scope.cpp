#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "session/session_scope.hpp"

namespace {

using harbor::core::errors::ErrorCategory;
using harbor::core::errors::get_error;
using harbor::core::errors::get_value;
using harbor::core::errors::is_error;
using harbor::session::SessionScope;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_scope_" + harbor::core::config::generate_id("test"));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::shared_ptr<SessionScope> make_scope(const TempWorkspace& ws, const std::string& id) {
    auto created = SessionScope::create(ws.root(), id);
    EXPECT_FALSE(is_error(created));
    return get_value(created);
}

TEST(SessionScopeTest, RootIsCacheRootPlusSessionId) {
    TempWorkspace ws;
    auto scope = make_scope(ws, "alpha");
    EXPECT_EQ(scope->session_id(), "alpha");
    EXPECT_EQ(scope->root().filename(), "alpha");
    EXPECT_EQ(scope->working_directory(), scope->root());
    // Creation is lazy.
    EXPECT_FALSE(std::filesystem::exists(scope->root()));
}

TEST(SessionScopeTest, RejectsUnsafeSessionIds) {
    TempWorkspace ws;
    const std::vector<std::string> unsafe = {"", ".", "..", "a/b", "..\\x", "c:d", "ok..no",
                                             "tab\there", std::string(129, 'a')};
    for (const auto& id : unsafe) {
        auto created = SessionScope::create(ws.root(), id);
        ASSERT_TRUE(is_error(created)) << id;
        EXPECT_EQ(get_error(created).category, ErrorCategory::Input);
        EXPECT_EQ(get_error(created).code, "invalid_session_id");
    }
    EXPECT_FALSE(is_error(SessionScope::validate_session_id("session-1f3a9c0b")));
    EXPECT_FALSE(is_error(SessionScope::validate_session_id("my.session_2")));
}

TEST(SessionScopeTest, ResolveCreatesRootAndStaysInside) {
    TempWorkspace ws;
    auto scope = make_scope(ws, "resolve");
    auto resolved = scope->resolve("notes/today.txt");
    ASSERT_FALSE(is_error(resolved));
    EXPECT_TRUE(std::filesystem::is_directory(scope->root()));
    EXPECT_EQ(get_value(resolved), scope->root() / "notes" / "today.txt");

    auto escaped = scope->resolve("../other");
    ASSERT_TRUE(is_error(escaped));
    EXPECT_EQ(get_error(escaped).category, ErrorCategory::Policy);
}

TEST(SessionScopeTest, NavigateMovesWorkingDirectory) {
    TempWorkspace ws;
    auto scope = make_scope(ws, "nav");
    auto moved = scope->navigate("project/src");
    ASSERT_FALSE(is_error(moved));
    EXPECT_EQ(scope->working_directory(), scope->root() / "project" / "src");
    EXPECT_TRUE(std::filesystem::is_directory(scope->working_directory()));
    EXPECT_EQ(scope->to_display_path(scope->working_directory()), "project/src");

    auto relative = scope->resolve("main.cpp");
    ASSERT_FALSE(is_error(relative));
    EXPECT_EQ(get_value(relative), scope->root() / "project" / "src" / "main.cpp");

    auto back = scope->navigate("../..");
    ASSERT_FALSE(is_error(back));
    EXPECT_EQ(scope->working_directory(), scope->root());
}

TEST(SessionScopeTest, NavigateOutsideLeavesWorkingDirectoryUnchanged) {
    TempWorkspace ws;
    auto scope = make_scope(ws, "stay");
    ASSERT_FALSE(is_error(scope->navigate("inner")));

    auto escaped = scope->navigate("../../..");
    ASSERT_TRUE(is_error(escaped));
    EXPECT_EQ(get_error(escaped).code, "boundary_violation");
    EXPECT_EQ(scope->working_directory(), scope->root() / "inner");
}

TEST(SessionScopeTest, NavigateIntoFileFails) {
    TempWorkspace ws;
    auto scope = make_scope(ws, "file");
    ASSERT_FALSE(is_error(scope->ensure_root()));
    std::ofstream(scope->root() / "plain.txt") << "x";

    auto moved = scope->navigate("plain.txt");
    ASSERT_TRUE(is_error(moved));
    EXPECT_EQ(get_error(moved).code, "not_a_directory");
}

TEST(SessionScopeTest, CleanupIsIdempotent) {
    TempWorkspace ws;
    auto scope = make_scope(ws, "gone");
    ASSERT_FALSE(is_error(scope->navigate("a/b")));
    std::ofstream(scope->working_directory() / "f.txt") << "data";

    auto first = scope->cleanup();
    ASSERT_FALSE(is_error(first));
    EXPECT_TRUE(get_value(first));
    EXPECT_FALSE(std::filesystem::exists(scope->root()));
    EXPECT_EQ(scope->working_directory(), scope->root());

    auto second = scope->cleanup();
    ASSERT_FALSE(is_error(second));
    EXPECT_FALSE(get_value(second));
}

TEST(SessionScopeTest, SessionsDoNotSeeEachOther) {
    TempWorkspace ws;
    auto first = make_scope(ws, "one");
    auto second = make_scope(ws, "two");

    auto cross = first->resolve("../two/secret.txt");
    ASSERT_TRUE(is_error(cross));
    EXPECT_EQ(get_error(cross).code, "boundary_violation");
    EXPECT_NE(first->root(), second->root());
}

}  // namespace
