#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "session/session_store.hpp"

namespace {

using harbor::core::errors::get_error;
using harbor::core::errors::get_value;
using harbor::core::errors::is_error;
using harbor::session::SessionState;
using harbor::session::SessionStore;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_store_" + harbor::core::config::generate_id("test"));
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

TEST(SessionStoreTest, OpenSessionStartsActive) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    auto opened = store.open_session("first");
    ASSERT_FALSE(is_error(opened));
    EXPECT_EQ(get_value(opened)->session_id(), "first");

    auto state = store.get_state("first");
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), SessionState::Active);
    EXPECT_EQ(store.session_count(), 1u);
}

TEST(SessionStoreTest, ActiveSessionCannotBeReopened) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    ASSERT_FALSE(is_error(store.open_session("shared")));
    auto token = get_value(store.get_cancel_token("shared"));

    auto second = store.open_session("shared");
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).code, "session_busy");
    EXPECT_EQ(get_value(store.get_state("shared")), SessionState::Active);
    EXPECT_EQ(get_value(store.get_cancel_token("shared")).get(), token.get());
}

TEST(SessionStoreTest, FinishedSessionReopensWithSameScope) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    auto first = store.open_session("shared");
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(store.mark_completed("shared")));

    auto second = store.open_session("shared");
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(first).get(), get_value(second).get());
}

TEST(SessionStoreTest, CreateSessionGeneratesPrefixedId) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    auto created = store.create_session();
    ASSERT_FALSE(is_error(created));
    EXPECT_EQ(get_value(created)->session_id().rfind("session-", 0), 0u);
}

TEST(SessionStoreTest, CancelSessionSetsToken) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    ASSERT_FALSE(is_error(store.open_session("cancel-me")));

    auto token_result = store.get_cancel_token("cancel-me");
    ASSERT_FALSE(is_error(token_result));
    auto token = get_value(token_result);
    ASSERT_TRUE(token != nullptr);
    EXPECT_FALSE(token->load());

    auto cancel = store.cancel_session("cancel-me");
    ASSERT_FALSE(is_error(cancel));
    EXPECT_EQ(get_value(cancel), SessionState::Cancelled);
    EXPECT_TRUE(token->load());
}

TEST(SessionStoreTest, TerminalSessionRejectsSecondTransition) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    ASSERT_FALSE(is_error(store.open_session("done")));
    ASSERT_FALSE(is_error(store.mark_completed("done")));

    auto again = store.mark_failed("done", "late failure");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "invalid_state_transition");
}

TEST(SessionStoreTest, MarkFailedRecordsReason) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    ASSERT_FALSE(is_error(store.open_session("broken")));
    ASSERT_FALSE(is_error(store.mark_failed("broken", "backend exploded")));

    auto reason = store.get_failure_reason("broken");
    ASSERT_FALSE(is_error(reason));
    ASSERT_TRUE(get_value(reason).has_value());
    EXPECT_EQ(get_value(reason).value(), "backend exploded");
}

TEST(SessionStoreTest, ReopeningTerminalSessionIssuesFreshToken) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    ASSERT_FALSE(is_error(store.open_session("again")));
    auto old_token = get_value(store.get_cancel_token("again"));
    ASSERT_FALSE(is_error(store.cancel_session("again")));

    ASSERT_FALSE(is_error(store.open_session("again")));
    EXPECT_EQ(get_value(store.get_state("again")), SessionState::Active);
    auto new_token = get_value(store.get_cancel_token("again"));
    EXPECT_NE(old_token.get(), new_token.get());
    EXPECT_FALSE(new_token->load());
}

TEST(SessionStoreTest, UnknownSessionIsNotFound) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    auto state = store.get_state("missing");
    ASSERT_TRUE(is_error(state));
    EXPECT_EQ(get_error(state).code, "session_not_found");
    EXPECT_TRUE(is_error(store.cancel_session("missing")));
}

TEST(SessionStoreTest, CleanupRemovesTreeAndForgetsSession) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    auto opened = store.open_session("temp");
    ASSERT_FALSE(is_error(opened));
    auto scope = get_value(opened);
    ASSERT_FALSE(is_error(scope->navigate("work")));
    auto token = get_value(store.get_cancel_token("temp"));

    auto removed = store.cleanup_session("temp");
    ASSERT_FALSE(is_error(removed));
    EXPECT_TRUE(get_value(removed));
    EXPECT_TRUE(token->load());
    EXPECT_FALSE(std::filesystem::exists(ws.root() / "temp"));
    EXPECT_EQ(store.session_count(), 0u);

    auto again = store.cleanup_session("temp");
    ASSERT_FALSE(is_error(again));
    EXPECT_FALSE(get_value(again));
}

TEST(SessionStoreTest, CleanupOfUnknownSessionRemovesLeftoverTree) {
    TempWorkspace ws;
    std::filesystem::create_directories(ws.root() / "leftover" / "data");

    SessionStore store(ws.root());
    auto removed = store.cleanup_session("leftover");
    ASSERT_FALSE(is_error(removed));
    EXPECT_TRUE(get_value(removed));
    EXPECT_FALSE(std::filesystem::exists(ws.root() / "leftover"));
}

TEST(SessionStoreTest, CleanupRejectsUnsafeId) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    auto removed = store.cleanup_session("..");
    ASSERT_TRUE(is_error(removed));
    EXPECT_EQ(get_error(removed).code, "invalid_session_id");
    EXPECT_TRUE(std::filesystem::exists(ws.root()));
}

}  // namespace
