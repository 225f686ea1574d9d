#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "policy/path_boundary.hpp"

namespace {

using harbor::core::errors::ErrorCategory;
using harbor::core::errors::get_error;
using harbor::core::errors::get_value;
using harbor::core::errors::is_error;
using harbor::policy::PathBoundary;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = PathBoundary::normalize(
            std::filesystem::current_path() /
            (".tmp_boundary_" + harbor::core::config::generate_id("test")));
        std::filesystem::create_directories(root_ / "sub" / "deeper");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

TEST(PathBoundaryTest, ResolvesRelativePathBelowRoot) {
    TempWorkspace ws;
    auto resolved = PathBoundary::resolve(ws.root(), ws.root(), "sub/file.txt");
    ASSERT_FALSE(is_error(resolved));
    EXPECT_EQ(get_value(resolved), ws.root() / "sub" / "file.txt");
}

TEST(PathBoundaryTest, EmptyPathResolvesToWorkingDirectory) {
    TempWorkspace ws;
    auto resolved = PathBoundary::resolve(ws.root(), ws.root() / "sub", "");
    ASSERT_FALSE(is_error(resolved));
    EXPECT_EQ(get_value(resolved), ws.root() / "sub");
}

TEST(PathBoundaryTest, DotDotThatStaysInsideIsAllowed) {
    TempWorkspace ws;
    auto resolved = PathBoundary::resolve(ws.root(), ws.root() / "sub" / "deeper", "../x");
    ASSERT_FALSE(is_error(resolved));
    EXPECT_EQ(get_value(resolved), ws.root() / "sub" / "x");

    auto to_root = PathBoundary::resolve(ws.root(), ws.root() / "sub", "..");
    ASSERT_FALSE(is_error(to_root));
    EXPECT_EQ(get_value(to_root), ws.root());
}

TEST(PathBoundaryTest, RejectsParentEscapes) {
    TempWorkspace ws;
    for (const std::string candidate : {"..", "../", "../sibling", "sub/../../x",
                                        "sub/deeper/../../../etc"}) {
        auto resolved = PathBoundary::resolve(ws.root(), ws.root(), candidate);
        ASSERT_TRUE(is_error(resolved)) << candidate;
        EXPECT_EQ(get_error(resolved).category, ErrorCategory::Policy);
        EXPECT_EQ(get_error(resolved).code, "boundary_violation");
    }
}

TEST(PathBoundaryTest, RejectsAbsolutePaths) {
    TempWorkspace ws;
    auto resolved = PathBoundary::resolve(ws.root(), ws.root(), "/etc/passwd");
    ASSERT_TRUE(is_error(resolved));
    EXPECT_EQ(get_error(resolved).code, "boundary_violation");

    auto inside_but_absolute =
        PathBoundary::resolve(ws.root(), ws.root(), ws.root() / "sub");
    ASSERT_TRUE(is_error(inside_but_absolute));
}

TEST(PathBoundaryTest, RejectsRelativeRoot) {
    auto resolved = PathBoundary::resolve("relative/root", "", "file.txt");
    ASSERT_TRUE(is_error(resolved));
    EXPECT_EQ(get_error(resolved).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(resolved).code, "invalid_session_root");
}

TEST(PathBoundaryTest, SymlinkOutOfRootIsRejected) {
    TempWorkspace ws;
    const auto outside = ws.root().parent_path();
    std::error_code ec;
    std::filesystem::create_directory_symlink(outside, ws.root() / "link", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }
    auto resolved = PathBoundary::resolve(ws.root(), ws.root(), "link/file.txt");
    ASSERT_TRUE(is_error(resolved));
    EXPECT_EQ(get_error(resolved).code, "boundary_violation");
}

TEST(PathBoundaryTest, PrefixSiblingIsNotInside) {
    EXPECT_TRUE(PathBoundary::is_within_root("/cache/s1", "/cache/s1"));
    EXPECT_TRUE(PathBoundary::is_within_root("/cache/s1", "/cache/s1/a/b"));
    EXPECT_TRUE(PathBoundary::is_within_root("/cache/s1/", "/cache/s1/a"));
    EXPECT_FALSE(PathBoundary::is_within_root("/cache/s1", "/cache/s10"));
    EXPECT_FALSE(PathBoundary::is_within_root("/cache/s1", "/cache"));
    EXPECT_FALSE(PathBoundary::is_within_root("/cache/s1", "/cache/s1/../s2"));
}

TEST(PathBoundaryTest, CaseInsensitiveComparisonIsOptIn) {
    EXPECT_FALSE(PathBoundary::is_within_root("/Cache/S1", "/cache/s1/a", false));
    EXPECT_TRUE(PathBoundary::is_within_root("/Cache/S1", "/cache/s1/a", true));
}

TEST(PathBoundaryTest, DisplayPathIsRelativeOrSentinel) {
    TempWorkspace ws;
    EXPECT_EQ(PathBoundary::to_display_path(ws.root(), ws.root()), ".");
    EXPECT_EQ(PathBoundary::to_display_path(ws.root(), ws.root() / "sub" / "a.txt"),
              "sub/a.txt");
    EXPECT_EQ(PathBoundary::to_display_path(ws.root(), ws.root().parent_path()),
              harbor::policy::kOutsideSessionSentinel);
    EXPECT_EQ(PathBoundary::to_display_path(ws.root(), "relative/path"),
              harbor::policy::kOutsideSessionSentinel);
}

}  // namespace
