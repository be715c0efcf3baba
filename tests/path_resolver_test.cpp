#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "path_resolver.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;

namespace httpd {
namespace {

int status_of(const Outcome<ResolvedTarget>& outcome) {
    if (const auto* error = std::get_if<HttpError>(&outcome)) {
        return error->status.code;
    }
    return 200;
}

class PathResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = tmp.make_dir("root");
        tmp.write_file("root/index.html", "<html></html>");
        tmp.write_file("root/docs/a b.txt", "spaced");
        tmp.write_file("root2/secret.txt", "sibling");
        tmp.write_file("outside.txt", "outside");
    }

    test::ScopedTempDir tmp;
    fs::path root;
};

TEST(PercentDecode, PlainAndEscaped) {
    EXPECT_EQ(percent_decode("/index.html"), "/index.html");
    EXPECT_EQ(percent_decode("/a%20b.txt"), "/a b.txt");
    EXPECT_EQ(percent_decode("/a+b"), "/a b");
    EXPECT_EQ(percent_decode("%2e%2E"), "..");
    EXPECT_EQ(percent_decode("%e9"), std::string("\xe9"));
}

TEST(PercentDecode, RejectsMalformedEscapes) {
    EXPECT_FALSE(percent_decode("%").has_value());
    EXPECT_FALSE(percent_decode("/x%2").has_value());
    EXPECT_FALSE(percent_decode("/x%zz").has_value());
}

TEST(IsWithin, ComponentBoundary) {
    EXPECT_TRUE(is_within("/srv/www", "/srv/www"));
    EXPECT_TRUE(is_within("/srv/www", "/srv/www/a/b"));
    EXPECT_FALSE(is_within("/srv/www", "/srv/www2/a"));
    EXPECT_FALSE(is_within("/srv/www", "/srv"));
    EXPECT_TRUE(is_within("/", "/etc/passwd"));
}

TEST_F(PathResolverTest, ResolvesExistingFile) {
    auto outcome = resolve_path(root, "/index.html");
    ASSERT_EQ(status_of(outcome), 200);
    const auto& target = std::get<ResolvedTarget>(outcome);
    EXPECT_EQ(target.absolute_file_path, root / "index.html");
    EXPECT_TRUE(target.exists);
    EXPECT_FALSE(target.is_directory);
}

TEST_F(PathResolverTest, DecodesBeforeJoining) {
    auto outcome = resolve_path(root, "/docs/a%20b.txt");
    ASSERT_EQ(status_of(outcome), 200);
    EXPECT_EQ(std::get<ResolvedTarget>(outcome).absolute_file_path, root / "docs" / "a b.txt");
}

TEST_F(PathResolverTest, IgnoresQueryString) {
    EXPECT_EQ(status_of(resolve_path(root, "/index.html?v=3")), 200);
    EXPECT_EQ(status_of(resolve_path(root, "/index.html#top")), 200);
}

TEST_F(PathResolverTest, DotSegmentsInsideRootAreFine) {
    EXPECT_EQ(status_of(resolve_path(root, "/docs/../index.html")), 200);
    EXPECT_EQ(status_of(resolve_path(root, "/./index.html")), 200);
}

TEST_F(PathResolverTest, MissingFileIsNotFound) {
    EXPECT_EQ(status_of(resolve_path(root, "/nope.html")), 404);
    EXPECT_EQ(status_of(resolve_path(root, "/nope/deeper/file")), 404);
}

TEST_F(PathResolverTest, DirectoriesAreNotFound) {
    EXPECT_EQ(status_of(resolve_path(root, "/")), 404);
    EXPECT_EQ(status_of(resolve_path(root, "/docs")), 404);
    EXPECT_EQ(status_of(resolve_path(root, "/docs/")), 404);
}

TEST_F(PathResolverTest, TraversalIsBadRequest) {
    EXPECT_EQ(status_of(resolve_path(root, "/../outside.txt")), 400);
    EXPECT_EQ(status_of(resolve_path(root, "/../../../../../etc/passwd")), 400);
    EXPECT_EQ(status_of(resolve_path(root, "/docs/../../outside.txt")), 400);
}

TEST_F(PathResolverTest, EncodedTraversalIsBadRequest) {
    EXPECT_EQ(status_of(resolve_path(root, "/%2e%2e/outside.txt")), 400);
    EXPECT_EQ(status_of(resolve_path(root, "/..%2foutside.txt")), 400);
}

TEST_F(PathResolverTest, TraversalToMissingFileIsStillBadRequest) {
    EXPECT_EQ(status_of(resolve_path(root, "/../does-not-exist")), 400);
}

TEST_F(PathResolverTest, SiblingWithSharedPrefixIsBadRequest) {
    EXPECT_EQ(status_of(resolve_path(root, "/../root2/secret.txt")), 400);
}

TEST_F(PathResolverTest, SymlinkEscapingRootIsBadRequest) {
    fs::create_symlink(tmp.path() / "outside.txt", root / "escape.txt");
    fs::create_directory_symlink(tmp.path() / "root2", root / "linkdir");

    EXPECT_EQ(status_of(resolve_path(root, "/escape.txt")), 400);
    EXPECT_EQ(status_of(resolve_path(root, "/linkdir/secret.txt")), 400);
}

TEST_F(PathResolverTest, SymlinkBehindMissingSegmentIsBadRequest) {
    fs::create_symlink(tmp.path() / "outside.txt", root / "escape.txt");
    fs::create_directory_symlink(tmp.path() / "root2", root / "linkdir");

    EXPECT_EQ(status_of(resolve_path(root, "/nope/../linkdir/secret.txt")), 400);
    EXPECT_EQ(status_of(resolve_path(root, "/nope/deeper/../../escape.txt")), 400);
    EXPECT_EQ(status_of(resolve_path(root, "/%6eope/%2e%2e/linkdir/secret.txt")), 400);
}

TEST_F(PathResolverTest, MissingSegmentThenDotDotInsideRootIsServed) {
    auto outcome = resolve_path(root, "/nope/../index.html");
    ASSERT_EQ(status_of(outcome), 200);
    EXPECT_EQ(std::get<ResolvedTarget>(outcome).absolute_file_path, root / "index.html");
}

TEST_F(PathResolverTest, SymlinkInsideRootIsServed) {
    fs::create_symlink(root / "index.html", root / "alias.html");

    auto outcome = resolve_path(root, "/alias.html");
    ASSERT_EQ(status_of(outcome), 200);
    EXPECT_EQ(std::get<ResolvedTarget>(outcome).absolute_file_path, root / "index.html");
}

TEST_F(PathResolverTest, MalformedEscapeIsBadRequest) {
    EXPECT_EQ(status_of(resolve_path(root, "/index%2")), 400);
    EXPECT_EQ(status_of(resolve_path(root, "/index%g1.html")), 400);
}

TEST_F(PathResolverTest, EncodedNulIsBadRequest) {
    EXPECT_EQ(status_of(resolve_path(root, "/index.html%00.txt")), 400);
}

} // namespace
} // namespace httpd
