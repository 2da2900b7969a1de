#include <gtest/gtest.h>
#include <scratchpad/core/path_resolver.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace scratchpad;

class PathResolverTest : public ::testing::Test {
protected:
    fs::path base;
    fs::path root;
    fs::path outside;

    void SetUp() override {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        base = fs::temp_directory_path() /
               ("scratchpad_resolver_" + std::string(info->name()) + "_" + std::to_string(getpid()));
        fs::remove_all(base);
        root = base / "scratch";
        outside = base / "outside";
        fs::create_directories(outside);
    }

    void TearDown() override {
        fs::remove_all(base);
    }
};

TEST_F(PathResolverTest, ConstructorCreatesMissingRoot) {
    fs::path nested = base / "deep" / "er" / "root";
    ASSERT_FALSE(fs::exists(nested));

    PathResolver resolver(nested);
    EXPECT_TRUE(fs::is_directory(nested));
    EXPECT_TRUE(resolver.root().is_absolute());
    EXPECT_EQ(resolver.root(), fs::canonical(nested));
}

TEST_F(PathResolverTest, ConstructorThrowsWhenRootIsAFile) {
    fs::create_directories(base);
    fs::path file = base / "not_a_dir";
    std::ofstream(file.c_str()) << "x";

    EXPECT_THROW(PathResolver resolver(file), std::runtime_error);
}

TEST_F(PathResolverTest, ResolvesNestedPathInsideRoot) {
    PathResolver resolver(root);
    ResolvedPath r = resolver.resolve("docs/notes.txt");
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.path, resolver.root() / "docs" / "notes.txt");
}

TEST_F(PathResolverTest, TrimsSurroundingWhitespace) {
    PathResolver resolver(root);
    ResolvedPath r = resolver.resolve("  \tnotes.txt \n");
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.path, resolver.root() / "notes.txt");
}

TEST_F(PathResolverTest, StripsTrailingSeparator) {
    PathResolver resolver(root);
    ResolvedPath r = resolver.resolve("a/b/");
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.path, resolver.root() / "a" / "b");
}

TEST_F(PathResolverTest, NormalizesInnerDotSegments) {
    PathResolver resolver(root);
    ResolvedPath r = resolver.resolve("a/./b/../c.txt");
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.path, resolver.root() / "a" / "c.txt");
}

TEST_F(PathResolverTest, RejectsEmptyAndRootPaths) {
    PathResolver resolver(root);
    const char* cases[] = {"", "   ", ".", "./", "a/..", "a/b/../.."};
    for (const char* c : cases) {
        ResolvedPath r = resolver.resolve(c);
        EXPECT_FALSE(r.ok()) << "'" << c << "'";
        EXPECT_EQ(r.error, FsErrorKind::InvalidPath) << "'" << c << "'";
    }
}

TEST_F(PathResolverTest, RejectsParentTraversal) {
    PathResolver resolver(root);
    const char* cases[] = {"..", "../outside.txt", "a/../../x", "a/b/../../../etc/passwd", "../scratch_sibling/x"};
    for (const char* c : cases) {
        ResolvedPath r = resolver.resolve(c);
        EXPECT_EQ(r.error, FsErrorKind::PathTraversal) << "'" << c << "'";
        EXPECT_EQ(r.message, "Path traversal attempt detected");
    }
}

TEST_F(PathResolverTest, RejectsAbsolutePathOutsideRoot) {
    PathResolver resolver(root);
    ResolvedPath r = resolver.resolve((outside / "secret.txt").string());
    EXPECT_EQ(r.error, FsErrorKind::PathTraversal);

    ResolvedPath etc = resolver.resolve("/etc/passwd");
    EXPECT_EQ(etc.error, FsErrorKind::PathTraversal);
}

TEST_F(PathResolverTest, AcceptsAbsolutePathInsideRoot) {
    PathResolver resolver(root);
    ResolvedPath r = resolver.resolve((resolver.root() / "inside.txt").string());
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.path, resolver.root() / "inside.txt");
}

TEST_F(PathResolverTest, RejectsSymlinkPointingOutside) {
    PathResolver resolver(root);
    fs::create_directory_symlink(outside, resolver.root() / "escape");

    ResolvedPath r = resolver.resolve("escape/secret.txt");
    EXPECT_EQ(r.error, FsErrorKind::PathTraversal);

    ResolvedPath link_itself = resolver.resolve("escape");
    EXPECT_EQ(link_itself.error, FsErrorKind::PathTraversal);
}

TEST_F(PathResolverTest, FollowsSymlinkThatStaysInside) {
    PathResolver resolver(root);
    fs::create_directories(resolver.root() / "real");
    fs::create_directory_symlink(resolver.root() / "real", resolver.root() / "alias");

    ResolvedPath r = resolver.resolve("alias/file.txt");
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.path, resolver.root() / "real" / "file.txt");
}

TEST_F(PathResolverTest, RejectsDanglingSymlink) {
    PathResolver resolver(root);
    fs::create_symlink(outside / "does_not_exist.txt", resolver.root() / "dangling");

    ResolvedPath r = resolver.resolve("dangling");
    EXPECT_EQ(r.error, FsErrorKind::PathTraversal);
    EXPECT_FALSE(fs::exists(outside / "does_not_exist.txt"));
}

TEST_F(PathResolverTest, ResolveIsIdempotent) {
    PathResolver resolver(root);
    const char* cases[] = {"a.txt", "x/y/z.md", " spaced.txt ", "a/../b"};
    for (const char* c : cases) {
        ResolvedPath first = resolver.resolve(c);
        ResolvedPath second = resolver.resolve(c);
        ASSERT_TRUE(first.ok()) << c;
        EXPECT_EQ(first.path, second.path) << c;
    }
}

TEST_F(PathResolverTest, RelativeToRootUsesForwardSlashes) {
    PathResolver resolver(root);
    ResolvedPath r = resolver.resolve("a/b/c.txt");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(resolver.relative_to_root(r.path), "a/b/c.txt");
}
