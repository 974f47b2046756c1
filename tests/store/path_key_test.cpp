#include "tsync/store/path_key.hpp"

#include <gtest/gtest.h>

using tsync::store::PathKey;

TEST(PathKeyTest, JoinAndSplit) {
    EXPECT_EQ(PathKey::join("", "a.txt"), "a.txt");
    EXPECT_EQ(PathKey::join("docs", "a.txt"), "docs/a.txt");
    EXPECT_EQ(PathKey::parent("docs/sub/a.txt"), "docs/sub");
    EXPECT_EQ(PathKey::parent("a.txt"), "");
    EXPECT_EQ(PathKey::filename("docs/sub/a.txt"), "a.txt");
}

TEST(PathKeyTest, DepthCountsSegments) {
    EXPECT_EQ(PathKey::depth(""), 0u);
    EXPECT_EQ(PathKey::depth("a"), 1u);
    EXPECT_EQ(PathKey::depth("a/b/c"), 3u);
}

TEST(PathKeyTest, ConflictMarkerInAnySegment) {
    EXPECT_TRUE(PathKey::is_conflict("a.conflict-remote-20240101-101500.txt"));
    EXPECT_TRUE(PathKey::is_conflict("dir.conflict-local-20240101-101500/inner.txt"));
    EXPECT_FALSE(PathKey::is_conflict("conflict/notes.txt"));
    EXPECT_FALSE(PathKey::is_conflict("a.conflicted.txt"));
}

TEST(PathKeyTest, WithinRespectsSegmentBoundaries) {
    EXPECT_TRUE(PathKey::is_within("docs/a.txt", "docs"));
    EXPECT_TRUE(PathKey::is_within("docs", "docs"));
    EXPECT_TRUE(PathKey::is_within("anything", ""));
    EXPECT_FALSE(PathKey::is_within("docsmore/a.txt", "docs"));
    EXPECT_FALSE(PathKey::is_within("docs", "docs/a.txt"));
}

TEST(PathKeyTest, NormalizeCollapsesSeparators) {
    EXPECT_EQ(PathKey::normalize("/docs//a.txt"), "docs/a.txt");
    EXPECT_EQ(PathKey::normalize("./docs/"), "docs");
    EXPECT_EQ(PathKey::normalize("/"), "");
}

TEST(PathKeyTest, ParentSegmentsEscapeTheRoot) {
    EXPECT_TRUE(PathKey::escapes_root(".."));
    EXPECT_TRUE(PathKey::escapes_root("../outside.txt"));
    EXPECT_TRUE(PathKey::escapes_root("docs/../../etc/passwd"));
    EXPECT_FALSE(PathKey::escapes_root("docs/..notes.txt"));
    EXPECT_FALSE(PathKey::escapes_root("a..b/c"));
    EXPECT_FALSE(PathKey::escapes_root(""));
}
