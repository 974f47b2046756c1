#include "support/memory_remote_store.hpp"

#include <gtest/gtest.h>

using tsync::ErrorKind;
using tsync::testing::MemoryRemoteStore;

TEST(RemoteSnapshotTest, CollectsWholeTreeWithoutArtifacts) {
    MemoryRemoteStore remote;
    remote.put("a.txt", "a");
    remote.put("docs/b.txt", "b");
    remote.put("docs/deep/c.txt", "c");
    remote.put("docs/b.conflict-remote-20240101-000000.txt", "old b");
    remote.put_directory("empty");

    auto snapshot = remote.snapshot();
    ASSERT_TRUE(snapshot.is_ok());

    const auto& tree = snapshot.value();
    EXPECT_EQ(tree.files.size(), 3u);
    EXPECT_TRUE(tree.has_file("docs/deep/c.txt"));
    EXPECT_FALSE(tree.has_file("docs/b.conflict-remote-20240101-000000.txt"));
    EXPECT_TRUE(tree.has_directory("docs/deep"));
    EXPECT_TRUE(tree.has_directory("empty"));
    EXPECT_TRUE(tree.has_directory(""));
}

TEST(RemoteSnapshotTest, ListingFailureAbortsSnapshot) {
    MemoryRemoteStore remote;
    remote.put("a.txt", "a");
    remote.fail_all(tsync::Error{ErrorKind::Transient, "connection reset", 0});

    auto snapshot = remote.snapshot();
    ASSERT_TRUE(snapshot.is_error());
    EXPECT_TRUE(snapshot.error().is_transient());
}

TEST(RemoteSnapshotTest, SubdirectoryListingFailureAbortsWholeSnapshot) {
    MemoryRemoteStore remote;
    remote.put("a.txt", "a");
    remote.put("docs/b.txt", "b");
    remote.fail_listing("docs", tsync::Error{ErrorKind::Io, "403 Forbidden", 403});

    auto snapshot = remote.snapshot();
    ASSERT_TRUE(snapshot.is_error());
    EXPECT_EQ(snapshot.error().status, 403);
}

TEST(RemoteSnapshotTest, EnsureDirectoryCreatesMissingAncestors) {
    MemoryRemoteStore remote;
    remote.put_directory("a");

    ASSERT_TRUE(remote.ensure_directory("a/b/c").is_ok());
    EXPECT_TRUE(remote.has_directory("a/b"));
    EXPECT_TRUE(remote.has_directory("a/b/c"));

    remote.put("file", "x");
    auto clash = remote.ensure_directory("file/sub");
    ASSERT_TRUE(clash.is_error());
    EXPECT_EQ(clash.error().kind, ErrorKind::Io);
}
