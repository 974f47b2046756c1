#include "tsync/sync/conflict.hpp"
#include "tsync/store/path_key.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace std::chrono_literals;
using tsync::store::EntryKind;
using tsync::store::from_millis;
using tsync::store::Timestamp;
using tsync::store::TreeEntry;
using tsync::sync::Action;
using tsync::sync::ArtifactOrigin;
using tsync::sync::ConflictResolver;
using tsync::sync::Direction;

namespace {

// 2024-01-01 10:15:00 UTC
constexpr std::int64_t kMorning = 1704104100000;

TreeEntry file_at(std::int64_t millis) {
    return TreeEntry{"docs/a.txt", EntryKind::File, from_millis(millis)};
}

} // namespace

class ConflictResolverTest : public ::testing::Test {
protected:
    ConflictResolver resolver_;
};

TEST_F(ConflictResolverTest, MissingSideIsCopied) {
    EXPECT_EQ(resolver_.decide(std::nullopt, file_at(kMorning), Direction::Download).action, Action::Download);
    EXPECT_EQ(resolver_.decide(file_at(kMorning), std::nullopt, Direction::Upload).action, Action::Upload);
    EXPECT_EQ(resolver_.decide(std::nullopt, std::nullopt, Direction::Upload).action, Action::NoOp);
}

TEST_F(ConflictResolverTest, SmallSkewCountsAsConverged) {
    const auto local = file_at(kMorning);
    EXPECT_EQ(resolver_.decide(local, file_at(kMorning + 1500), Direction::Upload).action, Action::NoOp);
    EXPECT_EQ(resolver_.decide(local, file_at(kMorning - 1500), Direction::Upload).action, Action::NoOp);
    EXPECT_EQ(resolver_.decide(local, file_at(kMorning + 2000), Direction::Download).action, Action::NoOp);
}

TEST_F(ConflictResolverTest, NewerLocalIsUploadedOnlyByUploadWalk) {
    const auto local = file_at(kMorning);
    const auto remote = file_at(kMorning - 5000);

    auto upload = resolver_.decide(local, remote, Direction::Upload);
    EXPECT_EQ(upload.action, Action::Upload);
    EXPECT_EQ(upload.delta_ms, -5000);
    EXPECT_EQ(resolver_.decide(local, remote, Direction::Download).action, Action::NoOp);
}

TEST_F(ConflictResolverTest, NewerRemoteLosesButIsPreserved) {
    const auto local = file_at(kMorning);
    const auto remote = file_at(kMorning + 2001);

    EXPECT_EQ(resolver_.decide(local, remote, Direction::Upload).action, Action::UploadPreservingRemote);
    EXPECT_EQ(resolver_.decide(local, remote, Direction::Download).action, Action::PreserveRemoteLocally);
}

TEST_F(ConflictResolverTest, ToleranceIsConfigurable) {
    ConflictResolver strict(0ms);
    EXPECT_EQ(strict.decide(file_at(kMorning), file_at(kMorning + 1), Direction::Upload).action,
              Action::UploadPreservingRemote);
    EXPECT_EQ(strict.decide(file_at(kMorning), file_at(kMorning), Direction::Upload).action, Action::NoOp);
}

TEST(ArtifactNameTest, EmbedsOriginAndUtcTime) {
    const Timestamp when = from_millis(kMorning);
    EXPECT_EQ(tsync::sync::artifact_name("docs/a.txt", ArtifactOrigin::Remote, when),
              "docs/a.conflict-remote-20240101-101500.txt");
    EXPECT_EQ(tsync::sync::artifact_name("a.txt", ArtifactOrigin::Local, when, 2),
              "a.conflict-local-20240101-101500-2.txt");
}

TEST(ArtifactNameTest, ExtensionHandling) {
    const Timestamp when = from_millis(kMorning);
    EXPECT_EQ(tsync::sync::artifact_name("README", ArtifactOrigin::Remote, when),
              "README.conflict-remote-20240101-101500");
    EXPECT_EQ(tsync::sync::artifact_name("home/.bashrc", ArtifactOrigin::Remote, when),
              "home/.bashrc.conflict-remote-20240101-101500");
    EXPECT_EQ(tsync::sync::artifact_name("backup.tar.gz", ArtifactOrigin::Remote, when),
              "backup.tar.conflict-remote-20240101-101500.gz");
}

TEST(ArtifactNameTest, UniqueNameSkipsTakenCandidates) {
    const Timestamp when = from_millis(kMorning);
    const std::set<std::string> taken{
        "a.conflict-remote-20240101-101500.txt",
        "a.conflict-remote-20240101-101500-1.txt",
    };

    auto name = tsync::sync::unique_artifact_name(
        "a.txt", ArtifactOrigin::Remote, when,
        [&taken](const std::string& candidate) { return taken.count(candidate) != 0; });
    EXPECT_EQ(name, "a.conflict-remote-20240101-101500-2.txt");
}

TEST(ArtifactNameTest, ArtifactsAreRecognizedAsConflicts) {
    const auto name = tsync::sync::artifact_name("x/y.md", ArtifactOrigin::Remote, from_millis(kMorning));
    EXPECT_TRUE(tsync::store::PathKey::is_conflict(name));
}
