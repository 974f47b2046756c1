#include "tsync/events/components.hpp"
#include "tsync/events/event_bus.hpp"
#include "tsync/events/events.hpp"

#include <gtest/gtest.h>

using tsync::events::ConflictArtifactCreatedEvent;
using tsync::events::CycleCompletedEvent;
using tsync::events::CycleFailedEvent;
using tsync::events::DeletionsAppliedEvent;
using tsync::events::DeletionsDeclinedEvent;
using tsync::events::EventBus;
using tsync::events::FileDownloadedEvent;
using tsync::events::FileUploadedEvent;
using tsync::events::LoggerComponent;
using tsync::events::MetricsComponent;
using tsync::events::Replica;
using tsync::events::StatusComponent;
using tsync::events::StatusEvent;
using tsync::events::StatusLevel;
using tsync::events::TickDroppedEvent;

TEST(MetricsComponentTest, TracksTransfersConflictsAndDeletions) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(FileUploadedEvent{"a.txt", 1024});
    bus.emit(FileDownloadedEvent{"b.txt", 2048});
    bus.emit(ConflictArtifactCreatedEvent{"a.txt", "a.conflict-remote-20240101-000000.txt", Replica::Remote});
    bus.emit(DeletionsAppliedEvent{Replica::Local, {"x.txt", "y.txt"}});
    bus.emit(DeletionsAppliedEvent{Replica::Remote, {"z.txt"}});
    bus.emit(DeletionsDeclinedEvent{Replica::Local, 4});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_uploaded.load(), 1u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 1024u);
    EXPECT_EQ(stats.files_downloaded.load(), 1u);
    EXPECT_EQ(stats.bytes_downloaded.load(), 2048u);
    EXPECT_EQ(stats.conflict_artifacts.load(), 1u);
    EXPECT_EQ(stats.local_deletions.load(), 2u);
    EXPECT_EQ(stats.remote_deletions.load(), 1u);
    EXPECT_EQ(stats.declined_batches.load(), 1u);
}

TEST(MetricsComponentTest, CountsCycleOutcomes) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(CycleCompletedEvent{});
    bus.emit(CycleCompletedEvent{});
    bus.emit(CycleFailedEvent{3, tsync::ErrorKind::Transient, "timeout", 1});
    bus.emit(TickDroppedEvent{});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.cycles_completed.load(), 2u);
    EXPECT_EQ(stats.cycles_failed.load(), 1u);
    EXPECT_EQ(stats.ticks_dropped.load(), 1u);
}

TEST(MetricsComponentTest, UnsubscribesWhenDestroyed) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<FileUploadedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<FileUploadedEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(FileUploadedEvent{"a.txt", 1}));
}

TEST(StatusComponentTest, KeepsLatestStatus) {
    EventBus bus;
    StatusComponent status(bus);

    EXPECT_FALSE(status.last().has_value());

    bus.emit(StatusEvent{StatusLevel::Warning, "sync failed (1/3): timeout"});
    bus.emit(StatusEvent{StatusLevel::Ok, "sync complete, everything up to date"});

    ASSERT_TRUE(status.last().has_value());
    EXPECT_EQ(status.last()->level, StatusLevel::Ok);
    EXPECT_EQ(status.last()->message, "sync complete, everything up to date");
    EXPECT_EQ(status.count(), 2u);
}
