#include "tsync/sync/service.hpp"

#include "tsync/events/components.hpp"
#include "tsync/events/events.hpp"
#include "tsync/sync/baseline.hpp"

#include "support/memory_remote_store.hpp"
#include "support/recording_gate.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <functional>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using tsync::ErrorKind;
using tsync::events::EventBus;
using tsync::events::SessionStartedEvent;
using tsync::events::SessionStoppedEvent;
using tsync::events::StatusComponent;
using tsync::events::StatusLevel;
using tsync::sync::BaselineStore;
using tsync::sync::Ledger;
using tsync::sync::RemoteFactory;
using tsync::sync::ServiceSettings;
using tsync::sync::SessionAck;
using tsync::sync::SessionRequest;
using tsync::sync::SyncService;
using tsync::testing::MemoryRemoteStore;
using tsync::testing::RecordingGate;
using tsync::testing::TempDir;
using tsync::testing::write_file;

namespace {

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds limit = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

} // namespace

class SyncServiceTest : public ::testing::Test {
protected:
    SyncServiceTest()
        : root_("tsync_service_local"),
          state_("tsync_service_state"),
          remote_(std::make_shared<MemoryRemoteStore>()),
          status_(bus_) {
        bus_.subscribe<SessionStoppedEvent>([this](const SessionStoppedEvent&) { stopped_++; });
    }

    ServiceSettings settings() const {
        ServiceSettings settings;
        settings.local_root = root_ / "data";
        settings.ledger_path = state_ / "ledger.json";
        return settings;
    }

    RemoteFactory factory() {
        return [this](const SessionRequest& request) -> tsync::Result<std::shared_ptr<tsync::store::RemoteStore>> {
            last_request_ = request;
            return tsync::Ok<std::shared_ptr<tsync::store::RemoteStore>>(remote_);
        };
    }

    SessionRequest request(int interval = 5) const {
        return SessionRequest{"file:///mnt/share", "alice", "secret", interval};
    }

    TempDir root_;
    TempDir state_;
    std::shared_ptr<MemoryRemoteStore> remote_;
    RecordingGate gate_;
    EventBus bus_;
    StatusComponent status_;
    std::atomic<int> stopped_{0};
    SessionRequest last_request_;
};

TEST_F(SyncServiceTest, StartRunsFirstCycle) {
    remote_->put("docs/readme.txt", "hello");

    size_t started = 0;
    bus_.subscribe<SessionStartedEvent>([&](const SessionStartedEvent& e) {
        EXPECT_EQ(e.interval, 5min);
        started++;
    });

    SyncService service(settings(), factory(), gate_, bus_);
    ASSERT_EQ(service.start_session(request()), SessionAck::CycleStarted);
    EXPECT_TRUE(service.has_session());
    EXPECT_EQ(started, 1u);
    EXPECT_EQ(last_request_.principal, "alice");

    // login status, then the first cycle's status
    ASSERT_TRUE(wait_until([this] { return status_.count() >= 2u; }));
    EXPECT_EQ(status_.last()->level, StatusLevel::Ok);
    EXPECT_TRUE(fs::exists(root_ / "data/docs/readme.txt"));

    service.stop_session();
    EXPECT_FALSE(service.has_session());
}

TEST_F(SyncServiceTest, UnreachableRemoteReportsLoginError) {
    remote_->fail_all(tsync::Error{ErrorKind::Io, "401 Unauthorized", 401});

    SyncService service(settings(), factory(), gate_, bus_);
    EXPECT_EQ(service.start_session(request()), SessionAck::Failed);
    EXPECT_FALSE(service.has_session());

    ASSERT_TRUE(status_.last().has_value());
    EXPECT_EQ(status_.last()->level, StatusLevel::Error);
    EXPECT_EQ(status_.last()->message, "login failed: 401 Unauthorized");
}

TEST_F(SyncServiceTest, FactoryErrorReportsLoginError) {
    RemoteFactory broken = [](const SessionRequest&) -> tsync::Result<std::shared_ptr<tsync::store::RemoteStore>> {
        return tsync::Err<std::shared_ptr<tsync::store::RemoteStore>>(ErrorKind::Invalid, "unsupported scheme");
    };

    SyncService service(settings(), broken, gate_, bus_);
    EXPECT_EQ(service.start_session(request()), SessionAck::Failed);
    EXPECT_EQ(status_.last()->message, "login failed: unsupported scheme");
}

TEST_F(SyncServiceTest, RejectsZeroInterval) {
    SyncService service(settings(), factory(), gate_, bus_);
    EXPECT_EQ(service.start_session(request(0)), SessionAck::Failed);
    EXPECT_EQ(status_.last()->level, StatusLevel::Error);
    EXPECT_FALSE(service.has_session());
}

TEST_F(SyncServiceTest, StopIsIdempotentAndRetryNeedsSession) {
    SyncService service(settings(), factory(), gate_, bus_);
    EXPECT_FALSE(service.retry());

    service.stop_session();
    EXPECT_EQ(stopped_.load(), 0);

    ASSERT_EQ(service.start_session(request()), SessionAck::CycleStarted);
    service.stop_session();
    service.stop_session();
    EXPECT_EQ(stopped_.load(), 1);
    EXPECT_FALSE(service.retry());
}

TEST_F(SyncServiceTest, ShutdownUploadsAndDropsSession) {
    SyncService service(settings(), factory(), gate_, bus_);
    ASSERT_EQ(service.start_session(request()), SessionAck::CycleStarted);
    ASSERT_TRUE(wait_until([this] { return status_.count() >= 2u; }));

    write_file(root_ / "data/late.txt", "late");
    EXPECT_TRUE(service.shutdown(5s));
    EXPECT_FALSE(service.has_session());
    EXPECT_EQ(remote_->content("late.txt"), "late");
    EXPECT_EQ(stopped_.load(), 1);

    EXPECT_TRUE(service.shutdown(1s));
}

TEST_F(SyncServiceTest, NewSessionReplacesOldOne) {
    SyncService service(settings(), factory(), gate_, bus_);
    ASSERT_EQ(service.start_session(request()), SessionAck::CycleStarted);
    auto first = service.orchestrator();

    ASSERT_EQ(service.start_session(request(10)), SessionAck::CycleStarted);
    EXPECT_NE(service.orchestrator(), first);
    EXPECT_EQ(service.orchestrator()->interval(), 10min);
    EXPECT_EQ(stopped_.load(), 1);
    EXPECT_FALSE(first->trigger());
}

TEST_F(SyncServiceTest, ShutdownOrExitReturnsWhenUploadFinishes) {
    SyncService service(settings(), factory(), gate_, bus_);
    ASSERT_EQ(service.start_session(request()), SessionAck::CycleStarted);
    ASSERT_TRUE(wait_until([this] { return status_.count() >= 2u; }));

    write_file(root_ / "data/late.txt", "late");
    service.shutdown_or_exit(5s);
    EXPECT_FALSE(service.has_session());
    EXPECT_EQ(remote_->content("late.txt"), "late");
}

using SyncServiceDeathTest = SyncServiceTest;

TEST_F(SyncServiceDeathTest, ShutdownOrExitEndsProcessWhenUploadPassHangs) {
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";

    EXPECT_EXIT(
        {
            // A file the ledger knows that is gone from the server makes the
            // first cycle stop at the deletion prompt.
            Ledger ledger;
            ledger.add("a.txt");
            if (BaselineStore(state_ / "ledger.json").save(ledger).is_error()) {
                std::exit(1);
            }
            write_file(root_ / "data/a.txt", "kept");

            std::atomic<bool> asked{false};
            gate_.on_confirm([&asked] {
                asked = true;
                std::this_thread::sleep_for(60s);
            });

            SyncService service(settings(), factory(), gate_, bus_);
            if (service.start_session(request()) != SessionAck::CycleStarted
                || !wait_until([&asked] { return asked.load(); })) {
                std::exit(1);
            }

            service.shutdown_or_exit(50ms);
            std::exit(0);
        },
        ::testing::ExitedWithCode(tsync::sync::kAbandonedExitCode), "");
}
