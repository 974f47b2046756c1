/**
 * @file components.hpp
 * @brief Ready-made subscribers for the engine's events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * StatusComponent status(bus);
 *
 * Components unsubscribe in their destructor, so they may be shorter-lived
 * than the bus.
 */

#pragma once

#include "tsync/events/event_bus.hpp"
#include "tsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace tsync::events {

/**
 * @brief Keeps handler registrations and drops them on destruction
 */
class Subscriptions {
public:
    explicit Subscriptions(EventBus& bus) : bus_(bus) {}
    ~Subscriptions() {
        for (auto& release : releases_) {
            release();
        }
    }

    Subscriptions(const Subscriptions&) = delete;
    Subscriptions& operator=(const Subscriptions&) = delete;

    template<typename EventType>
    void add(std::function<void(const EventType&)> handler) {
        const SubscriptionId id = bus_.subscribe<EventType>(std::move(handler));
        releases_.push_back([this, id] { bus_.unsubscribe<EventType>(id); });
    }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> releases_;
};

/**
 * @brief Logger component - renders every engine event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<StatusEvent>([](const StatusEvent& e) {
            switch (e.level) {
                case StatusLevel::Ok: spdlog::info("[Status] {}", e.message); break;
                case StatusLevel::Warning: spdlog::warn("[Status] {}", e.message); break;
                case StatusLevel::Error: spdlog::error("[Status] {}", e.message); break;
            }
        });

        subscriptions_.add<SessionStartedEvent>([](const SessionStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Session started: {} <-> {}", e.local_root, e.endpoint);
            spdlog::info("Sync interval: {} min", e.interval.count());
            spdlog::info("════════════════════════════════════════════");
        });

        subscriptions_.add<SessionStoppedEvent>([](const SessionStoppedEvent& e) {
            spdlog::info("Session stopped: {}", e.reason);
        });

        subscriptions_.add<CycleStartedEvent>([](const CycleStartedEvent& e) {
            spdlog::debug("[CycleStarted] id={}", e.cycle_id);
        });

        subscriptions_.add<CycleCompletedEvent>([](const CycleCompletedEvent& e) {
            const auto& r = e.report;
            spdlog::info("[CycleCompleted] id={} uploads={} downloads={} artifacts={} "
                         "local_deletions={} remote_deletions={} failures={} duration={}ms",
                         r.cycle_id, r.uploads, r.downloads, r.conflict_artifacts,
                         r.local_deletions, r.remote_deletions, r.item_failures,
                         r.duration.count());
        });

        subscriptions_.add<CycleFailedEvent>([](const CycleFailedEvent& e) {
            spdlog::warn("[CycleFailed] id={} kind={} consecutive={} error={}",
                         e.cycle_id, to_string(e.kind), e.consecutive_failures, e.error_message);
        });

        subscriptions_.add<TickDroppedEvent>([](const TickDroppedEvent&) {
            spdlog::debug("[TickDropped] previous cycle still running");
        });

        subscriptions_.add<IntervalChangedEvent>([](const IntervalChangedEvent& e) {
            spdlog::info("[IntervalChanged] {} min -> {} min", e.previous.count(), e.current.count());
        });

        subscriptions_.add<FileUploadedEvent>([](const FileUploadedEvent& e) {
            spdlog::info("[Uploaded] path={} bytes={}", e.path, e.bytes);
        });

        subscriptions_.add<FileDownloadedEvent>([](const FileDownloadedEvent& e) {
            spdlog::info("[Downloaded] path={} bytes={}", e.path, e.bytes);
        });

        subscriptions_.add<ConflictArtifactCreatedEvent>([](const ConflictArtifactCreatedEvent& e) {
            spdlog::warn("[ConflictPreserved] path={} artifact={} side={}",
                         e.path, e.artifact_path, to_string(e.stored_on));
        });

        subscriptions_.add<DeletionsAppliedEvent>([](const DeletionsAppliedEvent& e) {
            spdlog::info("[DeletionsApplied] side={} count={}", to_string(e.target), e.paths.size());
            for (const auto& path : e.paths) {
                spdlog::debug("  deleted {}", path);
            }
        });

        subscriptions_.add<DeletionsDeclinedEvent>([](const DeletionsDeclinedEvent& e) {
            spdlog::info("[DeletionsDeclined] side={} count={}", to_string(e.target), e.count);
        });
    }

private:
    Subscriptions subscriptions_;
};

/**
 * @brief Metrics component - running totals across cycles
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_uploaded{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> files_downloaded{0};
        std::atomic<uint64_t> bytes_downloaded{0};
        std::atomic<uint64_t> conflict_artifacts{0};
        std::atomic<uint64_t> local_deletions{0};
        std::atomic<uint64_t> remote_deletions{0};
        std::atomic<uint64_t> declined_batches{0};
        std::atomic<uint64_t> cycles_completed{0};
        std::atomic<uint64_t> cycles_failed{0};
        std::atomic<uint64_t> ticks_dropped{0};
    };

    explicit MetricsComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<FileUploadedEvent>([this](const FileUploadedEvent& e) {
            stats_.files_uploaded++;
            stats_.bytes_uploaded += e.bytes;
        });

        subscriptions_.add<FileDownloadedEvent>([this](const FileDownloadedEvent& e) {
            stats_.files_downloaded++;
            stats_.bytes_downloaded += e.bytes;
        });

        subscriptions_.add<ConflictArtifactCreatedEvent>([this](const ConflictArtifactCreatedEvent&) {
            stats_.conflict_artifacts++;
        });

        subscriptions_.add<DeletionsAppliedEvent>([this](const DeletionsAppliedEvent& e) {
            if (e.target == Replica::Local) {
                stats_.local_deletions += e.paths.size();
            } else {
                stats_.remote_deletions += e.paths.size();
            }
        });

        subscriptions_.add<DeletionsDeclinedEvent>([this](const DeletionsDeclinedEvent&) {
            stats_.declined_batches++;
        });

        subscriptions_.add<CycleCompletedEvent>([this](const CycleCompletedEvent&) {
            stats_.cycles_completed++;
        });

        subscriptions_.add<CycleFailedEvent>([this](const CycleFailedEvent&) {
            stats_.cycles_failed++;
        });

        subscriptions_.add<TickDroppedEvent>([this](const TickDroppedEvent&) {
            stats_.ticks_dropped++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Session Statistics:");
        spdlog::info("  Cycles ok/failed: {}/{}", stats_.cycles_completed.load(), stats_.cycles_failed.load());
        spdlog::info("  Ticks dropped:    {}", stats_.ticks_dropped.load());
        spdlog::info("  Files uploaded:   {} ({} bytes)", stats_.files_uploaded.load(), stats_.bytes_uploaded.load());
        spdlog::info("  Files downloaded: {} ({} bytes)", stats_.files_downloaded.load(), stats_.bytes_downloaded.load());
        spdlog::info("  Conflict copies:  {}", stats_.conflict_artifacts.load());
        spdlog::info("  Deleted local:    {}", stats_.local_deletions.load());
        spdlog::info("  Deleted remote:   {}", stats_.remote_deletions.load());
        spdlog::info("  Declined batches: {}", stats_.declined_batches.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
    Subscriptions subscriptions_;
};

/**
 * @brief Remembers the most recent status line
 */
class StatusComponent {
public:
    explicit StatusComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<StatusEvent>([this](const StatusEvent& e) {
            std::lock_guard lock(mutex_);
            last_ = e;
            ++count_;
        });
    }

    std::optional<StatusEvent> last() const {
        std::lock_guard lock(mutex_);
        return last_;
    }

    size_t count() const {
        std::lock_guard lock(mutex_);
        return count_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<StatusEvent> last_;
    size_t count_ = 0;
    Subscriptions subscriptions_;
};

} // namespace tsync::events
