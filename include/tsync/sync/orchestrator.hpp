#pragma once

#include "tsync/events/event_bus.hpp"
#include "tsync/store/local_store.hpp"
#include "tsync/store/remote_store.hpp"
#include "tsync/sync/backoff.hpp"
#include "tsync/sync/baseline.hpp"
#include "tsync/sync/confirmation.hpp"
#include "tsync/sync/cycle.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace tsync::sync {

struct OrchestratorSettings {
    BackoffSettings backoff;
    std::chrono::milliseconds tolerance = ConflictResolver::kDefaultTolerance;
    /// Length of one interval minute; only tests shorten it
    std::chrono::milliseconds minute = std::chrono::minutes{1};
};

/**
 * @brief Periodic driver of reconciliation cycles
 *
 * The ticker lives on an internal io_context thread; cycles run on a
 * single-thread pool. A cycle is posted only after the re-entrancy flag was
 * taken, so at most one cycle is ever queued or running. Ticks arriving
 * while the flag is held are dropped.
 *
 * Every cycle attempt ends with exactly one StatusEvent. Must be owned by a
 * std::shared_ptr (the shutdown pass keeps the instance alive on its own
 * thread).
 */
class Orchestrator : public std::enable_shared_from_this<Orchestrator> {
public:
    Orchestrator(std::shared_ptr<store::LocalStore> local,
                 std::shared_ptr<store::RemoteStore> remote,
                 BaselineStore baseline,
                 ConfirmationGate& gate,
                 events::EventBus& bus,
                 OrchestratorSettings settings = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Arm the ticker and trigger the first cycle
    void start();

    /// Cancel the ticker; an in-flight cycle finishes on its own
    void stop();

    /**
     * @brief Post a cycle to the worker
     * @return false when a cycle is already in flight or the loop is stopped
     */
    bool trigger();

    /// Reset backoff, re-arm the ticker and trigger a cycle immediately
    bool retry();

    /**
     * @brief Run one cycle on the calling thread
     * @return false when another cycle holds the guard
     */
    bool run_cycle();

    /**
     * @brief Best-effort upload walk bounded by a wall-clock timeout
     * @return true when the pass finished in time (successfully or not)
     */
    bool shutdown_pass(std::chrono::milliseconds timeout);

    [[nodiscard]] bool cycle_in_flight() const noexcept { return running_.load(); }
    [[nodiscard]] std::chrono::minutes interval() const;
    [[nodiscard]] std::size_t consecutive_failures() const;

private:
    bool try_acquire() noexcept;
    void acquire_blocking();
    void release();

    void execute_cycle();
    void on_success(const CycleReport& report);
    void on_failure(const CycleReport& report, const Error& error);
    void announce_interval_change(std::chrono::minutes previous, std::chrono::minutes current);

    void arm_timer();
    void schedule_rearm();

    std::shared_ptr<store::LocalStore> local_;
    std::shared_ptr<store::RemoteStore> remote_;
    BaselineStore baseline_;
    events::EventBus& bus_;
    OrchestratorSettings settings_;
    CycleRunner runner_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    BackoffPolicy backoff_;
    std::uint64_t next_cycle_id_ = 1;

    std::atomic<bool> running_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::steady_timer timer_;
    std::thread io_thread_;
    boost::asio::thread_pool worker_{1};
};

} // namespace tsync::sync
