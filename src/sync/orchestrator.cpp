#include "tsync/sync/orchestrator.hpp"

#include "tsync/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <future>

namespace tsync::sync {
namespace {

std::string summarize(const CycleReport& report) {
    if (report.mutations() == 0 && report.item_failures == 0) {
        return "sync complete, everything up to date";
    }
    auto message = fmt::format("sync complete: {} uploaded, {} downloaded, {} conflict copies, {} deleted",
                               report.uploads, report.downloads, report.conflict_artifacts,
                               report.local_deletions + report.remote_deletions);
    if (report.item_failures > 0) {
        message += fmt::format(" ({} skipped)", report.item_failures);
    }
    return message;
}

} // namespace

Orchestrator::Orchestrator(std::shared_ptr<store::LocalStore> local,
                           std::shared_ptr<store::RemoteStore> remote,
                           BaselineStore baseline,
                           ConfirmationGate& gate,
                           events::EventBus& bus,
                           OrchestratorSettings settings)
    : local_(std::move(local)),
      remote_(std::move(remote)),
      baseline_(std::move(baseline)),
      bus_(bus),
      settings_(settings),
      runner_(*local_, *remote_, baseline_, gate, bus_, ConflictResolver(settings_.tolerance)),
      backoff_(settings_.backoff),
      work_(boost::asio::make_work_guard(io_)),
      timer_(io_) {}

Orchestrator::~Orchestrator() {
    stop();
    worker_.join();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

void Orchestrator::start() {
    if (stopped_.load() || started_.exchange(true)) {
        return;
    }

    io_thread_ = std::thread([this] { io_.run(); });
    schedule_rearm();
    trigger();
}

void Orchestrator::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    work_.reset();
    io_.stop();
    if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id()) {
        io_thread_.join();
    }
    spdlog::debug("Sync loop stopped");
}

bool Orchestrator::trigger() {
    if (stopped_.load()) {
        return false;
    }

    if (!try_acquire()) {
        spdlog::debug("Cycle still running, tick dropped");
        bus_.emit(events::TickDroppedEvent{});
        return false;
    }

    boost::asio::post(worker_, [this] {
        if (!stopped_.load()) {
            execute_cycle();
        }
        release();
    });
    return true;
}

bool Orchestrator::retry() {
    if (stopped_.load()) {
        return false;
    }

    std::chrono::minutes previous;
    std::chrono::minutes current;
    bool changed = false;
    {
        std::lock_guard lock(mutex_);
        previous = backoff_.interval();
        changed = backoff_.reset();
        current = backoff_.interval();
    }
    if (changed) {
        announce_interval_change(previous, current);
    }

    spdlog::info("Manual retry requested");
    schedule_rearm();
    return trigger();
}

bool Orchestrator::run_cycle() {
    if (!try_acquire()) {
        return false;
    }
    execute_cycle();
    release();
    return true;
}

bool Orchestrator::shutdown_pass(std::chrono::milliseconds timeout) {
    auto self = shared_from_this();
    auto finished = std::make_shared<std::promise<void>>();
    auto done = finished->get_future();

    // Detached so an unreachable server cannot hold up process exit; the
    // thread keeps the orchestrator alive until it returns.
    std::thread([self, finished] {
        self->acquire_blocking();

        CycleContext context;
        auto result = self->runner_.run_upload_pass(context);
        if (result.is_ok()) {
            spdlog::info("Shutdown upload pass complete: {} uploaded", result.value().uploads);
        } else {
            spdlog::warn("Shutdown upload pass failed: {}", result.error().message);
        }

        self->release();
        finished->set_value();
    }).detach();

    if (done.wait_for(timeout) == std::future_status::ready) {
        return true;
    }
    spdlog::warn("Shutdown upload pass abandoned after {} ms", timeout.count());
    return false;
}

std::chrono::minutes Orchestrator::interval() const {
    std::lock_guard lock(mutex_);
    return backoff_.interval();
}

std::size_t Orchestrator::consecutive_failures() const {
    std::lock_guard lock(mutex_);
    return backoff_.consecutive_failures();
}

bool Orchestrator::try_acquire() noexcept {
    bool expected = false;
    return running_.compare_exchange_strong(expected, true);
}

void Orchestrator::acquire_blocking() {
    std::unique_lock lock(mutex_);
    idle_.wait(lock, [this] { return try_acquire(); });
}

void Orchestrator::release() {
    {
        std::lock_guard lock(mutex_);
        running_.store(false);
    }
    idle_.notify_all();
}

void Orchestrator::execute_cycle() {
    CycleContext context;
    {
        std::lock_guard lock(mutex_);
        context.report.cycle_id = next_cycle_id_++;
    }

    bus_.emit(events::CycleStartedEvent{context.report.cycle_id});

    auto result = runner_.run(context);
    if (result.is_ok()) {
        on_success(result.value());
    } else {
        on_failure(context.report, result.error());
    }
}

void Orchestrator::on_success(const CycleReport& report) {
    std::chrono::minutes previous;
    std::chrono::minutes current;
    bool restored = false;
    {
        std::lock_guard lock(mutex_);
        previous = backoff_.interval();
        restored = backoff_.record_success();
        current = backoff_.interval();
    }

    bus_.emit(events::CycleCompletedEvent{report});

    if (restored) {
        announce_interval_change(previous, current);
        schedule_rearm();
        bus_.emit(events::StatusEvent{
            events::StatusLevel::Ok,
            fmt::format("connection restored, sync interval back to {} minutes", current.count())});
        return;
    }
    bus_.emit(events::StatusEvent{events::StatusLevel::Ok, summarize(report)});
}

void Orchestrator::on_failure(const CycleReport& report, const Error& error) {
    std::chrono::minutes previous;
    std::chrono::minutes current;
    std::size_t failures = 0;
    std::size_t threshold = 0;
    bool slowed = false;
    {
        std::lock_guard lock(mutex_);
        previous = backoff_.interval();
        slowed = backoff_.record_failure();
        current = backoff_.interval();
        failures = backoff_.consecutive_failures();
        threshold = backoff_.settings().threshold;
    }

    bus_.emit(events::CycleFailedEvent{report.cycle_id, error.kind, error.message, failures});

    if (slowed) {
        announce_interval_change(previous, current);
        schedule_rearm();
    }

    if (failures >= threshold) {
        bus_.emit(events::StatusEvent{
            events::StatusLevel::Error,
            fmt::format("sync failed: {}; sync slowed to {} minutes", error.message, current.count())});
    } else {
        bus_.emit(events::StatusEvent{
            events::StatusLevel::Warning,
            fmt::format("sync failed ({}/{}): {}", failures, threshold, error.message)});
    }
}

void Orchestrator::announce_interval_change(std::chrono::minutes previous, std::chrono::minutes current) {
    bus_.emit(events::IntervalChangedEvent{previous, current});
}

void Orchestrator::schedule_rearm() {
    boost::asio::post(io_, [this] { arm_timer(); });
}

void Orchestrator::arm_timer() {
    if (stopped_.load()) {
        return;
    }

    std::chrono::milliseconds period;
    {
        std::lock_guard lock(mutex_);
        period = settings_.minute * backoff_.interval().count();
    }

    timer_.expires_after(period);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || stopped_.load()) {
            return;
        }
        trigger();
        arm_timer();
    });
}

} // namespace tsync::sync
