#include "tsync/sync/service.hpp"

#include "tsync/events/events.hpp"
#include "tsync/store/filesystem_store.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <system_error>

namespace tsync::sync {
namespace fs = std::filesystem;

SyncService::SyncService(ServiceSettings settings,
                         RemoteFactory remote_factory,
                         ConfirmationGate& gate,
                         events::EventBus& bus)
    : settings_(std::move(settings)),
      remote_factory_(std::move(remote_factory)),
      gate_(gate),
      bus_(bus) {}

SyncService::~SyncService() {
    stop_session();
}

SessionAck SyncService::start_session(const SessionRequest& request) {
    if (request.interval_minutes < 1) {
        fail("invalid sync interval: " + std::to_string(request.interval_minutes));
        return SessionAck::Failed;
    }

    auto remote = remote_factory_(request);
    if (remote.is_error()) {
        fail("login failed: " + remote.error().message);
        return SessionAck::Failed;
    }

    auto listing = remote.value()->list("");
    if (listing.is_error()) {
        fail("login failed: " + listing.error().message);
        return SessionAck::Failed;
    }
    spdlog::debug("Root of {} lists {} entries", remote.value()->describe(), listing.value().size());

    std::error_code ec;
    fs::create_directories(settings_.local_root, ec);
    if (ec) {
        fail("cannot create local folder " + settings_.local_root.string() + ": " + ec.message());
        return SessionAck::Failed;
    }

    // Only one loop may ever touch the ledger
    stop_session();

    auto orchestrator_settings = settings_.orchestrator;
    orchestrator_settings.backoff.base_interval = std::chrono::minutes{request.interval_minutes};

    auto orchestrator = std::make_shared<Orchestrator>(
        std::make_shared<store::FilesystemLocalStore>(settings_.local_root),
        remote.value(),
        BaselineStore(settings_.ledger_path),
        gate_,
        bus_,
        orchestrator_settings);

    {
        std::lock_guard lock(mutex_);
        session_ = orchestrator;
    }

    bus_.emit(events::StatusEvent{events::StatusLevel::Ok, "login successful, sync starting"});
    bus_.emit(events::SessionStartedEvent{remote.value()->describe(),
                                          settings_.local_root.string(),
                                          orchestrator_settings.backoff.base_interval});
    orchestrator->start();
    return SessionAck::CycleStarted;
}

void SyncService::stop_session() {
    auto session = take_session();
    if (!session) {
        return;
    }
    session->stop();
    bus_.emit(events::SessionStoppedEvent{"stopped"});
}

bool SyncService::retry() {
    auto session = orchestrator();
    if (!session) {
        spdlog::debug("Retry ignored, no active session");
        return false;
    }
    return session->retry();
}

bool SyncService::shutdown(std::chrono::milliseconds timeout) {
    auto session = take_session();
    if (!session) {
        return true;
    }

    session->stop();
    const bool finished = session->shutdown_pass(timeout);
    bus_.emit(events::SessionStoppedEvent{finished ? "shutdown" : "shutdown (upload pass abandoned)"});
    return finished;
}

void SyncService::shutdown_or_exit(std::chrono::milliseconds timeout) {
    if (shutdown(timeout)) {
        return;
    }
    spdlog::error("[SyncService] Upload pass still running after {} ms, exiting without cleanup", timeout.count());
    spdlog::default_logger()->flush();
    std::_Exit(kAbandonedExitCode);
}

bool SyncService::has_session() const {
    std::lock_guard lock(mutex_);
    return session_ != nullptr;
}

std::shared_ptr<Orchestrator> SyncService::orchestrator() const {
    std::lock_guard lock(mutex_);
    return session_;
}

void SyncService::fail(const std::string& message) {
    bus_.emit(events::StatusEvent{events::StatusLevel::Error, message});
}

std::shared_ptr<Orchestrator> SyncService::take_session() {
    std::lock_guard lock(mutex_);
    return std::move(session_);
}

} // namespace tsync::sync
