#pragma once

#include "tsync/core/result.hpp"
#include "tsync/events/event_bus.hpp"
#include "tsync/store/remote_store.hpp"
#include "tsync/sync/confirmation.hpp"
#include "tsync/sync/orchestrator.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace tsync::sync {

struct SessionRequest {
    std::string server_address;
    std::string principal;
    std::string credential;
    int interval_minutes = 5;
};

enum class SessionAck {
    CycleStarted,
    Failed
};

/// Builds the remote adapter for a session; connection-level problems show up when the root is first listed
using RemoteFactory = std::function<Result<std::shared_ptr<store::RemoteStore>>(const SessionRequest&)>;

/// Exit status of a process whose shutdown upload pass did not finish in time
inline constexpr int kAbandonedExitCode = 3;

struct ServiceSettings {
    std::filesystem::path local_root;
    std::filesystem::path ledger_path;
    OrchestratorSettings orchestrator;  ///< backoff.base_interval is taken from each request
};

/**
 * @brief Session lifecycle around one Orchestrator
 *
 * A session exists between a successful start_session() and the following
 * stop_session()/shutdown(). Starting a session while one is active replaces it.
 */
class SyncService {
public:
    SyncService(ServiceSettings settings,
                RemoteFactory remote_factory,
                ConfirmationGate& gate,
                events::EventBus& bus);
    ~SyncService();

    SyncService(const SyncService&) = delete;
    SyncService& operator=(const SyncService&) = delete;

    /// List the remote root, prepare the local root and start the periodic loop
    SessionAck start_session(const SessionRequest& request);

    /// Idempotent
    void stop_session();

    /// False when there is no session or the cycle could not be triggered
    bool retry();

    /**
     * @brief Stop the loop, run the bounded upload pass and drop the session
     * @return true when the pass finished within timeout (or there was no session)
     */
    bool shutdown(std::chrono::milliseconds timeout);

    /**
     * @brief shutdown() for a process that is about to exit
     *
     * Returns once the upload pass finished. An abandoned pass keeps running
     * against the gate and the bus, which belong to the caller, so in that
     * case the process ends here with kAbandonedExitCode without unwinding.
     */
    void shutdown_or_exit(std::chrono::milliseconds timeout);

    [[nodiscard]] bool has_session() const;

    /// Current orchestrator, null without a session
    [[nodiscard]] std::shared_ptr<Orchestrator> orchestrator() const;

private:
    void fail(const std::string& message);
    std::shared_ptr<Orchestrator> take_session();

    ServiceSettings settings_;
    RemoteFactory remote_factory_;
    ConfirmationGate& gate_;
    events::EventBus& bus_;

    mutable std::mutex mutex_;
    std::shared_ptr<Orchestrator> session_;
};

} // namespace tsync::sync
