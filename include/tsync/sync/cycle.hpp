#pragma once

#include "tsync/core/result.hpp"
#include "tsync/events/event_bus.hpp"
#include "tsync/store/local_store.hpp"
#include "tsync/store/remote_store.hpp"
#include "tsync/sync/baseline.hpp"
#include "tsync/sync/conflict.hpp"
#include "tsync/sync/confirmation.hpp"
#include "tsync/sync/deletion.hpp"
#include "tsync/sync/phases.hpp"
#include "tsync/sync/types.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace tsync::sync {

/**
 * @brief Executes one reconciliation cycle
 *
 * Phases run in a fixed order: remote-origin deletions, upload walk (which
 * also harvests local-origin deletions), download walk. A failure to list a
 * walk's root, a failed remote snapshot or any transient error aborts the
 * cycle; every other per-item error is logged, counted and skipped.
 *
 * Not thread-safe; the orchestrator guarantees a single caller.
 */
class CycleRunner {
public:
    CycleRunner(store::LocalStore& local,
                store::RemoteStore& remote,
                BaselineStore& baseline,
                ConfirmationGate& gate,
                events::EventBus& bus,
                ConflictResolver resolver = ConflictResolver{});

    /// Full cycle. The report is also left in context.report.
    Result<CycleReport> run(CycleContext& context);

    /// Upload walk only, without deletion handling (shutdown pass)
    Result<CycleReport> run_upload_pass(CycleContext& context);

    [[nodiscard]] const CyclePhases& phases() const noexcept { return phases_; }
    [[nodiscard]] const ConflictResolver& resolver() const noexcept { return resolver_; }

private:
    struct UploadWalk {
        std::unordered_set<std::string> observed;
        std::vector<std::string> failed_subtrees;
    };

    Result<CycleReport> run_phases(CycleContext& context, bool upload_only);
    Result<void> execute(CycleContext& context);
    Result<void> execute_upload_only(CycleContext& context);
    Result<void> advance(CyclePhase next);

    Result<void> upload_walk(CycleContext& context,
                             Ledger& ledger,
                             store::RemoteSnapshot& snapshot,
                             UploadWalk& walk);
    Result<void> upload_file(CycleContext& context,
                             const store::TreeEntry& local,
                             store::RemoteSnapshot& snapshot);
    Result<void> preserve_remote(CycleContext& context, const std::string& path);

    Result<void> download_walk(CycleContext& context, Ledger& ledger);
    Result<void> download_file(CycleContext& context, const store::TreeEntry& remote);
    Result<void> preserve_remote_locally(CycleContext& context, const store::TreeEntry& remote);

    /// Per-item error boundary: transient errors escalate, the rest are counted
    Result<void> absorb(CycleContext& context, const Result<void>& item, const std::string& path);

    void persist(const Ledger& ledger);

    store::LocalStore& local_;
    store::RemoteStore& remote_;
    BaselineStore& baseline_;
    events::EventBus& bus_;
    ConflictResolver resolver_;
    DeletionReconciler deletions_;
    CyclePhases phases_;
};

} // namespace tsync::sync
