#pragma once

#include "tsync/core/result.hpp"
#include "tsync/events/event_bus.hpp"
#include "tsync/store/local_store.hpp"
#include "tsync/store/remote_store.hpp"
#include "tsync/sync/baseline.hpp"
#include "tsync/sync/confirmation.hpp"
#include "tsync/sync/types.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace tsync::sync {

/**
 * @brief Result of a full local walk
 *
 * Unlike the sync walks this one keeps conflict artifacts, so callers can
 * tell whether a directory holds anything the ledger does not know about.
 */
struct LocalTree {
    std::set<std::string> files;
    std::set<std::string> directories;
    std::vector<std::string> failed_subtrees;  ///< Directories whose listing failed

    [[nodiscard]] bool is_partial(const std::string& path) const;
};

/**
 * @brief Deletions observed on the server, to be mirrored locally
 */
struct RemoteDeletionPlan {
    std::vector<std::string> files;        ///< Sorted
    std::vector<std::string> directories;  ///< Sorted
    std::vector<std::string> vanished;     ///< Ledger paths gone from both sides
    std::vector<std::string> vanished_directories;

    [[nodiscard]] std::size_t total() const noexcept { return files.size() + directories.size(); }
    [[nodiscard]] bool empty() const noexcept { return total() == 0; }
};

/**
 * @brief Deletions observed locally, to be mirrored on the server
 */
struct LocalDeletionPlan {
    std::vector<std::string> files;     ///< Still present remotely
    std::vector<std::string> vanished;  ///< Already absent remotely
};

/**
 * @brief Symmetric deletion detection against the ledger
 *
 * Every destructive batch goes through the ConfirmationGate. Planning
 * functions are pure; reconcile_* functions plan, ask, apply and update the
 * ledger.
 */
class DeletionReconciler {
public:
    DeletionReconciler(store::LocalStore& local,
                       store::RemoteStore& remote,
                       BaselineStore& baseline,
                       ConfirmationGate& gate,
                       events::EventBus& bus);

    /// Walk the whole local tree; only a failure at the root is an error
    Result<LocalTree> scan_local();

    [[nodiscard]] RemoteDeletionPlan plan_remote_origin(const Ledger& ledger,
                                                        const store::RemoteSnapshot& snapshot,
                                                        const LocalTree& tree);

    /**
     * @brief Mirror server-side deletions into the local tree
     *
     * A batch identical to one declined earlier in the same context is
     * skipped without asking again.
     */
    Result<void> reconcile_remote_origin(CycleContext& context,
                                         Ledger& ledger,
                                         const store::RemoteSnapshot& snapshot);

    [[nodiscard]] static LocalDeletionPlan plan_local_origin(
        const Ledger& ledger,
        const std::unordered_set<std::string>& observed,
        const std::vector<std::string>& failed_subtrees,
        const store::RemoteSnapshot& snapshot);

    /**
     * @brief Mirror local deletions onto the server
     *
     * On decline nothing is removed and the ledger keeps the entries, so the
     * following download walk restores the files locally. Transient server
     * errors abort the batch and are returned.
     */
    Result<void> reconcile_local_origin(CycleContext& context,
                                        Ledger& ledger,
                                        const std::unordered_set<std::string>& observed,
                                        const std::vector<std::string>& failed_subtrees,
                                        const store::RemoteSnapshot& snapshot);

    /// Stable identity of a deletion set: sorted directories and files as JSON
    static std::string fingerprint(const RemoteDeletionPlan& plan);

    static ConfirmationRequest describe(std::string title,
                                        const std::vector<std::string>& directories,
                                        const std::vector<std::string>& files);

private:
    std::vector<std::string> apply_remote_origin(CycleContext& context,
                                                 Ledger& ledger,
                                                 const RemoteDeletionPlan& plan);
    void prune_empty_ancestors(const std::string& directory,
                               Ledger& ledger,
                               std::unordered_set<std::string>& removed,
                               std::vector<std::string>& applied);
    void persist(const Ledger& ledger);

    store::LocalStore& local_;
    store::RemoteStore& remote_;
    BaselineStore& baseline_;
    ConfirmationGate& gate_;
    events::EventBus& bus_;
};

} // namespace tsync::sync
