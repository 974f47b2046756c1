#include "tsync/sync/deletion.hpp"

#include "tsync/events/events.hpp"
#include "tsync/store/path_key.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stack>

namespace tsync::sync {

using json = nlohmann::json;
using store::PathKey;

bool LocalTree::is_partial(const std::string& path) const {
    return std::any_of(failed_subtrees.begin(), failed_subtrees.end(),
                       [&path](const std::string& failed) {
                           return PathKey::is_within(path, failed) || PathKey::is_within(failed, path);
                       });
}

DeletionReconciler::DeletionReconciler(store::LocalStore& local,
                                       store::RemoteStore& remote,
                                       BaselineStore& baseline,
                                       ConfirmationGate& gate,
                                       events::EventBus& bus)
    : local_(local), remote_(remote), baseline_(baseline), gate_(gate), bus_(bus) {}

Result<LocalTree> DeletionReconciler::scan_local() {
    LocalTree tree;
    std::stack<std::string> pending;
    pending.push("");

    while (!pending.empty()) {
        std::string directory = std::move(pending.top());
        pending.pop();

        auto listing = local_.list(directory);
        if (listing.is_error()) {
            if (directory.empty()) {
                return Err<LocalTree>(listing.error());
            }
            spdlog::warn("Cannot list local directory '{}': {}", directory, listing.error().message);
            tree.failed_subtrees.push_back(directory);
            continue;
        }

        for (auto& entry : listing.value()) {
            if (entry.is_directory()) {
                tree.directories.insert(entry.path);
                pending.push(entry.path);
            } else {
                tree.files.insert(entry.path);
            }
        }
    }
    return Ok(std::move(tree));
}

RemoteDeletionPlan DeletionReconciler::plan_remote_origin(const Ledger& ledger,
                                                          const store::RemoteSnapshot& snapshot,
                                                          const LocalTree& tree) {
    RemoteDeletionPlan plan;

    for (const auto& path : ledger.paths()) {
        if (snapshot.has_file(path)) {
            continue;
        }
        auto local = local_.stat(path);
        if (local.is_ok()) {
            if (local.value().is_file()) {
                plan.files.push_back(path);
            }
        } else if (local.error().is_not_found()) {
            plan.vanished.push_back(path);
        } else {
            spdlog::warn("Cannot stat '{}' while planning deletions: {}", path, local.error().message);
        }
    }

    // A directory missing on the server qualifies when every file below it
    // came from an earlier cycle and it held either such a file or was itself
    // seen on both sides. An empty directory the server never had is new, and
    // one holding a file the ledger does not know is left alone.
    for (const auto& directory : tree.directories) {
        if (PathKey::is_conflict(directory) || snapshot.has_directory(directory)
            || tree.is_partial(directory)) {
            continue;
        }

        const std::string prefix = directory + "/";
        bool has_baseline_file = false;
        bool only_baseline = true;
        for (auto it = tree.files.lower_bound(prefix);
             it != tree.files.end() && it->compare(0, prefix.size(), prefix) == 0; ++it) {
            if (!ledger.contains(*it)) {
                only_baseline = false;
                break;
            }
            has_baseline_file = true;
        }

        if (only_baseline && (has_baseline_file || ledger.contains_directory(directory))) {
            plan.directories.push_back(directory);
        }
    }

    for (const auto& directory : ledger.directories()) {
        if (!snapshot.has_directory(directory) && tree.directories.count(directory) == 0
            && !tree.is_partial(directory)) {
            plan.vanished_directories.push_back(directory);
        }
    }

    return plan;
}

Result<void> DeletionReconciler::reconcile_remote_origin(CycleContext& context,
                                                         Ledger& ledger,
                                                         const store::RemoteSnapshot& snapshot) {
    auto tree = scan_local();
    if (tree.is_error()) {
        return Err<void>(tree.error());
    }

    auto plan = plan_remote_origin(ledger, snapshot, tree.value());

    bool ledger_changed = false;
    for (const auto& path : plan.vanished) {
        ledger_changed |= ledger.remove(path);
    }
    for (const auto& directory : plan.vanished_directories) {
        ledger_changed |= ledger.remove_directory(directory);
    }

    if (plan.empty()) {
        if (ledger_changed) {
            persist(ledger);
        }
        return Ok();
    }

    auto print = fingerprint(plan);
    if (context.declined_fingerprint && *context.declined_fingerprint == print) {
        spdlog::debug("Skipping {} remote deletion(s) declined earlier in this cycle", plan.total());
        if (ledger_changed) {
            persist(ledger);
        }
        return Ok();
    }

    auto request = describe("Deleted on the server. Delete the local copies as well?",
                            plan.directories, plan.files);
    if (!gate_.confirm(request)) {
        context.declined_fingerprint = std::move(print);
        context.report.declined_prompts++;
        bus_.emit(events::DeletionsDeclinedEvent{events::Replica::Local, plan.total()});
        if (ledger_changed) {
            persist(ledger);
        }
        return Ok();
    }

    auto applied = apply_remote_origin(context, ledger, plan);
    persist(ledger);

    if (!applied.empty()) {
        context.report.local_deletions += applied.size();
        bus_.emit(events::DeletionsAppliedEvent{events::Replica::Local, std::move(applied)});
    }
    return Ok();
}

std::vector<std::string> DeletionReconciler::apply_remote_origin(CycleContext& context,
                                                                 Ledger& ledger,
                                                                 const RemoteDeletionPlan& plan) {
    std::vector<std::string> applied;

    for (const auto& path : plan.files) {
        auto removed = local_.remove_file(path);
        if (removed.is_ok() || removed.error().is_not_found()) {
            ledger.remove(path);
            applied.push_back(path);
        } else {
            spdlog::warn("Failed to delete local file '{}': {}", path, removed.error().message);
            context.report.item_failures++;
        }
    }

    auto directories = plan.directories;
    std::stable_sort(directories.begin(), directories.end(),
                     [](const std::string& a, const std::string& b) {
                         return PathKey::depth(a) > PathKey::depth(b);
                     });

    std::unordered_set<std::string> removed;
    for (const auto& directory : directories) {
        if (removed.count(directory) != 0) {
            continue;
        }
        auto result = local_.remove_empty_directory(directory);
        if (result.is_error()) {
            if (!result.error().is_not_found()) {
                spdlog::warn("Failed to delete local directory '{}': {}", directory, result.error().message);
                context.report.item_failures++;
            }
            continue;
        }
        ledger.remove_directory(directory);
        removed.insert(directory);
        applied.push_back(directory);
        prune_empty_ancestors(directory, ledger, removed, applied);
    }

    return applied;
}

void DeletionReconciler::prune_empty_ancestors(const std::string& directory,
                                               Ledger& ledger,
                                               std::unordered_set<std::string>& removed,
                                               std::vector<std::string>& applied) {
    for (auto parent = PathKey::parent(directory); !parent.empty(); parent = PathKey::parent(parent)) {
        if (removed.count(parent) != 0) {
            break;
        }
        if (local_.remove_empty_directory(parent).is_error()) {
            break;
        }
        ledger.remove_directory(parent);
        removed.insert(parent);
        applied.push_back(parent);
    }
}

LocalDeletionPlan DeletionReconciler::plan_local_origin(
    const Ledger& ledger,
    const std::unordered_set<std::string>& observed,
    const std::vector<std::string>& failed_subtrees,
    const store::RemoteSnapshot& snapshot) {
    LocalDeletionPlan plan;

    for (const auto& path : ledger.paths()) {
        if (observed.count(path) != 0) {
            continue;
        }
        const bool unknown = std::any_of(failed_subtrees.begin(), failed_subtrees.end(),
                                         [&path](const std::string& failed) {
                                             return PathKey::is_within(path, failed);
                                         });
        if (unknown) {
            continue;
        }

        if (snapshot.has_file(path)) {
            plan.files.push_back(path);
        } else {
            plan.vanished.push_back(path);
        }
    }
    return plan;
}

Result<void> DeletionReconciler::reconcile_local_origin(
    CycleContext& context,
    Ledger& ledger,
    const std::unordered_set<std::string>& observed,
    const std::vector<std::string>& failed_subtrees,
    const store::RemoteSnapshot& snapshot) {
    auto plan = plan_local_origin(ledger, observed, failed_subtrees, snapshot);

    for (const auto& path : plan.vanished) {
        ledger.remove(path);
    }
    if (plan.files.empty()) {
        return Ok();
    }

    auto request = describe("Deleted locally. Delete them on the server as well?", {}, plan.files);
    if (!gate_.confirm(request)) {
        context.report.declined_prompts++;
        bus_.emit(events::DeletionsDeclinedEvent{events::Replica::Remote, plan.files.size()});
        return Ok();
    }

    std::vector<std::string> applied;
    for (const auto& path : plan.files) {
        auto removed = remote_.remove(path);
        if (removed.is_ok() || removed.error().is_not_found()) {
            ledger.remove(path);
            applied.push_back(path);
            continue;
        }
        if (removed.error().is_transient()) {
            context.report.remote_deletions += applied.size();
            return removed;
        }
        spdlog::warn("Failed to delete remote file '{}': {}", path, removed.error().message);
        context.report.item_failures++;
    }

    if (!applied.empty()) {
        context.report.remote_deletions += applied.size();
        bus_.emit(events::DeletionsAppliedEvent{events::Replica::Remote, std::move(applied)});
    }
    return Ok();
}

std::string DeletionReconciler::fingerprint(const RemoteDeletionPlan& plan) {
    const auto encoded = [](const std::vector<std::string>& paths) {
        std::vector<std::string> keys;
        keys.reserve(paths.size());
        for (const auto& path : paths) {
            keys.push_back(encode_key(path));
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    };
    const auto directories = encoded(plan.directories);
    const auto files = encoded(plan.files);

    json document;
    document["directories"] = directories;
    document["files"] = files;
    return document.dump();
}

ConfirmationRequest DeletionReconciler::describe(std::string title,
                                                 const std::vector<std::string>& directories,
                                                 const std::vector<std::string>& files) {
    ConfirmationRequest request;
    request.title = std::move(title);
    request.total = directories.size() + files.size();

    for (const auto& directory : directories) {
        if (request.preview.size() == kMaxPreviewEntries) {
            break;
        }
        request.preview.push_back(directory + "/");
    }
    for (const auto& file : files) {
        if (request.preview.size() == kMaxPreviewEntries) {
            break;
        }
        request.preview.push_back(file);
    }
    return request;
}

void DeletionReconciler::persist(const Ledger& ledger) {
    auto saved = baseline_.save(ledger);
    if (saved.is_error()) {
        spdlog::warn("Failed to persist ledger: {}", saved.error().message);
    }
}

} // namespace tsync::sync
