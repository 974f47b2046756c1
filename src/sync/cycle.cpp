#include "tsync/sync/cycle.hpp"

#include "tsync/events/events.hpp"
#include "tsync/store/path_key.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <optional>
#include <stack>

namespace tsync::sync {

using store::PathKey;
using store::TreeEntry;

CycleRunner::CycleRunner(store::LocalStore& local,
                         store::RemoteStore& remote,
                         BaselineStore& baseline,
                         ConfirmationGate& gate,
                         events::EventBus& bus,
                         ConflictResolver resolver)
    : local_(local),
      remote_(remote),
      baseline_(baseline),
      bus_(bus),
      resolver_(resolver),
      deletions_(local, remote, baseline, gate, bus) {}

Result<CycleReport> CycleRunner::run(CycleContext& context) {
    return run_phases(context, false);
}

Result<CycleReport> CycleRunner::run_upload_pass(CycleContext& context) {
    return run_phases(context, true);
}

Result<CycleReport> CycleRunner::run_phases(CycleContext& context, bool upload_only) {
    const auto started = std::chrono::steady_clock::now();
    phases_ = CyclePhases{};

    Result<void> outcome = Ok();
    try {
        outcome = upload_only ? execute_upload_only(context) : execute(context);
    } catch (const std::exception& e) {
        outcome = Err<void>(ErrorKind::Io, std::string("unexpected exception: ") + e.what());
    }

    context.report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (outcome.is_error()) {
        if (!phases_.finished()) {
            auto marked = phases_.mark_failed(outcome.error().message);
            if (marked.is_error()) {
                spdlog::debug("{}", marked.error().message);
            }
        }
        return Err<CycleReport>(outcome.error());
    }
    return Ok(context.report);
}

Result<void> CycleRunner::advance(CyclePhase next) {
    auto moved = phases_.transition_to(next);
    if (moved.is_ok()) {
        spdlog::debug("Cycle phase: {}", to_string(next));
    }
    return moved;
}

Result<void> CycleRunner::execute(CycleContext& context) {
    auto ledger = baseline_.load();

    auto step = advance(CyclePhase::ReconcilingDeletions);
    if (step.is_error()) {
        return step;
    }

    auto snapshot = remote_.snapshot();
    if (snapshot.is_error()) {
        return Err<void>(snapshot.error());
    }

    auto remote_deletions = deletions_.reconcile_remote_origin(context, ledger, snapshot.value());
    if (remote_deletions.is_error()) {
        return remote_deletions;
    }

    step = advance(CyclePhase::Uploading);
    if (step.is_error()) {
        return step;
    }

    UploadWalk walk;
    auto uploaded = upload_walk(context, ledger, snapshot.value(), walk);
    if (uploaded.is_error()) {
        return uploaded;
    }

    auto local_deletions = deletions_.reconcile_local_origin(
        context, ledger, walk.observed, walk.failed_subtrees, snapshot.value());
    if (local_deletions.is_error()) {
        return local_deletions;
    }
    persist(ledger);

    step = advance(CyclePhase::Downloading);
    if (step.is_error()) {
        return step;
    }

    auto downloaded = download_walk(context, ledger);
    if (downloaded.is_error()) {
        return downloaded;
    }

    return advance(CyclePhase::Complete);
}

Result<void> CycleRunner::execute_upload_only(CycleContext& context) {
    auto ledger = baseline_.load();

    auto step = advance(CyclePhase::Uploading);
    if (step.is_error()) {
        return step;
    }

    auto snapshot = remote_.snapshot();
    if (snapshot.is_error()) {
        return Err<void>(snapshot.error());
    }

    UploadWalk walk;
    auto uploaded = upload_walk(context, ledger, snapshot.value(), walk);
    if (uploaded.is_error()) {
        return uploaded;
    }
    persist(ledger);

    return advance(CyclePhase::Complete);
}

// ════════════════════════════════════════════════════════
// Upload walk
// ════════════════════════════════════════════════════════

Result<void> CycleRunner::upload_walk(CycleContext& context,
                                      Ledger& ledger,
                                      store::RemoteSnapshot& snapshot,
                                      UploadWalk& walk) {
    std::stack<std::string> pending;
    pending.push("");

    while (!pending.empty()) {
        std::string directory = std::move(pending.top());
        pending.pop();

        auto listing = local_.list(directory);
        if (listing.is_error()) {
            if (directory.empty() || listing.error().is_transient()) {
                return Err<void>(listing.error());
            }
            spdlog::warn("Cannot list local directory '{}': {}", directory, listing.error().message);
            walk.failed_subtrees.push_back(directory);
            context.report.item_failures++;
            continue;
        }

        for (const auto& entry : listing.value()) {
            if (PathKey::is_conflict(entry.path)) {
                continue;
            }

            if (entry.is_directory()) {
                if (!snapshot.has_directory(entry.path)) {
                    auto created = remote_.ensure_directory(entry.path);
                    if (created.is_error()) {
                        walk.failed_subtrees.push_back(entry.path);
                        auto absorbed = absorb(context, created, entry.path);
                        if (absorbed.is_error()) {
                            return absorbed;
                        }
                        continue;
                    }
                    snapshot.directories.insert(entry.path);
                }
                ledger.add_directory(entry.path);
                pending.push(entry.path);
                continue;
            }

            walk.observed.insert(entry.path);
            const auto decision = resolver_.decide(entry, snapshot.file(entry.path), Direction::Upload);

            Result<void> item = Ok();
            switch (decision.action) {
                case Action::Upload:
                    item = upload_file(context, entry, snapshot);
                    break;
                case Action::UploadPreservingRemote:
                    spdlog::debug("Remote '{}' is {} ms newer, preserving it", entry.path, decision.delta_ms);
                    item = preserve_remote(context, entry.path);
                    if (item.is_ok()) {
                        item = upload_file(context, entry, snapshot);
                    }
                    break;
                default:
                    break;
            }

            if (item.is_error()) {
                auto absorbed = absorb(context, item, entry.path);
                if (absorbed.is_error()) {
                    return absorbed;
                }
                continue;
            }
            if (snapshot.has_file(entry.path)) {
                ledger.add(entry.path);
            }
        }
    }
    return Ok();
}

Result<void> CycleRunner::upload_file(CycleContext& context,
                                      const TreeEntry& local,
                                      store::RemoteSnapshot& snapshot) {
    auto data = local_.read(local.path);
    if (data.is_error()) {
        return Err<void>(data.error());
    }

    auto written = remote_.write(local.path, data.value());
    if (written.is_error()) {
        return written;
    }

    TreeEntry uploaded = local;
    auto remote = remote_.stat(local.path);
    if (remote.is_ok()) {
        uploaded = remote.value();
        auto aligned = local_.set_modified_time(local.path, uploaded.modified_time);
        if (aligned.is_error()) {
            spdlog::warn("Could not align modify time of '{}': {}", local.path, aligned.error().message);
        }
    } else {
        spdlog::warn("Could not read back modify time of '{}': {}", local.path, remote.error().message);
    }
    snapshot.files[local.path] = uploaded;

    const auto bytes = data.value().size();
    context.report.uploads++;
    context.report.bytes_uploaded += bytes;
    bus_.emit(events::FileUploadedEvent{local.path, bytes});
    return Ok();
}

Result<void> CycleRunner::preserve_remote(CycleContext& context, const std::string& path) {
    const auto artifact = unique_artifact_name(
        path, ArtifactOrigin::Remote, store::now_ms(),
        [this](const std::string& candidate) { return remote_.stat(candidate).is_ok(); });

    auto copied = remote_.copy(path, artifact);
    if (copied.is_error()) {
        return copied;
    }

    context.preserved_paths.insert(path);
    context.report.conflict_artifacts++;
    bus_.emit(events::ConflictArtifactCreatedEvent{path, artifact, events::Replica::Remote});
    return Ok();
}

// ════════════════════════════════════════════════════════
// Download walk
// ════════════════════════════════════════════════════════

Result<void> CycleRunner::download_walk(CycleContext& context, Ledger& ledger) {
    bool ledger_changed = false;
    std::stack<std::string> pending;
    pending.push("");

    while (!pending.empty()) {
        std::string directory = std::move(pending.top());
        pending.pop();

        auto listing = remote_.list(directory);
        if (listing.is_error()) {
            if (directory.empty() || listing.error().is_transient()) {
                return Err<void>(listing.error());
            }
            spdlog::warn("Cannot list remote directory '{}': {}", directory, listing.error().message);
            context.report.item_failures++;
            continue;
        }

        for (const auto& entry : listing.value()) {
            if (PathKey::is_conflict(entry.path)) {
                continue;
            }

            if (entry.is_directory()) {
                if (!local_.exists(entry.path)) {
                    auto made = local_.make_directories(entry.path);
                    if (made.is_error()) {
                        auto absorbed = absorb(context, made, entry.path);
                        if (absorbed.is_error()) {
                            return absorbed;
                        }
                        continue;
                    }
                }
                if (!ledger.contains_directory(entry.path)) {
                    ledger_changed |= ledger.add_directory(entry.path);
                }
                pending.push(entry.path);
                continue;
            }

            std::optional<TreeEntry> local;
            auto stat = local_.stat(entry.path);
            if (stat.is_ok()) {
                if (stat.value().is_directory()) {
                    spdlog::warn("'{}' is a file remotely but a directory locally, skipping", entry.path);
                    context.report.item_failures++;
                    continue;
                }
                local = stat.value();
            } else if (!stat.error().is_not_found()) {
                auto absorbed = absorb(context, Err<void>(stat.error()), entry.path);
                if (absorbed.is_error()) {
                    return absorbed;
                }
                continue;
            }

            const auto decision = resolver_.decide(local, entry, Direction::Download);

            Result<void> item = Ok();
            switch (decision.action) {
                case Action::Download:
                    item = download_file(context, entry);
                    break;
                case Action::PreserveRemoteLocally:
                    if (context.preserved_paths.count(entry.path) == 0) {
                        item = preserve_remote_locally(context, entry);
                    }
                    break;
                default:
                    break;
            }

            if (item.is_error()) {
                auto absorbed = absorb(context, item, entry.path);
                if (absorbed.is_error()) {
                    return absorbed;
                }
                continue;
            }
            if (!ledger.contains(entry.path)) {
                ledger_changed |= ledger.add(entry.path);
            }
        }
    }

    if (ledger_changed) {
        persist(ledger);
    }
    return Ok();
}

Result<void> CycleRunner::download_file(CycleContext& context, const TreeEntry& remote) {
    auto data = remote_.read(remote.path);
    if (data.is_error()) {
        return Err<void>(data.error());
    }

    auto written = local_.write(remote.path, data.value());
    if (written.is_error()) {
        return written;
    }

    auto aligned = local_.set_modified_time(remote.path, remote.modified_time);
    if (aligned.is_error()) {
        spdlog::warn("Could not align modify time of '{}': {}", remote.path, aligned.error().message);
    }

    const auto bytes = data.value().size();
    context.report.downloads++;
    context.report.bytes_downloaded += bytes;
    bus_.emit(events::FileDownloadedEvent{remote.path, bytes});
    return Ok();
}

Result<void> CycleRunner::preserve_remote_locally(CycleContext& context, const TreeEntry& remote) {
    const auto artifact = unique_artifact_name(
        remote.path, ArtifactOrigin::Remote, store::now_ms(),
        [this](const std::string& candidate) { return local_.exists(candidate); });

    auto data = remote_.read(remote.path);
    if (data.is_error()) {
        return Err<void>(data.error());
    }

    auto written = local_.write(artifact, data.value());
    if (written.is_error()) {
        return written;
    }

    auto aligned = local_.set_modified_time(artifact, remote.modified_time);
    if (aligned.is_error()) {
        spdlog::debug("Could not set modify time of '{}': {}", artifact, aligned.error().message);
    }

    context.preserved_paths.insert(remote.path);
    context.report.conflict_artifacts++;
    bus_.emit(events::ConflictArtifactCreatedEvent{remote.path, artifact, events::Replica::Local});
    return Ok();
}

Result<void> CycleRunner::absorb(CycleContext& context, const Result<void>& item, const std::string& path) {
    if (item.is_ok()) {
        return Ok();
    }

    const auto& error = item.error();
    if (error.is_transient()) {
        return item;
    }
    if (error.is_not_found()) {
        spdlog::debug("'{}' disappeared during the walk", path);
        return Ok();
    }

    spdlog::warn("Skipping '{}': {} ({})", path, error.message, to_string(error.kind));
    context.report.item_failures++;
    return Ok();
}

void CycleRunner::persist(const Ledger& ledger) {
    auto saved = baseline_.save(ledger);
    if (saved.is_error()) {
        spdlog::warn("Failed to persist ledger: {}", saved.error().message);
    }
}

} // namespace tsync::sync
