#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

namespace tsync::sync {

enum class CyclePhase {
    Idle,
    ReconcilingDeletions,
    Uploading,
    Downloading,
    Complete,
    Failed
};

const char* to_string(CyclePhase phase) noexcept;

/**
 * @brief Counters of one cycle, published with the completion event
 */
struct CycleReport {
    std::uint64_t cycle_id = 0;
    std::size_t uploads = 0;
    std::size_t downloads = 0;
    std::size_t bytes_uploaded = 0;
    std::size_t bytes_downloaded = 0;
    std::size_t conflict_artifacts = 0;
    std::size_t local_deletions = 0;   ///< Files and directories removed from the local tree
    std::size_t remote_deletions = 0;  ///< Files removed from the remote tree
    std::size_t item_failures = 0;
    std::size_t declined_prompts = 0;
    std::chrono::milliseconds duration{0};

    /// Number of operations that changed either replica
    [[nodiscard]] std::size_t mutations() const noexcept {
        return uploads + downloads + conflict_artifacts + local_deletions + remote_deletions;
    }
};

/**
 * @brief State scoped to a single cycle attempt
 *
 * Discarded at the end of every cycle whatever its outcome.
 */
struct CycleContext {
    std::optional<std::string> declined_fingerprint;  ///< Last remote-origin deletion set the user declined
    std::unordered_set<std::string> preserved_paths;  ///< Paths that already received a conflict artifact
    CycleReport report;
};

} // namespace tsync::sync
