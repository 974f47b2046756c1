#pragma once

#include "tsync/core/result.hpp"
#include "tsync/sync/types.hpp"

#include <chrono>
#include <string>

namespace tsync::sync {

/**
 * @brief Enforces the fixed phase order of a cycle
 *
 * Idle -> ReconcilingDeletions -> Uploading -> Downloading -> Complete, with
 * Failed reachable from every non-terminal phase.
 */
class CyclePhases {
public:
    CyclePhases();

    [[nodiscard]] CyclePhase phase() const noexcept { return phase_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] bool finished() const noexcept {
        return phase_ == CyclePhase::Complete || phase_ == CyclePhase::Failed;
    }

    Result<void> transition_to(CyclePhase next);
    Result<void> mark_failed(std::string error_message);

    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(CyclePhase target) const noexcept;

    CyclePhase phase_ = CyclePhase::Idle;
    std::string last_error_;
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace tsync::sync
