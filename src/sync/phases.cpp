#include "tsync/sync/phases.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace tsync::sync {
namespace {

bool is_progressive(CyclePhase current, CyclePhase target) {
    static const std::unordered_map<CyclePhase, std::vector<CyclePhase>> transitions {
        {CyclePhase::Idle, {CyclePhase::ReconcilingDeletions, CyclePhase::Uploading}},
        {CyclePhase::ReconcilingDeletions, {CyclePhase::Uploading}},
        {CyclePhase::Uploading, {CyclePhase::Downloading, CyclePhase::Complete}},
        {CyclePhase::Downloading, {CyclePhase::Complete}},
    };

    if (target == CyclePhase::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

const char* to_string(CyclePhase phase) noexcept {
    switch (phase) {
        case CyclePhase::Idle: return "idle";
        case CyclePhase::ReconcilingDeletions: return "reconciling-deletions";
        case CyclePhase::Uploading: return "uploading";
        case CyclePhase::Downloading: return "downloading";
        case CyclePhase::Complete: return "complete";
        case CyclePhase::Failed: return "failed";
    }
    return "unknown";
}

CyclePhases::CyclePhases() : last_transition_(std::chrono::steady_clock::now()) {}

Result<void> CyclePhases::transition_to(CyclePhase next) {
    if (phase_ == next) {
        return Ok();
    }

    if (!can_transition(next)) {
        return Err<void>(ErrorKind::Invalid,
                         std::string("Illegal cycle phase transition: ") + to_string(phase_)
                             + " -> " + to_string(next));
    }

    phase_ = next;
    last_transition_ = std::chrono::steady_clock::now();
    if (next != CyclePhase::Failed) {
        last_error_.clear();
    }
    return Ok();
}

Result<void> CyclePhases::mark_failed(std::string error_message) {
    last_error_ = std::move(error_message);
    return transition_to(CyclePhase::Failed);
}

bool CyclePhases::can_transition(CyclePhase target) const noexcept {
    if (phase_ == target) {
        return true;
    }
    if (finished()) {
        return false;
    }
    return is_progressive(phase_, target);
}

} // namespace tsync::sync
