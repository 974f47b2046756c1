#include "tsync/sync/backoff.hpp"

#include <algorithm>

namespace tsync::sync {

BackoffPolicy::BackoffPolicy(BackoffSettings settings)
    : settings_(settings), current_(settings.base_interval) {
    if (settings_.base_interval.count() < 1) {
        settings_.base_interval = std::chrono::minutes{1};
    }
    if (settings_.max_interval < settings_.base_interval) {
        settings_.max_interval = settings_.base_interval;
    }
    settings_.factor = std::max(settings_.factor, 1u);
    settings_.threshold = std::max<std::size_t>(settings_.threshold, 1);
    current_ = settings_.base_interval;
}

bool BackoffPolicy::record_success() {
    return reset();
}

bool BackoffPolicy::record_failure() {
    ++failures_;
    if (failures_ < settings_.threshold) {
        return false;
    }

    const auto previous = current_;
    const std::chrono::minutes next{current_.count() * settings_.factor};
    current_ = std::min(next, settings_.max_interval);
    return current_ != previous;
}

bool BackoffPolicy::reset() {
    failures_ = 0;
    const bool changed = current_ != settings_.base_interval;
    current_ = settings_.base_interval;
    return changed;
}

} // namespace tsync::sync
