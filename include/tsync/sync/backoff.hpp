#pragma once

#include <chrono>
#include <cstddef>

namespace tsync::sync {

struct BackoffSettings {
    std::chrono::minutes base_interval{5};
    std::size_t threshold = 3;                ///< Consecutive failures before slowing down
    unsigned factor = 2;
    std::chrono::minutes max_interval{60};
};

/**
 * @brief Failure counter and interval schedule of the periodic loop
 *
 * With the defaults: 3 failures -> 10 min, 4 -> 20, 5 -> 40, then capped at
 * 60; any success returns to the base interval.
 */
class BackoffPolicy {
public:
    explicit BackoffPolicy(BackoffSettings settings = {});

    /// Returns true when the interval changed
    bool record_success();

    /// Returns true when the interval changed
    bool record_failure();

    /// Back to the base interval with a zero counter; returns true when the interval changed
    bool reset();

    [[nodiscard]] std::size_t consecutive_failures() const noexcept { return failures_; }
    [[nodiscard]] std::chrono::minutes interval() const noexcept { return current_; }
    [[nodiscard]] std::chrono::minutes base_interval() const noexcept { return settings_.base_interval; }
    [[nodiscard]] bool degraded() const noexcept { return current_ != settings_.base_interval; }
    [[nodiscard]] const BackoffSettings& settings() const noexcept { return settings_; }

private:
    BackoffSettings settings_;
    std::size_t failures_ = 0;
    std::chrono::minutes current_;
};

} // namespace tsync::sync
