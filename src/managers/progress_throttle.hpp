#pragma once

#include <chrono>
#include <optional>
#include <core/types.hpp>

// Coalesces a stream of percentages. A value is emitted only when it has
// advanced by at least `step` since the last emission, or when `min_interval`
// has passed and it advanced at all. Emitted values never decrease, and 100
// is never emitted (completion is reported separately).
class ProgressThrottle {
public:
    ProgressThrottle(int step_percent, std::chrono::milliseconds min_interval,
                     NowFn now = steady_now());

    // Returns the value to publish, or nullopt to stay quiet.
    std::optional<int> offer(int percent);

    int last_emitted() const { return last_; }

private:
    const int step_;
    const std::chrono::milliseconds interval_;
    NowFn now_;
    int last_ = 0;
    TimePoint last_at_;   // construction counts as the first emission
};

// Map a phase-local percentage (0-100) into the overall [begin, end) range.
int scale_progress(double phase_percent, int begin, int end);
