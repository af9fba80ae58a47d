#include "progress_throttle.hpp"
#include <algorithm>
#include <cmath>

ProgressThrottle::ProgressThrottle(int step_percent, std::chrono::milliseconds min_interval,
                                   NowFn now)
    : step_(std::max(1, step_percent)), interval_(min_interval), now_(std::move(now)) {
    last_at_ = now_();
}

std::optional<int> ProgressThrottle::offer(int percent) {
    percent = std::min(std::max(percent, 0), 99);
    if (percent <= last_) return std::nullopt;

    auto now = now_();
    bool stepped = percent - last_ >= step_;
    bool waited = now - last_at_ >= interval_;
    if (!stepped && !waited) return std::nullopt;

    last_ = percent;
    last_at_ = now;
    return percent;
}

int scale_progress(double phase_percent, int begin, int end) {
    double p = std::min(std::max(phase_percent, 0.0), 100.0);
    return begin + static_cast<int>(std::floor((end - begin) * p / 100.0));
}
