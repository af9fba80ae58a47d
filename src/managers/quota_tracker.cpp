#include "quota_tracker.hpp"
#include "relay_log.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

QuotaTracker::QuotaTracker(int max_per_user, std::chrono::minutes window,
                           std::chrono::minutes evict_grace, NowFn now)
    : max_per_user_(max_per_user), window_(window),
      evict_grace_(evict_grace), now_(std::move(now)) {
    if (max_per_user_ < 1) throw std::invalid_argument("max_per_user must be >= 1");
    if (window_.count() < 1) throw std::invalid_argument("quota window must be >= 1 minute");
}

std::shared_ptr<QuotaTracker::UserWindow> QuotaTracker::lookup(const std::string& user_id,
                                                              bool create) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = users_.find(user_id);
    if (it != users_.end()) return it->second;
    if (!create) return nullptr;
    auto w = std::make_shared<UserWindow>();
    users_.emplace(user_id, w);
    return w;
}

bool QuotaTracker::expired(const UserWindow& w, TimePoint now) const {
    return now - w.window_start >= window_;
}

bool QuotaTracker::try_admit(const std::string& user_id) {
    for (;;) {
        auto w = lookup(user_id, true);
        std::lock_guard<std::mutex> lock(w->mutex);
        if (w->evicted) continue;

        auto now = now_();
        if (w->count == 0 || expired(*w, now)) {
            w->count = 0;
            w->window_start = now;
        }
        if (w->count >= max_per_user_) {
            relay_log(fmt::format("quota: denied {} ({}/{})", user_id, w->count, max_per_user_));
            return false;
        }
        ++w->count;
        return true;
    }
}

int QuotaTracker::remaining(const std::string& user_id) {
    auto w = lookup(user_id, false);
    if (!w) return max_per_user_;
    std::lock_guard<std::mutex> lock(w->mutex);
    if (w->evicted || expired(*w, now_())) return max_per_user_;
    return std::max(0, max_per_user_ - w->count);
}

std::chrono::seconds QuotaTracker::reset_in(const std::string& user_id) {
    auto w = lookup(user_id, false);
    if (!w) return std::chrono::seconds(0);
    std::lock_guard<std::mutex> lock(w->mutex);
    auto now = now_();
    if (w->evicted || w->count < max_per_user_ || expired(*w, now)) {
        return std::chrono::seconds(0);
    }
    auto left = w->window_start + window_ - now;
    return std::chrono::duration_cast<std::chrono::seconds>(left);
}

size_t QuotaTracker::evict_idle() {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto now = now_();
    size_t dropped = 0;
    for (auto it = users_.begin(); it != users_.end();) {
        auto& w = *it->second;
        std::unique_lock<std::mutex> user_lock(w.mutex, std::try_to_lock);
        // Busy windows are in use right now, so not idle
        if (user_lock.owns_lock() && now - w.window_start >= window_ + evict_grace_) {
            w.evicted = true;
            it = users_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    if (dropped > 0) relay_log(fmt::format("quota: evicted {} idle windows", dropped));
    return dropped;
}

size_t QuotaTracker::tracked_users() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return users_.size();
}
