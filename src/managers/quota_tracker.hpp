#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>

// Per-user request cap over a fixed window that restarts on expiry.
// Calls for the same user serialize on that user's lock; different users
// only share a brief lookup in the user map.
class QuotaTracker {
public:
    QuotaTracker(int max_per_user, std::chrono::minutes window,
                 std::chrono::minutes evict_grace = std::chrono::minutes(10),
                 NowFn now = steady_now());

    // Count one request against `user_id`. False once the window is full.
    bool try_admit(const std::string& user_id);

    // Requests left in the user's current window (max_per_user if none).
    int remaining(const std::string& user_id);

    // Time until the user's window expires. Zero when the user is not limited.
    std::chrono::seconds reset_in(const std::string& user_id);

    // Drop windows idle past expiry plus grace. Returns how many were dropped.
    size_t evict_idle();

    size_t tracked_users() const;

    int max_per_user() const { return max_per_user_; }
    std::chrono::minutes window() const { return window_; }

private:
    struct UserWindow {
        std::mutex mutex;
        int count = 0;
        TimePoint window_start{};
        bool evicted = false;   // removed from the map; callers must re-lookup
    };

    std::shared_ptr<UserWindow> lookup(const std::string& user_id, bool create);
    bool expired(const UserWindow& w, TimePoint now) const;

    const int max_per_user_;
    const std::chrono::minutes window_;
    const std::chrono::minutes evict_grace_;
    NowFn now_;

    mutable std::mutex map_mutex_;
    std::map<std::string, std::shared_ptr<UserWindow>> users_;
};
