#include "cancel_token.hpp"

const char* cancel_reason_name(CancelReason r) {
    switch (r) {
        case CancelReason::None:     return "none";
        case CancelReason::User:     return "user";
        case CancelReason::Timeout:  return "timeout";
        case CancelReason::Shutdown: return "shutdown";
    }
    return "unknown";
}

bool CancelToken::cancel(CancelReason reason) {
    if (reason == CancelReason::None) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        CancelReason expected = CancelReason::None;
        if (!reason_.compare_exchange_strong(expected, reason)) return false;
    }
    cv_.notify_all();
    return true;
}

bool CancelToken::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return stop_requested(); });
}

void CancelToken::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return stop_requested(); });
}
