#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

enum class CancelReason {
    None,
    User,
    Timeout,
    Shutdown,
};

const char* cancel_reason_name(CancelReason r);

// Cooperative cancellation shared between a job, its capabilities and the
// watchdog. The first cancel() wins; later reasons are ignored.
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // Returns true if this call set the token.
    bool cancel(CancelReason reason);

    bool stop_requested() const { return reason_.load() != CancelReason::None; }
    CancelReason reason() const { return reason_.load(); }

    // Block until cancelled or `timeout` elapses. Returns true if cancelled.
    bool wait_for(std::chrono::milliseconds timeout);

    // Block until cancelled.
    void wait();

private:
    std::atomic<CancelReason> reason_{CancelReason::None};
    std::mutex mutex_;
    std::condition_variable cv_;
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;
