#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <string>

// Counting semaphore over job ids. Slots are granted strictly in the order
// acquire() was called, and each holder owns at most one slot.
class ConcurrencyGate {
public:
    // Throws std::invalid_argument when capacity < 1.
    explicit ConcurrencyGate(int capacity);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    // Wait for a slot. Returns false if the gate was closed or the holder
    // abandoned while queued. Re-acquiring a held slot returns true at once.
    bool acquire(const std::string& holder);

    // Take a slot only if one is free and nobody is queued ahead.
    bool try_acquire(const std::string& holder);

    // Give the slot back. Releasing a slot that is not held is a no-op and
    // returns false.
    bool release(const std::string& holder);

    // Withdraw a pending or future acquire() for a holder without a slot.
    // Returns false if the holder already holds one.
    bool abandon(const std::string& holder);

    // Wake every waiter with false and refuse further acquisitions.
    // Held slots stay held until released.
    void close();

    int capacity() const { return capacity_; }
    int in_use() const;
    int available() const;
    int waiting() const;
    bool holds(const std::string& holder) const;
    bool closed() const;

private:
    const int capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    std::set<std::string> holders_;
    std::set<std::string> abandoned_;
    bool closed_ = false;
};
