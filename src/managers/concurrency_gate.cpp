#include "concurrency_gate.hpp"
#include "relay_log.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

ConcurrencyGate::ConcurrencyGate(int capacity) : capacity_(capacity) {
    if (capacity < 1) {
        throw std::invalid_argument(fmt::format("gate capacity must be >= 1, got {}", capacity));
    }
}

bool ConcurrencyGate::acquire(const std::string& holder) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) return false;
    if (holders_.count(holder)) return true;
    if (abandoned_.erase(holder)) return false;

    queue_.push_back(holder);
    cv_.wait(lock, [&] {
        if (closed_ || abandoned_.count(holder)) return true;
        return queue_.front() == holder &&
               static_cast<int>(holders_.size()) < capacity_;
    });

    if (abandoned_.erase(holder)) {
        return false;
    }
    if (closed_) {
        auto it = std::find(queue_.begin(), queue_.end(), holder);
        if (it != queue_.end()) queue_.erase(it);
        return false;
    }

    queue_.pop_front();
    holders_.insert(holder);
    relay_log(fmt::format("gate: {} acquired ({}/{})", holder, holders_.size(), capacity_));
    // The next waiter may also fit
    cv_.notify_all();
    return true;
}

bool ConcurrencyGate::try_acquire(const std::string& holder) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    if (holders_.count(holder)) return true;
    if (!queue_.empty() || static_cast<int>(holders_.size()) >= capacity_) return false;
    holders_.insert(holder);
    return true;
}

bool ConcurrencyGate::release(const std::string& holder) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (holders_.erase(holder) == 0) return false;
        relay_log(fmt::format("gate: {} released ({}/{})", holder, holders_.size(), capacity_));
    }
    cv_.notify_all();
    return true;
}

bool ConcurrencyGate::abandon(const std::string& holder) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (holders_.count(holder)) return false;
        // Not queued yet: the coming acquire() fails straight away
        auto it = std::find(queue_.begin(), queue_.end(), holder);
        if (it != queue_.end()) queue_.erase(it);
        abandoned_.insert(holder);
    }
    cv_.notify_all();
    return true;
}

void ConcurrencyGate::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
    }
    relay_log("gate: closed");
    cv_.notify_all();
}

int ConcurrencyGate::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(holders_.size());
}

int ConcurrencyGate::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_ - static_cast<int>(holders_.size());
}

int ConcurrencyGate::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(queue_.size());
}

bool ConcurrencyGate::holds(const std::string& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return holders_.count(holder) > 0;
}

bool ConcurrencyGate::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}
