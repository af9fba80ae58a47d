#pragma once
#include <string>

// RAII single-instance lock on <downloads>/.vrelay.lock so two relays never
// share (and sweep) the same download directory. flock() based; the kernel
// drops it when the process exits, even on a crash.
class SingletonLock {
public:
    // Attempts to acquire the lock. Check held() after construction.
    explicit SingletonLock(const std::string& lock_path);
    ~SingletonLock();

    SingletonLock(const SingletonLock&) = delete;
    SingletonLock& operator=(const SingletonLock&) = delete;

    bool held() const { return fd_ >= 0; }

    // Pid recorded by whoever holds the lock, 0 if unknown.
    int owner_pid() const { return owner_pid_; }

private:
    int fd_ = -1;
    int owner_pid_ = 0;
};
