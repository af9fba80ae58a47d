#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>

struct RetainedFile {
    std::string path;
    TimePoint created_at{};
    std::optional<TimePoint> deadline;   // unset while only pinned by a reference
    std::string owner_job_id;
    int refs = 0;
    bool release_requested = false;
};

// Owns deletion of transient files. A file is removed once its deadline has
// passed or release_now() was called, and never while a reference is held.
class RetentionManager {
public:
    explicit RetentionManager(std::chrono::seconds sweep_interval = std::chrono::seconds(60),
                              NowFn now = steady_now());
    ~RetentionManager();

    RetentionManager(const RetentionManager&) = delete;
    RetentionManager& operator=(const RetentionManager&) = delete;

    // Schedule `path` for deletion at now + ttl. Re-registering replaces the deadline.
    void register_file(const std::string& path, std::chrono::seconds ttl,
                       const std::string& owner_job_id = "");

    // Delete as soon as no reference is held. Returns true if deleted right away.
    bool release_now(const std::string& path);

    // Pin `path` against deletion. Unregistered paths are tracked as pins.
    void acquire_ref(const std::string& path);

    // Drop a pin. A due or release-requested file goes with the last reference.
    void release_ref(const std::string& path);

    // One pass over the records. Returns the number of records removed.
    size_t sweep();

    // Periodic sweeping on a background thread.
    void start();

    // Stop the sweep thread, then delete every remaining unreferenced record.
    void stop();

    bool running() const { return running_; }

    // Delete untracked regular files in `dir` older than `max_age`. Dotfiles are kept.
    size_t sweep_orphans(const std::filesystem::path& dir, std::chrono::seconds max_age);

    // Total size of regular files directly inside `dir`.
    static int64_t directory_size(const std::filesystem::path& dir);

    std::vector<RetainedFile> tracked() const;
    bool is_tracked(const std::string& path) const;

private:
    // Caller holds mutex_. Removes the file and logs failures; never throws.
    void delete_file(const std::string& path, const char* why);
    void sweep_loop();

    const std::chrono::seconds interval_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::map<std::string, RetainedFile> records_;

    std::atomic<bool> running_{false};
    bool stopping_ = false;
    std::condition_variable cv_;
    std::thread thread_;
};
