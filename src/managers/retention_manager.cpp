#include "retention_manager.hpp"
#include "relay_log.hpp"
#include <fmt/format.h>

namespace fs = std::filesystem;

RetentionManager::RetentionManager(std::chrono::seconds sweep_interval, NowFn now)
    : interval_(sweep_interval), now_(std::move(now)) {}

RetentionManager::~RetentionManager() {
    stop();
}

// ── Records ─────────────────────────────────────────────────

void RetentionManager::register_file(const std::string& path, std::chrono::seconds ttl,
                                     const std::string& owner_job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();
    auto& rec = records_[path];
    if (rec.path.empty()) {
        rec.path = path;
        rec.created_at = now;
    }
    rec.deadline = now + ttl;
    if (!owner_job_id.empty()) rec.owner_job_id = owner_job_id;
    relay_log(fmt::format("retention: registered {} (ttl {}s, owner {})",
                          path, ttl.count(), rec.owner_job_id));
}

bool RetentionManager::release_now(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(path);
    if (it == records_.end()) {
        delete_file(path, "released");
        return true;
    }
    if (it->second.refs > 0) {
        it->second.release_requested = true;
        relay_log(fmt::format("retention: release of {} deferred ({} refs)",
                              path, it->second.refs));
        return false;
    }
    delete_file(path, "released");
    records_.erase(it);
    return true;
}

void RetentionManager::acquire_ref(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& rec = records_[path];
    if (rec.path.empty()) {
        rec.path = path;
        rec.created_at = now_();
    }
    ++rec.refs;
}

void RetentionManager::release_ref(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(path);
    if (it == records_.end() || it->second.refs == 0) {
        relay_log(fmt::format("retention: unbalanced release_ref for {}", path));
        return;
    }
    auto& rec = it->second;
    if (--rec.refs > 0) return;

    bool due = rec.deadline && *rec.deadline <= now_();
    if (rec.release_requested || due) {
        delete_file(path, due ? "expired" : "released");
        records_.erase(it);
    } else if (!rec.deadline) {
        // Pin only; the owner has not handed the file over yet
        records_.erase(it);
    }
}

size_t RetentionManager::sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();
    size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        const auto& rec = it->second;
        if (rec.refs == 0 && rec.deadline && *rec.deadline <= now) {
            delete_file(rec.path, "expired");
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void RetentionManager::delete_file(const std::string& path, const char* why) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        relay_log(fmt::format("retention: failed to delete {} ({}): {}", path, why, ec.message()));
    } else if (!removed) {
        relay_log(fmt::format("retention: {} already gone ({})", path, why));
    } else {
        relay_log(fmt::format("retention: deleted {} ({})", path, why));
    }
}

bool RetentionManager::is_tracked(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(path) > 0;
}

std::vector<RetainedFile> RetentionManager::tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RetainedFile> out;
    out.reserve(records_.size());
    for (const auto& [path, rec] : records_) out.push_back(rec);
    return out;
}

// ── Lifecycle ───────────────────────────────────────────────

void RetentionManager::start() {
    if (running_) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    running_ = true;
    thread_ = std::thread(&RetentionManager::sweep_loop, this);
    relay_log(fmt::format("retention: started (sweep every {}s)", interval_.count()));
}

void RetentionManager::stop() {
    if (running_) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
        running_ = false;
    }

    // Grace sweep: nothing unreferenced outlives the process
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.refs == 0) {
            delete_file(it->second.path, "shutdown");
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0 || !records_.empty()) {
        relay_log(fmt::format("retention: final sweep removed {}, {} still referenced",
                              removed, records_.size()));
    }
}

void RetentionManager::sweep_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (cv_.wait_for(lock, interval_, [this] { return stopping_; })) break;
        lock.unlock();
        size_t removed = sweep();
        if (removed > 0) relay_log(fmt::format("retention: sweep removed {}", removed));
        lock.lock();
    }
}

// ── Directory maintenance ───────────────────────────────────

size_t RetentionManager::sweep_orphans(const fs::path& dir, std::chrono::seconds max_age) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return 0;

    auto cutoff = fs::file_time_type::clock::now() - max_age;
    size_t deleted = 0;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        auto name = entry.path().filename().string();
        if (!name.empty() && name[0] == '.') continue;
        if (is_tracked(entry.path().string())) continue;

        auto mtime = entry.last_write_time(entry_ec);
        if (entry_ec || mtime >= cutoff) continue;
        if (fs::remove(entry.path(), entry_ec)) {
            ++deleted;
            relay_log(fmt::format("retention: deleted stale file {}", name));
        } else if (entry_ec) {
            relay_log(fmt::format("retention: failed to delete {}: {}", name, entry_ec.message()));
        }
    }
    if (ec) relay_log(fmt::format("retention: error scanning {}: {}", dir.string(), ec.message()));
    return deleted;
}

int64_t RetentionManager::directory_size(const fs::path& dir) {
    std::error_code ec;
    int64_t total = 0;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        auto size = entry.file_size(entry_ec);
        if (!entry_ec) total += static_cast<int64_t>(size);
    }
    if (ec) relay_log(fmt::format("retention: error sizing {}: {}", dir.string(), ec.message()));
    return total;
}
