#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/utils.hpp>
#include <managers/capabilities.hpp>

namespace fs = std::filesystem;

// Scratch directory removed on destruction.
struct TempDir {
    fs::path path;
    TempDir() {
        path = fs::temp_directory_path() / ("vrelay_test_" + generate_job_id());
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    std::string file(const std::string& name) const { return (path / name).string(); }
};

inline void write_file(const std::string& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << data;
}

// Clock the test advances by hand.
struct ManualClock {
    TimePoint t = TimePoint() + std::chrono::hours(1);
    void advance(std::chrono::milliseconds d) { t += d; }
    NowFn fn() { return [this] { return t; }; }
};

// Writes "<dir>/<stem>.mp4" and succeeds unless a scripted behavior says otherwise.
class FakeFetcher : public SourceFetcher {
public:
    using Behavior = std::function<FetchResult(FakeFetcher&, const FetchRequest&, CancelToken&,
                                               const ProgressFn&, int call)>;

    std::string payload = "fake-video-bytes";
    int height = 1080;
    Behavior behavior;

    using LookupBehavior = std::function<Result<MediaInfo>(CancelToken&, int call)>;

    bool lookup_enabled = false;
    MediaInfo lookup_info;
    LookupBehavior lookup_behavior;

    std::atomic<int> calls{0};
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};

    FetchResult fetch(const FetchRequest& req, CancelToken& token,
                      const ProgressFn& on_progress) override {
        int call = ++calls;
        int now_active = ++active;
        int seen = max_active.load();
        while (now_active > seen && !max_active.compare_exchange_weak(seen, now_active)) {}
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(req);
        }

        FetchResult r = behavior ? behavior(*this, req, token, on_progress, call)
                                 : write_artifact(req);
        --active;
        return r;
    }

    bool supports_lookup() const override { return lookup_enabled; }

    Result<MediaInfo> lookup(const std::string&, CancelToken& token) override {
        int call = ++lookups;
        if (lookup_behavior) return lookup_behavior(token, call);
        return Result<MediaInfo>::Ok(lookup_info);
    }

    FetchResult write_artifact(const FetchRequest& req) {
        auto path = (req.output_dir / (req.file_stem + ".mp4")).string();
        write_file(path, payload);
        LocalArtifact a;
        a.path = path;
        a.content_length = static_cast<int64_t>(payload.size());
        a.title = "Test clip";
        a.duration_seconds = 42;
        a.height = height;
        a.container = "mp4";
        return FetchResult::Ok(a);
    }

    // Blocks until release() or the token fires.
    FetchResult block_until_released(const FetchRequest& req, CancelToken& token) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!released_ && !token.stop_requested()) {
            release_cv_.wait_for(lock, std::chrono::milliseconds(5));
        }
        lock.unlock();
        if (token.stop_requested()) return FetchResult::Err(FetchError::Cancelled, "stopped");
        return write_artifact(req);
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        release_cv_.notify_all();
    }

    std::vector<FetchRequest> requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::atomic<int> lookups{0};

private:
    std::mutex mutex_;
    std::condition_variable release_cv_;
    bool released_ = false;
    std::vector<FetchRequest> requests_;
};

class FakeTransfer : public TransferOut {
public:
    TransferError error = TransferError::None;
    std::atomic<int> calls{0};
    std::vector<double> progress_steps = {25, 50, 75, 100};

    TransferResult send(const LocalArtifact& artifact, const std::string& destination,
                        CancelToken&, const ProgressFn& on_progress) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            destinations_.push_back(destination);
        }
        for (double p : progress_steps) on_progress(p);
        if (error != TransferError::None) return TransferResult::Err(error, "fake failure");
        return TransferResult::Ok("ack:" + fs::path(artifact.path).filename().string());
    }

    std::vector<std::string> destinations() {
        std::lock_guard<std::mutex> lock(mutex_);
        return destinations_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> destinations_;
};

// Collects every notification; tests wait on terminal events.
class RecordingSink : public NotificationSink {
public:
    void on_progress(const std::string& job_id, int percent) override {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_[job_id].push_back(percent);
    }

    void on_complete(const std::string& job_id, const JobSummary& summary) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_[job_id] = summary;
        }
        cv_.notify_all();
    }

    void on_failed(const std::string& job_id, const FailureReason& reason) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failed_[job_id] = reason;
        }
        cv_.notify_all();
    }

    bool wait_terminal(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout,
                            [&] { return completed_.size() + failed_.size() >= n; });
    }

    bool wait_for_job(const std::string& id,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout,
                            [&] { return completed_.count(id) || failed_.count(id); });
    }

    std::map<std::string, JobSummary> completed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }

    std::map<std::string, FailureReason> failed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return failed_;
    }

    std::vector<int> progress(const std::string& job_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_[job_id];
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::vector<int>> progress_;
    std::map<std::string, JobSummary> completed_;
    std::map<std::string, FailureReason> failed_;
};

// Poll `pred` until it holds or `timeout` passes.
inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto until = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}
