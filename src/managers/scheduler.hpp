#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include "capabilities.hpp"
#include "concurrency_gate.hpp"
#include "job.hpp"
#include "quota_tracker.hpp"
#include "retention_manager.hpp"

class Config;

struct SchedulerOptions {
    Resolution max_resolution = Resolution::P1080;
    std::chrono::milliseconds fetch_timeout{1800 * 1000};
    int max_attempts = 2;
    std::chrono::milliseconds retry_backoff{2000};
    int max_duration_seconds = 7200;              // 0 skips the length check
    int64_t max_upload_bytes = 2LL * 1024 * 1024 * 1024;
    std::chrono::seconds cleanup_after{30 * 60};
    bool release_after_upload = true;
    std::filesystem::path download_dir;
    std::string output_container = "mp4";
    int progress_step_percent = 10;
    std::chrono::milliseconds progress_interval{1000};
    std::chrono::milliseconds watchdog_tick{50};

    static SchedulerOptions from_config(const Config& config);
};

struct JobHandle {
    std::string job_id;
    bool admitted = false;
    int queue_position = 0;       // 1-based place in the pending queue, 0 if rejected
};

struct SchedulerStats {
    int pending = 0;
    int active = 0;
    std::map<JobState, int> by_state;
    int slots_in_use = 0;
    int slots_capacity = 0;
    int64_t completed = 0;
    int64_t failed = 0;
    int64_t rejected = 0;
};

// Admits requests against the quota, queues them FIFO for a concurrency slot
// and drives each admitted job on its own worker thread. Terminal outcomes
// arrive through the NotificationSink; submit() never blocks.
class Scheduler {
public:
    Scheduler(SchedulerOptions options, QuotaTracker& quota, ConcurrencyGate& gate,
              RetentionManager& retention, SourceFetcher& fetcher, TransferOut& transfer,
              NotificationSink& sink, Transcoder* transcoder = nullptr,
              NowFn now = steady_now());
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Start the dispatcher and the deadline watchdog.
    void start();

    // Cancel everything, close the gate and join all threads. Idempotent.
    void shutdown();

    JobHandle submit(Request request);

    // User cancellation of a pending or running job.
    Result<void> cancel(const std::string& job_id);

    std::optional<JobState> job_state(const std::string& job_id) const;

    // State transitions of a live job or one of the most recently finished.
    // Empty if the id is unknown.
    std::vector<JobTransition> history(const std::string& job_id) const;
    SchedulerStats stats() const;

    const SchedulerOptions& options() const { return options_; }

private:
    struct Worker {
        std::thread thread;
        std::atomic<bool> finished{false};
        std::string job_id;
    };

    struct Outcome {
        bool ok = false;
        JobSummary summary;
        FailureReason failure;
    };

    // scheduler.cpp
    void dispatcher_loop();
    void watchdog_loop();
    void reap_workers(bool all);
    void finish_unstarted(const std::string& job_id, FailureReason reason);
    FailureReason cancel_failure(CancelReason reason) const;
    void remember_history(const Job& job);     // caller holds mutex_

    // scheduler_drive.cpp
    void run_job(const std::string& job_id);
    Outcome drive(Job& job);
    bool fetch_with_retry(Job& job, LocalArtifact& artifact, Outcome& out,
                          const std::function<void(int)>& report);
    bool media_acceptable(const MediaInfo& info, std::string& why) const;
    bool verify_artifact(const LocalArtifact& artifact, std::string& why) const;
    bool maybe_transcode(Job& job, LocalArtifact& artifact, Outcome& out,
                         const std::function<void(int)>& report);
    void finalize(Job& job, const Outcome& outcome);
    void remove_partials(const std::string& stem);
    void move_to(Job& job, JobState to);
    Outcome failed(Job& job, ErrorClass cls, std::string message, bool user_may_retry);
    Outcome cancelled(Job& job);

    // Sink calls never propagate exceptions into the scheduler
    void notify_progress(const std::string& job_id, int percent);
    void notify_complete(const std::string& job_id, const JobSummary& summary);
    void notify_failed(const std::string& job_id, const FailureReason& reason);

    SchedulerOptions options_;
    QuotaTracker& quota_;
    ConcurrencyGate& gate_;
    RetentionManager& retention_;
    SourceFetcher& fetcher_;
    TransferOut& transfer_;
    NotificationSink& sink_;
    Transcoder* transcoder_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::unique_ptr<Job>> jobs_;
    std::deque<std::string> pending_;
    std::list<std::unique_ptr<Worker>> workers_;
    std::deque<std::pair<std::string, std::vector<JobTransition>>> finished_;
    int64_t completed_ = 0;
    int64_t failed_ = 0;
    int64_t rejected_ = 0;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> shut_down_{false};
    std::thread dispatcher_;
    std::thread watchdog_;
    std::mutex watchdog_mutex_;
    std::condition_variable watchdog_cv_;
};
