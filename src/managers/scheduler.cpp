#include "scheduler.hpp"
#include "relay_log.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

SchedulerOptions SchedulerOptions::from_config(const Config& config) {
    SchedulerOptions o;
    const auto& d = config.downloads();
    o.max_resolution = d.max_resolution;
    o.fetch_timeout = std::chrono::seconds(d.timeout_seconds);
    o.max_attempts = d.max_attempts;
    o.retry_backoff = std::chrono::milliseconds(d.retry_backoff_ms);
    o.max_duration_seconds = d.max_duration_seconds;
    o.download_dir = d.path;
    o.max_upload_bytes = config.upload().max_bytes;
    o.cleanup_after = std::chrono::minutes(config.cleanup().after_minutes);
    o.release_after_upload = config.cleanup().release_after_upload;
    o.output_container = config.transcode().container;
    o.progress_step_percent = config.progress().step_percent;
    o.progress_interval = std::chrono::milliseconds(config.progress().min_interval_ms);
    o.watchdog_tick = std::chrono::milliseconds(WATCHDOG_TICK_MS);
    return o;
}

// ── Construction / Destruction ──────────────────────────────

Scheduler::Scheduler(SchedulerOptions options, QuotaTracker& quota, ConcurrencyGate& gate,
                     RetentionManager& retention, SourceFetcher& fetcher,
                     TransferOut& transfer, NotificationSink& sink, Transcoder* transcoder,
                     NowFn now)
    : options_(std::move(options)), quota_(quota), gate_(gate), retention_(retention),
      fetcher_(fetcher), transfer_(transfer), sink_(sink), transcoder_(transcoder),
      now_(std::move(now)) {}

Scheduler::~Scheduler() {
    shutdown();
}

// ── Lifecycle ───────────────────────────────────────────────

void Scheduler::start() {
    if (started_.exchange(true)) return;
    dispatcher_ = std::thread(&Scheduler::dispatcher_loop, this);
    watchdog_ = std::thread(&Scheduler::watchdog_loop, this);
    relay_log(fmt::format("scheduler: started ({} slots, timeout {}, {} attempts)",
                          gate_.capacity(),
                          format_elapsed(options_.fetch_timeout), options_.max_attempts));
}

// ── Submission ──────────────────────────────────────────────

JobHandle Scheduler::submit(Request request) {
    if (request.request_id.empty()) request.request_id = generate_job_id();
    if (request.destination.empty()) request.destination = request.user_id;
    request.submitted_at = std::chrono::system_clock::now();

    JobHandle handle;
    handle.job_id = request.request_id;

    // Checks and insertion share one critical section so shutdown() never
    // misses a job and a live id is never replaced.
    std::optional<FailureReason> rejection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            rejection = FailureReason{ErrorClass::Cancelled, "Service is shutting down", true};
        } else if (jobs_.count(handle.job_id)) {
            relay_log(fmt::format("scheduler: {} rejected: id already in use", handle.job_id));
            rejection = FailureReason{ErrorClass::InternalFault,
                                      fmt::format("Request id '{}' is already in use",
                                                  handle.job_id),
                                      true};
        } else if (!quota_.try_admit(request.user_id)) {
            int minutes = minutes_ceil(quota_.reset_in(request.user_id));
            relay_log(fmt::format("scheduler: {} rejected for {}: quota", handle.job_id,
                                  request.user_id));
            rejection = FailureReason{
                ErrorClass::QuotaExceeded,
                fmt::format("Rate limit reached ({} per {} min). Try again in {} min.",
                            quota_.max_per_user(), quota_.window().count(), minutes),
                false};
        } else {
            jobs_[handle.job_id] = std::make_unique<Job>(request, options_.max_attempts, now_);
            pending_.push_back(handle.job_id);
            handle.admitted = true;
            handle.queue_position = static_cast<int>(pending_.size());
        }
        if (rejection) ++rejected_;
    }

    if (rejection) {
        notify_failed(handle.job_id, *rejection);
        return handle;
    }
    cv_.notify_all();

    relay_log(fmt::format("scheduler: {} queued for {} ({}) at position {}", handle.job_id,
                          request.user_id, request.source_url, handle.queue_position));
    return handle;
}

// ── Queries ─────────────────────────────────────────────────

std::optional<JobState> Scheduler::job_state(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second->state();
}

std::vector<JobTransition> Scheduler::history(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it != jobs_.end()) return it->second->history();
    for (const auto& [id, transitions] : finished_) {
        if (id == job_id) return transitions;
    }
    return {};
}

void Scheduler::remember_history(const Job& job) {
    finished_.emplace_back(job.id(), job.history());
    while (finished_.size() > static_cast<size_t>(FINISHED_HISTORY_JOBS)) finished_.pop_front();
}

SchedulerStats Scheduler::stats() const {
    SchedulerStats s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, job] : jobs_) {
            ++s.by_state[job->state()];
            if (job->state() == JobState::Pending) ++s.pending;
            else if (!is_terminal(job->state())) ++s.active;
        }
        s.completed = completed_;
        s.failed = failed_;
        s.rejected = rejected_;
    }
    s.slots_in_use = gate_.in_use();
    s.slots_capacity = gate_.capacity();
    return s;
}

// ── Dispatcher ──────────────────────────────────────────────

void Scheduler::dispatcher_loop() {
    for (;;) {
        std::string job_id;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            if (stopping_) return;
            job_id = pending_.front();
            pending_.pop_front();
        }

        // Blocks until a slot frees; FIFO because this is the only acquirer
        if (!gate_.acquire(job_id)) {
            CancelReason why = CancelReason::Shutdown;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = jobs_.find(job_id);
                if (it != jobs_.end() && it->second->cancel_requested() != CancelReason::None) {
                    why = it->second->cancel_requested();
                }
            }
            finish_unstarted(job_id, cancel_failure(why));
            continue;
        }

        auto worker = std::make_unique<Worker>();
        worker->job_id = job_id;
        Worker* w = worker.get();
        std::lock_guard<std::mutex> lock(mutex_);
        w->thread = std::thread([this, w] {
            run_job(w->job_id);
            w->finished = true;
        });
        workers_.push_back(std::move(worker));
    }
}

void Scheduler::finish_unstarted(const std::string& job_id, FailureReason reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) return;
        auto r = it->second->fail(reason);
        if (r.is_err()) relay_log("scheduler: " + r.error);
        remember_history(*it->second);
        jobs_.erase(it);
        ++failed_;
    }
    relay_log(fmt::format("scheduler: {} failed before start: {}", job_id, reason.message));
    notify_failed(job_id, reason);
}

FailureReason Scheduler::cancel_failure(CancelReason reason) const {
    if (reason == CancelReason::Shutdown) {
        return {ErrorClass::Cancelled, "Service is shutting down", true};
    }
    return {ErrorClass::Cancelled, "Download cancelled", true};
}

// ── Watchdog ────────────────────────────────────────────────

void Scheduler::watchdog_loop() {
    int ticks = 0;
    std::unique_lock<std::mutex> wlock(watchdog_mutex_);
    while (!stopping_) {
        watchdog_cv_.wait_for(wlock, options_.watchdog_tick, [this] { return stopping_.load(); });
        if (stopping_) break;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = now_();
            for (auto& [id, job] : jobs_) {
                auto deadline = job->deadline();
                if (!deadline || now < *deadline) continue;
                if (job->token()->cancel(CancelReason::Timeout)) {
                    relay_log(fmt::format("scheduler: {} hit its fetch deadline (attempt {})",
                                          id, job->attempt()));
                }
            }
        }

        reap_workers(false);

        if (++ticks % QUOTA_EVICT_EVERY_TICKS == 0) quota_.evict_idle();
    }
}

void Scheduler::reap_workers(bool all) {
    std::list<std::unique_ptr<Worker>> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (all || (*it)->finished) {
                done.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& w : done) {
        if (w->thread.joinable()) w->thread.join();
    }
}

// ── Notifications ───────────────────────────────────────────

void Scheduler::notify_progress(const std::string& job_id, int percent) {
    try {
        sink_.on_progress(job_id, percent);
    } catch (const std::exception& e) {
        relay_log(fmt::format("scheduler: sink on_progress threw for {}: {}", job_id, e.what()));
    }
}

void Scheduler::notify_complete(const std::string& job_id, const JobSummary& summary) {
    try {
        sink_.on_complete(job_id, summary);
    } catch (const std::exception& e) {
        relay_log(fmt::format("scheduler: sink on_complete threw for {}: {}", job_id, e.what()));
    }
}

void Scheduler::notify_failed(const std::string& job_id, const FailureReason& reason) {
    try {
        sink_.on_failed(job_id, reason);
    } catch (const std::exception& e) {
        relay_log(fmt::format("scheduler: sink on_failed threw for {}: {}", job_id, e.what()));
    }
}
