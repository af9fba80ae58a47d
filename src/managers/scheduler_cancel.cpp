#include "scheduler.hpp"
#include "relay_log.hpp"
#include <fmt/format.h>
#include <algorithm>

// ── Cancellation ────────────────────────────────────────────

Result<void> Scheduler::cancel(const std::string& job_id) {
    bool queued = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            return Result<void>::Err(fmt::format("No active job '{}'", job_id));
        }
        Job& job = *it->second;
        if (is_terminal(job.state())) {
            return Result<void>::Err(fmt::format("Job '{}' already finished", job_id));
        }
        if (job.cancel_requested() != CancelReason::None) {
            return Result<void>::Err(fmt::format("Job '{}' is already being cancelled", job_id));
        }

        job.request_cancel(CancelReason::User);

        auto pos = std::find(pending_.begin(), pending_.end(), job_id);
        if (pos != pending_.end()) {
            pending_.erase(pos);
            queued = true;
        }
    }

    relay_log(fmt::format("scheduler: cancel requested for {}", job_id));

    if (queued) {
        finish_unstarted(job_id, cancel_failure(CancelReason::User));
    } else {
        // Waiting at the gate: the dispatcher's acquire() returns false.
        // Running: the worker observes the token.
        gate_.abandon(job_id);
    }
    return Result<void>::Ok();
}

// ── Shutdown ────────────────────────────────────────────────

void Scheduler::shutdown() {
    if (shut_down_.exchange(true)) return;
    relay_log("scheduler: shutting down");

    std::vector<std::string> queued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        queued.assign(pending_.begin(), pending_.end());
        pending_.clear();
        for (auto& [id, job] : jobs_) {
            if (!is_terminal(job->state())) job->request_cancel(CancelReason::Shutdown);
        }
    }
    cv_.notify_all();
    gate_.close();

    if (dispatcher_.joinable()) dispatcher_.join();

    for (const auto& id : queued) {
        finish_unstarted(id, cancel_failure(CancelReason::Shutdown));
    }

    // Workers finish on their own once their tokens fire
    reap_workers(true);

    {
        std::lock_guard<std::mutex> lock(watchdog_mutex_);
    }
    watchdog_cv_.notify_all();
    if (watchdog_.joinable()) watchdog_.join();

    // Jobs admitted but never dispatched (start() was not called)
    std::vector<std::string> leftover;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, job] : jobs_) leftover.push_back(id);
    }
    for (const auto& id : leftover) {
        finish_unstarted(id, cancel_failure(CancelReason::Shutdown));
    }

    relay_log(fmt::format("scheduler: stopped ({} done, {} failed, {} rejected)",
                          completed_, failed_, rejected_));
}
