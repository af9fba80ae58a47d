#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "cancel_token.hpp"

enum class JobState {
    Pending,
    Fetching,
    Transcoding,
    Uploading,
    Retrying,
    TimedOut,
    Done,
    Failed,
};

const char* job_state_name(JobState s);
bool is_terminal(JobState s);

// True for states that occupy the download/upload pipeline.
inline bool is_active_transfer(JobState s) {
    return s == JobState::Fetching || s == JobState::Uploading;
}

struct JobTransition {
    JobState from;
    JobState to;
    TimePoint at;
};

// One request's progress through pending -> fetching -> [transcoding] ->
// uploading -> done, with failed / timedOut branches and a bounded retry
// loop back into fetching. Transitions outside the table are rejected and
// leave the job unchanged.
class Job {
public:
    Job(Request request, int max_attempts, NowFn now = steady_now());

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    const std::string& id() const { return request_.request_id; }
    const Request& request() const { return request_; }
    JobState state() const { return state_; }
    int attempt() const { return attempt_; }
    int max_attempts() const { return max_attempts_; }
    bool can_retry() const { return attempt_ < max_attempts_; }

    // Move to `to`. retrying -> fetching bumps the attempt counter.
    Result<void> transition(JobState to);

    // Convenience for error paths: any non-terminal state may fail.
    Result<void> fail(FailureReason reason);

    const std::string& local_path() const { return local_path_; }
    void set_local_path(std::string p) { local_path_ = std::move(p); }

    int64_t bytes_transferred() const { return bytes_transferred_; }
    void set_bytes_transferred(int64_t n) { bytes_transferred_ = n; }

    Resolution effective_resolution() const { return effective_resolution_; }
    void set_effective_resolution(Resolution r) { effective_resolution_ = r; }

    // Set when the job enters fetching for the first time
    std::optional<TimePoint> started_at() const { return started_at_; }

    std::optional<TimePoint> deadline() const { return deadline_; }
    void set_deadline(TimePoint d) { deadline_ = d; }
    void clear_deadline() { deadline_.reset(); }

    const std::optional<FailureReason>& last_error() const { return last_error_; }
    void set_last_error(FailureReason r) { last_error_ = std::move(r); }

    // Token handed to capabilities. The watchdog cancels it on deadline expiry.
    const CancelTokenPtr& token() const { return token_; }

    // Sticky user or shutdown cancellation: remembered and applied to the token.
    void request_cancel(CancelReason reason);
    CancelReason cancel_requested() const { return cancel_requested_; }

    // Fresh token for the next attempt after a timeout. Refused once a
    // user or shutdown cancel has been requested.
    bool renew_token();

    const std::vector<JobTransition>& history() const { return history_; }

private:
    Request request_;
    JobState state_ = JobState::Pending;
    int attempt_ = 0;
    const int max_attempts_;
    NowFn now_;

    std::string local_path_;
    int64_t bytes_transferred_ = 0;
    Resolution effective_resolution_;
    std::optional<TimePoint> started_at_;
    std::optional<TimePoint> deadline_;
    std::optional<FailureReason> last_error_;
    CancelTokenPtr token_;
    CancelReason cancel_requested_ = CancelReason::None;
    std::vector<JobTransition> history_;
};

// Whether the table allows `from` -> `to` (ignores the attempt bound).
bool transition_allowed(JobState from, JobState to);
