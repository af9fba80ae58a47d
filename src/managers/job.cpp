#include "job.hpp"
#include <fmt/format.h>
#include <stdexcept>

const char* job_state_name(JobState s) {
    switch (s) {
        case JobState::Pending:     return "pending";
        case JobState::Fetching:    return "fetching";
        case JobState::Transcoding: return "transcoding";
        case JobState::Uploading:   return "uploading";
        case JobState::Retrying:    return "retrying";
        case JobState::TimedOut:    return "timedOut";
        case JobState::Done:        return "done";
        case JobState::Failed:      return "failed";
    }
    return "unknown";
}

bool is_terminal(JobState s) {
    return s == JobState::Done || s == JobState::Failed;
}

bool transition_allowed(JobState from, JobState to) {
    switch (from) {
        case JobState::Pending:
            return to == JobState::Fetching || to == JobState::Failed;
        case JobState::Fetching:
            return to == JobState::Transcoding || to == JobState::Uploading ||
                   to == JobState::TimedOut || to == JobState::Retrying ||
                   to == JobState::Failed;
        case JobState::TimedOut:
            return to == JobState::Retrying || to == JobState::Failed;
        case JobState::Retrying:
            return to == JobState::Fetching || to == JobState::Failed;
        case JobState::Transcoding:
            return to == JobState::Uploading || to == JobState::Failed;
        case JobState::Uploading:
            return to == JobState::Done || to == JobState::Failed;
        case JobState::Done:
        case JobState::Failed:
            return false;
    }
    return false;
}

Job::Job(Request request, int max_attempts, NowFn now)
    : request_(std::move(request)), max_attempts_(max_attempts), now_(std::move(now)),
      effective_resolution_(request_.requested_resolution),
      token_(std::make_shared<CancelToken>()) {
    if (max_attempts_ < 1) throw std::invalid_argument("max_attempts must be >= 1");
}

Result<void> Job::transition(JobState to) {
    if (!transition_allowed(state_, to)) {
        return Result<void>::Err(fmt::format("job {}: illegal transition {} -> {}",
                                             id(), job_state_name(state_), job_state_name(to)));
    }
    if (state_ == JobState::Retrying && to == JobState::Fetching && !can_retry()) {
        return Result<void>::Err(fmt::format("job {}: retry limit reached ({} attempts)",
                                             id(), max_attempts_));
    }

    auto now = now_();
    if (to == JobState::Fetching) {
        ++attempt_;
        if (!started_at_) started_at_ = now;
    }
    history_.push_back({state_, to, now});
    state_ = to;
    return Result<void>::Ok();
}

Result<void> Job::fail(FailureReason reason) {
    last_error_ = std::move(reason);
    return transition(JobState::Failed);
}

void Job::request_cancel(CancelReason reason) {
    if (cancel_requested_ == CancelReason::None) cancel_requested_ = reason;
    token_->cancel(reason);
}

bool Job::renew_token() {
    if (cancel_requested_ != CancelReason::None) return false;
    token_ = std::make_shared<CancelToken>();
    return true;
}
