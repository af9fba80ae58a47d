#include "scheduler.hpp"
#include "progress_throttle.hpp"
#include "relay_log.hpp"
#include <core/constants.hpp>
#include <core/resolution.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

// ── Worker entry ────────────────────────────────────────────

void Scheduler::run_job(const std::string& job_id) {
    Job* job = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it != jobs_.end()) job = it->second.get();
    }
    if (!job) {
        gate_.release(job_id);
        return;
    }

    Outcome outcome;
    try {
        outcome = drive(*job);
    } catch (const std::exception& e) {
        relay_log(fmt::format("scheduler: {} internal fault: {}", job_id, e.what()));
        outcome = failed(*job, ErrorClass::InternalFault,
                         std::string("Internal error: ") + e.what(), true);
    } catch (...) {
        relay_log(fmt::format("scheduler: {} internal fault: unknown exception", job_id));
        outcome = failed(*job, ErrorClass::InternalFault, "Internal error", true);
    }

    gate_.release(job_id);
    finalize(*job, outcome);
}

// ── Phases ──────────────────────────────────────────────────

Scheduler::Outcome Scheduler::drive(Job& job) {
    move_to(job, JobState::Fetching);
    if (job.token()->stop_requested()) return cancelled(job);

    const auto& req = job.request();
    Resolution target = clamp_resolution(req.requested_resolution, options_.max_resolution);
    job.set_effective_resolution(target);
    if (target != req.requested_resolution) {
        relay_log(fmt::format("scheduler: {} resolution {} clamped to {}", job.id(),
                              resolution_label(req.requested_resolution),
                              resolution_label(target)));
    }

    ProgressThrottle throttle(options_.progress_step_percent, options_.progress_interval, now_);
    auto report = [&](int overall) {
        if (auto v = throttle.offer(overall)) notify_progress(job.id(), *v);
    };

    LocalArtifact artifact;
    Outcome out;
    if (!fetch_with_retry(job, artifact, out, report)) return out;

    // Artifact is on disk: pin it until the job hands it to retention
    job.set_local_path(artifact.path);
    retention_.acquire_ref(artifact.path);
    job.set_bytes_transferred(artifact.content_length);

    if (!maybe_transcode(job, artifact, out, report)) return out;

    if (job.token()->stop_requested()) return cancelled(job);

    if (artifact.content_length > options_.max_upload_bytes) {
        return failed(job, ErrorClass::UploadFailed,
                      fmt::format("File is too large to send ({}, limit {}). "
                                  "Try a lower resolution.",
                                  format_bytes(artifact.content_length),
                                  format_bytes(options_.max_upload_bytes)),
                      true);
    }

    move_to(job, JobState::Uploading);
    auto sent = transfer_.send(artifact, req.destination, *job.token(), [&](double p) {
        report(scale_progress(p, PROGRESS_TRANSCODE_END, 100));
    });
    if (!sent.ok()) {
        if (job.token()->stop_requested()) return cancelled(job);
        // Never retried: a second attempt could duplicate a partial upload
        return failed(job, ErrorClass::UploadFailed,
                      fmt::format("Upload failed ({}): {}", transfer_error_name(sent.error),
                                  sent.message),
                      sent.error == TransferError::TooLarge);
    }

    move_to(job, JobState::Done);

    Outcome done;
    done.ok = true;
    done.summary.job_id = job.id();
    done.summary.title = artifact.title;
    done.summary.bytes = artifact.content_length;
    done.summary.duration_seconds = artifact.duration_seconds;
    done.summary.resolution = job.effective_resolution();
    done.summary.attempts = job.attempt();
    if (job.started_at()) {
        done.summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now_() - *job.started_at());
    }
    done.summary.delivery_ref = sent.delivery_ref;
    return done;
}

bool Scheduler::fetch_with_retry(Job& job, LocalArtifact& artifact, Outcome& out,
                                 const std::function<void(int)>& report) {
    const auto& req = job.request();
    bool lookup_pending = fetcher_.supports_lookup() && options_.max_duration_seconds > 0;

    for (;;) {
        FetchRequest fr;
        fr.url = req.source_url;
        fr.max_resolution = job.effective_resolution();
        fr.output_dir = options_.download_dir;
        fr.file_stem = sanitize_path_component(job.id());
        CancelTokenPtr token;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fr.deadline = now_() + options_.fetch_timeout;
            job.set_deadline(fr.deadline);
            token = job.token();
        }

        relay_log(fmt::format("scheduler: {} fetch attempt {}/{} at {}", job.id(),
                              job.attempt(), job.max_attempts(),
                              resolution_label(fr.max_resolution)));

        // The lookup runs under the attempt's deadline and fails like a fetch
        FetchResult r;
        if (lookup_pending) {
            auto info = fetcher_.lookup(req.source_url, *token);
            if (token->stop_requested()) {
                r = FetchResult::Err(FetchError::Cancelled,
                                     "stopped while reading media information");
            } else if (info.is_err()) {
                r = FetchResult::Err(FetchError::TransportFailure,
                                     "could not read media information: " + info.error);
            } else {
                std::string why;
                if (!media_acceptable(info.value, why)) {
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        job.clear_deadline();
                    }
                    out = failed(job, ErrorClass::FetchFailed, why, false);
                    return false;
                }
                lookup_pending = false;
            }
        }
        if (!lookup_pending) {
            r = fetcher_.fetch(fr, *token, [&](double p) {
                report(scale_progress(p, 0, PROGRESS_FETCH_END));
            });
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            job.clear_deadline();
        }

        FetchError error = r.error;
        std::string message = r.message;
        if (token->reason() == CancelReason::Timeout) {
            error = FetchError::Timeout;
            message = fmt::format("no result within {}", format_elapsed(options_.fetch_timeout));
        } else if (token->stop_requested()) {
            remove_partials(fr.file_stem);
            out = cancelled(job);
            return false;
        } else if (r.ok()) {
            std::string why;
            if (verify_artifact(r.artifact, why)) {
                artifact = r.artifact;
                if (artifact.content_length <= 0) {
                    std::error_code ec;
                    artifact.content_length = static_cast<int64_t>(fs::file_size(artifact.path, ec));
                }
                return true;
            }
            error = FetchError::TransportFailure;
            message = why;
        }

        relay_log(fmt::format("scheduler: {} fetch failed ({}): {}", job.id(),
                              fetch_error_name(error), message));

        bool retryable = error == FetchError::Timeout || error == FetchError::RateLimited ||
                         error == FetchError::TransportFailure;
        if (error == FetchError::Timeout) move_to(job, JobState::TimedOut);

        if (!retryable || !job.can_retry()) {
            remove_partials(fr.file_stem);
            if (error == FetchError::Cancelled) {
                out = cancelled(job);
            } else if (error == FetchError::Timeout) {
                out = failed(job, ErrorClass::FetchTimeout,
                             fmt::format("Download timed out after {} attempt(s)", job.attempt()),
                             true);
            } else {
                out = failed(job, ErrorClass::FetchFailed,
                             fmt::format("Download failed ({}): {}", fetch_error_name(error),
                                         message),
                             retryable);
            }
            return false;
        }

        move_to(job, JobState::Retrying);
        bool renewed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            renewed = job.renew_token();
            token = job.token();
        }
        if (!renewed) {
            remove_partials(fr.file_stem);
            out = cancelled(job);
            return false;
        }

        auto backoff = options_.retry_backoff * (1 << std::min(job.attempt() - 1, 16));
        relay_log(fmt::format("scheduler: {} retrying in {}ms", job.id(), backoff.count()));
        if (token->wait_for(backoff)) {
            remove_partials(fr.file_stem);
            out = cancelled(job);
            return false;
        }
        move_to(job, JobState::Fetching);
    }
}

bool Scheduler::media_acceptable(const MediaInfo& info, std::string& why) const {
    if (!info.available) {
        why = info.error_message.empty() ? "Video is unavailable" : info.error_message;
        return false;
    }
    if (info.duration_seconds > options_.max_duration_seconds) {
        why = fmt::format("Video is too long ({}, limit {})", format_duration(info.duration_seconds),
                          format_duration(options_.max_duration_seconds));
        return false;
    }
    return true;
}

bool Scheduler::verify_artifact(const LocalArtifact& artifact, std::string& why) const {
    std::error_code ec;
    if (artifact.path.empty() || !fs::is_regular_file(artifact.path, ec)) {
        why = "fetcher reported success but produced no file";
        return false;
    }
    auto size = static_cast<int64_t>(fs::file_size(artifact.path, ec));
    if (ec) {
        why = fmt::format("cannot stat {}: {}", artifact.path, ec.message());
        return false;
    }
    if (size == 0) {
        why = "downloaded file is empty";
        return false;
    }
    if (artifact.content_length > 0 && size != artifact.content_length) {
        why = fmt::format("incomplete download ({} of {} bytes)", size, artifact.content_length);
        return false;
    }
    return true;
}

bool Scheduler::maybe_transcode(Job& job, LocalArtifact& artifact, Outcome& out,
                                const std::function<void(int)>& report) {
    if (!transcoder_) return true;

    Resolution target = job.effective_resolution();
    bool too_tall = artifact.height > resolution_height(target);
    bool wrong_container = !options_.output_container.empty() && !artifact.container.empty() &&
                           artifact.container != options_.output_container;
    if (!too_tall && !wrong_container) return true;

    move_to(job, JobState::Transcoding);
    auto r = transcoder_->transcode(artifact, target, options_.output_container, *job.token(),
                                    [&](double p) {
        report(scale_progress(p, PROGRESS_FETCH_END, PROGRESS_TRANSCODE_END));
    });
    if (job.token()->stop_requested()) {
        if (r.is_ok()) retention_.release_now(r.value.path);
        out = cancelled(job);
        return false;
    }
    if (r.is_err()) {
        out = failed(job, ErrorClass::FetchFailed, "Could not convert video: " + r.error, true);
        return false;
    }

    // Swap the pin over to the converted file and drop the source
    std::string source = artifact.path;
    retention_.acquire_ref(r.value.path);
    job.set_local_path(r.value.path);
    retention_.release_ref(source);
    retention_.release_now(source);

    artifact = r.value;
    if (artifact.content_length <= 0) {
        std::error_code ec;
        artifact.content_length = static_cast<int64_t>(fs::file_size(artifact.path, ec));
    }
    job.set_bytes_transferred(artifact.content_length);
    return true;
}

// ── Terminal handling ───────────────────────────────────────

void Scheduler::finalize(Job& job, const Outcome& outcome) {
    const std::string id = job.id();
    const std::string path = job.local_path();

    if (outcome.ok) {
        relay_log(fmt::format("scheduler: {} done in {} ({} attempt(s), {})", id,
                              format_elapsed(outcome.summary.elapsed), outcome.summary.attempts,
                              format_bytes(outcome.summary.bytes)));
        notify_complete(id, outcome.summary);
    } else {
        relay_log(fmt::format("scheduler: {} failed [{}]: {}", id,
                              error_class_name(outcome.failure.error_class),
                              outcome.failure.message));
        notify_failed(id, outcome.failure);
    }

    if (!path.empty()) {
        retention_.register_file(path, options_.cleanup_after, id);
        retention_.release_ref(path);
        if (!outcome.ok || options_.release_after_upload) retention_.release_now(path);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome.ok) ++completed_;
    else ++failed_;
    remember_history(job);
    jobs_.erase(id);
}

void Scheduler::remove_partials(const std::string& stem) {
    std::error_code ec;
    if (options_.download_dir.empty() || !fs::is_directory(options_.download_dir, ec)) return;
    std::vector<std::string> doomed;
    for (const auto& entry : fs::directory_iterator(options_.download_dir, ec)) {
        auto name = entry.path().filename().string();
        if (name.rfind(stem + ".", 0) == 0) doomed.push_back(entry.path().string());
    }
    for (const auto& p : doomed) retention_.release_now(p);
}

void Scheduler::move_to(Job& job, JobState to) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = job.transition(to);
    if (r.is_err()) throw std::logic_error(r.error);
    relay_log(fmt::format("scheduler: {} -> {}", job.id(), job_state_name(to)));
}

Scheduler::Outcome Scheduler::failed(Job& job, ErrorClass cls, std::string message,
                                     bool user_may_retry) {
    Outcome out;
    out.failure = {cls, std::move(message), user_may_retry};
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_terminal(job.state())) {
        auto r = job.fail(out.failure);
        if (r.is_err()) relay_log("scheduler: " + r.error);
    }
    return out;
}

Scheduler::Outcome Scheduler::cancelled(Job& job) {
    CancelReason why = job.cancel_requested();
    if (why == CancelReason::None) why = job.token()->reason();
    auto reason = cancel_failure(why);
    return failed(job, reason.error_class, reason.message, reason.user_may_retry);
}
