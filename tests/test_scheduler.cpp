#include <gtest/gtest.h>
#include <managers/scheduler.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <stdexcept>
#include <thread>
#include <vector>
#include "fakes.hpp"

using namespace std::chrono_literals;

namespace {

// Everything a Scheduler needs, wired with fakes and short timings.
struct Harness {
    TempDir dir;
    FakeFetcher fetcher;
    FakeTransfer transfer;
    RecordingSink sink;
    SchedulerOptions options;
    std::unique_ptr<QuotaTracker> quota;
    std::unique_ptr<ConcurrencyGate> gate;
    std::unique_ptr<RetentionManager> retention;
    std::unique_ptr<Scheduler> scheduler;

    explicit Harness(int slots = 2, int max_per_user = 20) {
        options.download_dir = dir.path;
        options.fetch_timeout = 2s;
        options.max_attempts = 2;
        options.retry_backoff = 5ms;
        options.max_duration_seconds = 0;
        options.cleanup_after = 60s;
        options.progress_step_percent = 10;
        options.progress_interval = 1h;
        options.watchdog_tick = 5ms;
        quota = std::make_unique<QuotaTracker>(max_per_user, std::chrono::minutes(60));
        gate = std::make_unique<ConcurrencyGate>(slots);
        retention = std::make_unique<RetentionManager>(60s);
    }

    Scheduler& start() {
        scheduler = std::make_unique<Scheduler>(options, *quota, *gate, *retention, fetcher,
                                                transfer, sink);
        scheduler->start();
        return *scheduler;
    }

    JobHandle submit(const std::string& user, Resolution res = Resolution::P720) {
        Request r;
        r.user_id = user;
        r.source_url = "https://www.youtube.com/watch?v=dQw4w9WgXcQ";
        r.requested_resolution = res;
        return scheduler->submit(r);
    }

    JobHandle submit_with_id(const std::string& user, const std::string& id) {
        Request r;
        r.request_id = id;
        r.user_id = user;
        r.source_url = "https://www.youtube.com/watch?v=dQw4w9WgXcQ";
        r.requested_resolution = Resolution::P720;
        return scheduler->submit(r);
    }
};

std::vector<JobState> states_entered(const std::vector<JobTransition>& history) {
    std::vector<JobState> out;
    for (const auto& t : history) out.push_back(t.to);
    return out;
}

}  // namespace

// ── Admission ───────────────────────────────────────────────

TEST(Scheduler, SubmitQueuesAndCompletes) {
    Harness h;
    auto& s = h.start();
    auto handle = h.submit("alice");
    EXPECT_TRUE(handle.admitted);
    EXPECT_FALSE(handle.job_id.empty());
    EXPECT_GE(handle.queue_position, 1);

    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    auto done = h.sink.completed();
    ASSERT_EQ(done.count(handle.job_id), 1u);
    EXPECT_EQ(done[handle.job_id].title, "Test clip");
    EXPECT_EQ(done[handle.job_id].attempts, 1);
    EXPECT_EQ(done[handle.job_id].delivery_ref, "ack:" + handle.job_id + ".mp4");
    EXPECT_EQ(h.transfer.destinations(), std::vector<std::string>{"alice"});
    EXPECT_TRUE(eventually([&] { return s.stats().completed == 1; }));
}

TEST(Scheduler, QuotaRejectsBeyondLimit) {
    Harness h(2, 1);
    auto& s = h.start();

    auto first = h.submit("alice");
    EXPECT_TRUE(first.admitted);

    auto second = h.submit("alice");
    EXPECT_FALSE(second.admitted);
    EXPECT_EQ(second.queue_position, 0);

    // Rejection is reported synchronously
    auto failed = h.sink.failed();
    ASSERT_EQ(failed.count(second.job_id), 1u);
    EXPECT_EQ(failed[second.job_id].error_class, ErrorClass::QuotaExceeded);
    EXPECT_FALSE(failed[second.job_id].user_may_retry);
    EXPECT_NE(failed[second.job_id].message.find("Try again in"), std::string::npos);

    auto other = h.submit("bob");
    EXPECT_TRUE(other.admitted);

    ASSERT_TRUE(h.sink.wait_for_job(first.job_id));
    ASSERT_TRUE(h.sink.wait_for_job(other.job_id));
    EXPECT_EQ(s.stats().rejected, 1);
}

TEST(Scheduler, ResolutionClampedToCeiling) {
    Harness h;
    h.options.max_resolution = Resolution::P1080;
    h.start();

    auto handle = h.submit("alice", Resolution::P2160);
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));

    auto reqs = h.fetcher.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].max_resolution, Resolution::P1080);
    EXPECT_EQ(h.sink.completed()[handle.job_id].resolution, Resolution::P1080);
}

TEST(Scheduler, LowerResolutionPassesThrough) {
    Harness h;
    h.options.max_resolution = Resolution::P1080;
    h.start();

    auto handle = h.submit("alice", Resolution::P480);
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    EXPECT_EQ(h.fetcher.requests()[0].max_resolution, Resolution::P480);
}

// ── Concurrency ─────────────────────────────────────────────

TEST(Scheduler, ConcurrencyCapHonored) {
    Harness h(2);
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken& token,
                            const ProgressFn&, int) {
        return f.block_until_released(req, token);
    };
    auto& s = h.start();

    auto a = h.submit("u1");
    auto b = h.submit("u2");
    auto c = h.submit("u3");

    ASSERT_TRUE(eventually([&] { return h.fetcher.active == 2; }));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(h.fetcher.active.load(), 2);
    EXPECT_EQ(h.gate->in_use(), 2);
    auto st = s.stats();
    EXPECT_EQ(st.pending, 1);
    EXPECT_EQ(st.slots_capacity, 2);

    h.fetcher.release();
    ASSERT_TRUE(h.sink.wait_terminal(3));
    EXPECT_EQ(h.sink.completed().size(), 3u);
    EXPECT_EQ(h.fetcher.max_active.load(), 2);
    EXPECT_TRUE(eventually([&] { return h.gate->in_use() == 0; }));
}

TEST(Scheduler, SlotsServedInSubmissionOrder) {
    Harness h(1);
    std::mutex m;
    std::vector<std::string> order;
    h.fetcher.behavior = [&](FakeFetcher& f, const FetchRequest& req, CancelToken& token,
                             const ProgressFn&, int) {
        {
            std::lock_guard<std::mutex> lock(m);
            order.push_back(req.file_stem);
        }
        return f.block_until_released(req, token);
    };
    h.start();

    auto a = h.submit("u1");
    auto b = h.submit("u2");
    auto c = h.submit("u3");
    ASSERT_TRUE(eventually([&] { return h.fetcher.calls == 1; }));
    h.fetcher.release();
    ASSERT_TRUE(h.sink.wait_terminal(3));

    std::lock_guard<std::mutex> lock(m);
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], sanitize_path_component(a.job_id));
    EXPECT_EQ(order[1], sanitize_path_component(b.job_id));
    EXPECT_EQ(order[2], sanitize_path_component(c.job_id));
}

TEST(Scheduler, DuplicateIdRejectedWhileLive) {
    Harness h(1);
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken& token,
                            const ProgressFn&, int) {
        return f.block_until_released(req, token);
    };
    auto& s = h.start();

    auto first = h.submit_with_id("alice", "clip-1");
    ASSERT_TRUE(first.admitted);
    ASSERT_TRUE(eventually([&] { return h.fetcher.active == 1; }));

    auto second = h.submit_with_id("bob", "clip-1");
    EXPECT_FALSE(second.admitted);
    EXPECT_EQ(second.queue_position, 0);
    EXPECT_EQ(h.sink.failed()["clip-1"].error_class, ErrorClass::InternalFault);
    EXPECT_EQ(h.quota->remaining("bob"), 20);

    // The running job is untouched and no second worker starts
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(h.fetcher.calls.load(), 1);
    EXPECT_EQ(h.gate->in_use(), 1);
    auto state = s.job_state("clip-1");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(*state, JobState::Fetching);

    h.fetcher.release();
    ASSERT_TRUE(eventually([&] { return h.sink.completed().count("clip-1") == 1; }));
    EXPECT_EQ(h.fetcher.max_active.load(), 1);
    EXPECT_EQ(s.stats().rejected, 1);

    // Once finished, the id may be used again
    ASSERT_TRUE(eventually([&] { return !s.job_state("clip-1").has_value(); }));
    EXPECT_TRUE(h.submit_with_id("alice", "clip-1").admitted);
}

TEST(Scheduler, SubmitsRacingShutdownAllGetOneOutcome) {
    Harness h(2, 1000);
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken& token,
                            const ProgressFn&, int) {
        return f.block_until_released(req, token);
    };
    auto& s = h.start();

    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    std::vector<std::thread> submitters;
    for (int t = 0; t < kThreads; ++t) {
        submitters.emplace_back([&h, t] {
            for (int i = 0; i < kPerThread; ++i) {
                h.submit_with_id("user" + std::to_string(t),
                                 "race-" + std::to_string(t) + "-" + std::to_string(i));
            }
        });
    }
    std::this_thread::sleep_for(2ms);
    s.shutdown();
    for (auto& th : submitters) th.join();

    ASSERT_TRUE(h.sink.wait_terminal(kThreads * kPerThread));
    auto failed = h.sink.failed();
    auto done = h.sink.completed();
    for (int t = 0; t < kThreads; ++t) {
        for (int i = 0; i < kPerThread; ++i) {
            auto id = "race-" + std::to_string(t) + "-" + std::to_string(i);
            EXPECT_EQ(failed.count(id) + done.count(id), 1u) << id;
        }
    }
    EXPECT_EQ(s.stats().pending, 0);
    EXPECT_EQ(s.stats().active, 0);
}

// ── Timeouts and retries ────────────────────────────────────

TEST(Scheduler, TimeoutRetriedThenFails) {
    Harness h;
    h.options.fetch_timeout = 60ms;
    h.fetcher.behavior = [](FakeFetcher&, const FetchRequest&, CancelToken& token,
                            const ProgressFn&, int) {
        token.wait();
        return FetchResult::Err(FetchError::Cancelled, "stopped");
    };
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));

    auto failed = h.sink.failed();
    ASSERT_EQ(failed.count(handle.job_id), 1u);
    EXPECT_EQ(failed[handle.job_id].error_class, ErrorClass::FetchTimeout);
    EXPECT_TRUE(failed[handle.job_id].user_may_retry);
    EXPECT_EQ(h.fetcher.calls.load(), 2);
}

TEST(Scheduler, TimeoutThenSuccessOnRetry) {
    Harness h;
    h.options.fetch_timeout = 60ms;
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken& token,
                            const ProgressFn&, int call) {
        if (call == 1) {
            token.wait();
            return FetchResult::Err(FetchError::Cancelled, "stopped");
        }
        return f.write_artifact(req);
    };
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    auto done = h.sink.completed();
    ASSERT_EQ(done.count(handle.job_id), 1u);
    EXPECT_EQ(done[handle.job_id].attempts, 2);
}

TEST(Scheduler, TimeoutWalksThroughTimedOutAndRetrying) {
    Harness h;
    h.options.fetch_timeout = 150ms;
    h.options.max_attempts = 3;
    h.options.retry_backoff = 40ms;
    h.fetcher.behavior = [](FakeFetcher&, const FetchRequest&, CancelToken& token,
                            const ProgressFn&, int) {
        token.wait();
        return FetchResult::Err(FetchError::Cancelled, "stopped");
    };
    auto& s = h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    EXPECT_EQ(h.sink.failed()[handle.job_id].error_class, ErrorClass::FetchTimeout);

    auto history = s.history(handle.job_id);
    std::vector<JobState> expected = {
        JobState::Fetching, JobState::TimedOut, JobState::Retrying,
        JobState::Fetching, JobState::TimedOut, JobState::Retrying,
        JobState::Fetching, JobState::TimedOut, JobState::Failed,
    };
    ASSERT_EQ(states_entered(history), expected);

    // Each attempt times out at its deadline, not before and not much after
    for (size_t i : {0u, 3u, 6u}) {
        auto waited = history[i + 1].at - history[i].at;
        EXPECT_GE(waited, h.options.fetch_timeout);
        EXPECT_LT(waited, h.options.fetch_timeout + 250ms);
    }

    // Backoff doubles: 40ms before the second attempt, 80ms before the third
    EXPECT_GE(history[3].at - history[2].at, h.options.retry_backoff);
    EXPECT_GE(history[6].at - history[5].at, 2 * h.options.retry_backoff);
    EXPECT_EQ(h.fetcher.calls.load(), 3);
}

TEST(Scheduler, SingleAttemptMeansNoRetry) {
    Harness h;
    h.options.max_attempts = 1;
    h.fetcher.behavior = [](FakeFetcher&, const FetchRequest&, CancelToken&,
                            const ProgressFn&, int) {
        return FetchResult::Err(FetchError::TransportFailure, "connection reset");
    };
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    EXPECT_EQ(h.sink.failed()[handle.job_id].error_class, ErrorClass::FetchFailed);
    EXPECT_EQ(h.fetcher.calls.load(), 1);
}

TEST(Scheduler, NotFoundIsNotRetried) {
    Harness h;
    h.fetcher.behavior = [](FakeFetcher&, const FetchRequest&, CancelToken&,
                            const ProgressFn&, int) {
        return FetchResult::Err(FetchError::NotFound, "Video is private");
    };
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    auto reason = h.sink.failed()[handle.job_id];
    EXPECT_EQ(reason.error_class, ErrorClass::FetchFailed);
    EXPECT_FALSE(reason.user_may_retry);
    EXPECT_NE(reason.message.find("Video is private"), std::string::npos);
    EXPECT_EQ(h.fetcher.calls.load(), 1);
}

TEST(Scheduler, IncompleteDownloadIsRetried) {
    Harness h;
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken&,
                            const ProgressFn&, int call) {
        FetchResult r = f.write_artifact(req);
        if (call == 1) r.artifact.content_length += 100;  // claims more than it wrote
        return r;
    };
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    ASSERT_EQ(h.sink.completed().count(handle.job_id), 1u);
    EXPECT_EQ(h.fetcher.calls.load(), 2);
}

TEST(Scheduler, EmptyFileCountsAsFailure) {
    Harness h;
    h.options.max_attempts = 1;
    h.fetcher.payload = "";
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    auto reason = h.sink.failed()[handle.job_id];
    EXPECT_EQ(reason.error_class, ErrorClass::FetchFailed);
    EXPECT_EQ(h.transfer.calls.load(), 0);
}

// ── Upload ──────────────────────────────────────────────────

TEST(Scheduler, UploadFailureIsNotRetried) {
    Harness h;
    h.transfer.error = TransferError::TransportFailure;
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    EXPECT_EQ(h.sink.failed()[handle.job_id].error_class, ErrorClass::UploadFailed);
    EXPECT_EQ(h.fetcher.calls.load(), 1);
    EXPECT_EQ(h.transfer.calls.load(), 1);
}

TEST(Scheduler, OversizedFileNeverUploaded) {
    Harness h;
    h.options.max_upload_bytes = 4;
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    auto reason = h.sink.failed()[handle.job_id];
    EXPECT_EQ(reason.error_class, ErrorClass::UploadFailed);
    EXPECT_TRUE(reason.user_may_retry);
    EXPECT_EQ(h.transfer.calls.load(), 0);
}

TEST(Scheduler, DestinationDefaultsToUser) {
    Harness h;
    h.start();
    Request r;
    r.user_id = "alice";
    r.source_url = "https://example.com/a.mp4";
    r.destination = "room-7";
    auto handle = h.scheduler->submit(r);
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));

    auto plain = h.submit("bob");
    ASSERT_TRUE(h.sink.wait_for_job(plain.job_id));

    auto dests = h.transfer.destinations();
    ASSERT_EQ(dests.size(), 2u);
    EXPECT_EQ(dests[0], "room-7");
    EXPECT_EQ(dests[1], "bob");
}

// ── Lookup ──────────────────────────────────────────────────

TEST(Scheduler, LookupRejectsLongVideo) {
    Harness h;
    h.options.max_duration_seconds = 7200;
    h.fetcher.lookup_enabled = true;
    h.fetcher.lookup_info.title = "Marathon";
    h.fetcher.lookup_info.duration_seconds = 9000;
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    auto reason = h.sink.failed()[handle.job_id];
    EXPECT_EQ(reason.error_class, ErrorClass::FetchFailed);
    EXPECT_FALSE(reason.user_may_retry);
    EXPECT_NE(reason.message.find("too long"), std::string::npos);
    EXPECT_EQ(h.fetcher.lookups.load(), 1);
    EXPECT_EQ(h.fetcher.calls.load(), 0);
}

TEST(Scheduler, LookupReportsUnavailableVideo) {
    Harness h;
    h.options.max_duration_seconds = 7200;
    h.fetcher.lookup_enabled = true;
    h.fetcher.lookup_info.available = false;
    h.fetcher.lookup_info.error_message = "Video is unavailable";
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    EXPECT_EQ(h.sink.failed()[handle.job_id].message, "Video is unavailable");
    EXPECT_EQ(h.fetcher.calls.load(), 0);
}

TEST(Scheduler, SlowMediaInfoTimesOutAndIsRetried) {
    Harness h;
    h.options.fetch_timeout = 60ms;
    h.options.max_duration_seconds = 7200;
    h.fetcher.lookup_enabled = true;
    h.fetcher.lookup_behavior = [](CancelToken& token, int) {
        token.wait();
        return Result<MediaInfo>::Err("stopped");
    };
    auto& s = h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    auto reason = h.sink.failed()[handle.job_id];
    EXPECT_EQ(reason.error_class, ErrorClass::FetchTimeout);
    EXPECT_TRUE(reason.user_may_retry);
    EXPECT_EQ(h.fetcher.lookups.load(), 2);
    EXPECT_EQ(h.fetcher.calls.load(), 0);

    auto states = states_entered(s.history(handle.job_id));
    std::vector<JobState> expected = {
        JobState::Fetching, JobState::TimedOut, JobState::Retrying,
        JobState::Fetching, JobState::TimedOut, JobState::Failed,
    };
    EXPECT_EQ(states, expected);
}

TEST(Scheduler, MediaInfoErrorIsRetried) {
    Harness h;
    h.options.max_duration_seconds = 7200;
    h.fetcher.lookup_enabled = true;
    h.fetcher.lookup_behavior = [](CancelToken&, int call) {
        if (call == 1) return Result<MediaInfo>::Err("HTTP Error 429: Too Many Requests");
        MediaInfo info;
        info.title = "Short";
        info.duration_seconds = 60;
        return Result<MediaInfo>::Ok(info);
    };
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    auto done = h.sink.completed();
    ASSERT_EQ(done.count(handle.job_id), 1u);
    EXPECT_EQ(done[handle.job_id].attempts, 2);
    EXPECT_EQ(h.fetcher.lookups.load(), 2);
    EXPECT_EQ(h.fetcher.calls.load(), 1);
}

TEST(Scheduler, MediaInfoReadOnceAcrossFetchRetries) {
    Harness h;
    h.options.max_duration_seconds = 7200;
    h.fetcher.lookup_enabled = true;
    h.fetcher.lookup_info.duration_seconds = 60;
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken&,
                            const ProgressFn&, int call) {
        if (call == 1) return FetchResult::Err(FetchError::TransportFailure, "connection reset");
        return f.write_artifact(req);
    };
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    EXPECT_EQ(h.sink.completed().count(handle.job_id), 1u);
    EXPECT_EQ(h.fetcher.lookups.load(), 1);
    EXPECT_EQ(h.fetcher.calls.load(), 2);
}

TEST(Scheduler, LookupSkippedWhenLimitDisabled) {
    Harness h;
    h.options.max_duration_seconds = 0;
    h.fetcher.lookup_enabled = true;
    h.fetcher.lookup_info.duration_seconds = 99999;
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    EXPECT_EQ(h.sink.completed().count(handle.job_id), 1u);
    EXPECT_EQ(h.fetcher.lookups.load(), 0);
}

// ── Cancellation ────────────────────────────────────────────

TEST(Scheduler, CancelRunningJob) {
    Harness h;
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken& token,
                            const ProgressFn&, int) {
        write_file((req.output_dir / (req.file_stem + ".part")).string(), "partial");
        return f.block_until_released(req, token);
    };
    auto& s = h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(eventually([&] { return h.fetcher.active == 1; }));

    auto r = s.cancel(handle.job_id);
    EXPECT_TRUE(r.is_ok()) << r.error;
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));

    auto reason = h.sink.failed()[handle.job_id];
    EXPECT_EQ(reason.error_class, ErrorClass::Cancelled);
    EXPECT_EQ(reason.message, "Download cancelled");
    EXPECT_EQ(h.fetcher.calls.load(), 1);
    EXPECT_TRUE(eventually([&] { return h.gate->in_use() == 0; }));
    EXPECT_FALSE(fs::exists(h.dir.path / (sanitize_path_component(handle.job_id) + ".part")));
}

TEST(Scheduler, CancelQueuedJobNeverFetches) {
    Harness h(1);
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken& token,
                            const ProgressFn&, int) {
        return f.block_until_released(req, token);
    };
    auto& s = h.start();

    auto first = h.submit("alice");
    ASSERT_TRUE(eventually([&] { return h.fetcher.active == 1; }));
    auto second = h.submit("bob");

    auto r = s.cancel(second.job_id);
    EXPECT_TRUE(r.is_ok()) << r.error;
    ASSERT_TRUE(h.sink.wait_for_job(second.job_id));
    EXPECT_EQ(h.sink.failed()[second.job_id].error_class, ErrorClass::Cancelled);
    EXPECT_EQ(h.fetcher.calls.load(), 1);

    h.fetcher.release();
    ASSERT_TRUE(h.sink.wait_for_job(first.job_id));
    EXPECT_EQ(h.sink.completed().count(first.job_id), 1u);
    EXPECT_EQ(h.fetcher.calls.load(), 1);
}

TEST(Scheduler, CancelUnknownJobFails) {
    Harness h;
    auto& s = h.start();
    EXPECT_TRUE(s.cancel("no-such-job").is_err());
}

TEST(Scheduler, CancelTwiceFails) {
    Harness h;
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken& token,
                            const ProgressFn&, int) {
        return f.block_until_released(req, token);
    };
    auto& s = h.start();
    auto handle = h.submit("alice");
    ASSERT_TRUE(eventually([&] { return h.fetcher.active == 1; }));

    EXPECT_TRUE(s.cancel(handle.job_id).is_ok());
    EXPECT_TRUE(s.cancel(handle.job_id).is_err());
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
}

TEST(Scheduler, ShutdownCancelsRunningAndRejectsNew) {
    Harness h;
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken& token,
                            const ProgressFn&, int) {
        return f.block_until_released(req, token);
    };
    auto& s = h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(eventually([&] { return h.fetcher.active == 1; }));

    s.shutdown();
    auto failed = h.sink.failed();
    ASSERT_EQ(failed.count(handle.job_id), 1u);
    EXPECT_EQ(failed[handle.job_id].error_class, ErrorClass::Cancelled);
    EXPECT_EQ(failed[handle.job_id].message, "Service is shutting down");

    auto late = h.submit("bob");
    EXPECT_FALSE(late.admitted);
    EXPECT_EQ(h.sink.failed()[late.job_id].error_class, ErrorClass::Cancelled);

    s.shutdown();  // idempotent
}

TEST(Scheduler, ShutdownFailsQueuedJobs) {
    Harness h(1);
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken& token,
                            const ProgressFn&, int) {
        return f.block_until_released(req, token);
    };
    auto& s = h.start();

    auto a = h.submit("u1");
    ASSERT_TRUE(eventually([&] { return h.fetcher.active == 1; }));
    auto b = h.submit("u2");
    auto c = h.submit("u3");

    s.shutdown();
    auto failed = h.sink.failed();
    EXPECT_EQ(failed.size(), 3u);
    for (const auto& id : {a.job_id, b.job_id, c.job_id}) {
        ASSERT_EQ(failed.count(id), 1u);
        EXPECT_EQ(failed[id].error_class, ErrorClass::Cancelled);
    }
    EXPECT_EQ(h.fetcher.calls.load(), 1);
}

// ── Faults ──────────────────────────────────────────────────

TEST(Scheduler, FetcherExceptionBecomesInternalFault) {
    Harness h(1);
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken&,
                            const ProgressFn&, int call) -> FetchResult {
        if (call == 1) throw std::runtime_error("boom");
        return f.write_artifact(req);
    };
    h.start();

    auto bad = h.submit("alice");
    auto good = h.submit("bob");
    ASSERT_TRUE(h.sink.wait_terminal(2));

    auto reason = h.sink.failed()[bad.job_id];
    EXPECT_EQ(reason.error_class, ErrorClass::InternalFault);
    EXPECT_NE(reason.message.find("boom"), std::string::npos);
    // The slot was returned, so the next job ran
    EXPECT_EQ(h.sink.completed().count(good.job_id), 1u);
}

// ── Progress ────────────────────────────────────────────────

TEST(Scheduler, ProgressIsCoalescedAndMonotonic) {
    Harness h;
    h.fetcher.behavior = [](FakeFetcher& f, const FetchRequest& req, CancelToken&,
                            const ProgressFn& progress, int) {
        for (int p = 0; p <= 100; ++p) progress(p);
        for (int p = 50; p >= 0; p -= 10) progress(p);  // regressions are dropped
        return f.write_artifact(req);
    };
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));

    auto seen = h.sink.progress(handle.job_id);
    ASSERT_FALSE(seen.empty());
    EXPECT_LE(seen.size(), 11u);
    for (size_t i = 1; i < seen.size(); ++i) EXPECT_GT(seen[i], seen[i - 1]);
    for (int p : seen) EXPECT_LT(p, 100);
    EXPECT_GE(seen.back(), PROGRESS_TRANSCODE_END);
}

// ── Retention ───────────────────────────────────────────────

TEST(Scheduler, FileReleasedAfterUpload) {
    Harness h;
    h.options.release_after_upload = true;
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    auto path = h.dir.path / (sanitize_path_component(handle.job_id) + ".mp4");
    EXPECT_TRUE(eventually([&] { return !fs::exists(path); }));
    EXPECT_TRUE(eventually([&] { return h.retention->tracked().empty(); }));
}

TEST(Scheduler, FileRetainedUntilDeadline) {
    Harness h;
    h.options.release_after_upload = false;
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    auto path = (h.dir.path / (sanitize_path_component(handle.job_id) + ".mp4")).string();

    // Counters move after the file is handed to retention
    ASSERT_TRUE(eventually([&] { return h.scheduler->stats().completed == 1; }));
    EXPECT_TRUE(h.retention->is_tracked(path));
    EXPECT_TRUE(fs::exists(path));
    auto records = h.retention->tracked();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].owner_job_id, handle.job_id);
    EXPECT_EQ(records[0].refs, 0);
}

TEST(Scheduler, FailedJobFileRemovedAtOnce) {
    Harness h;
    h.options.release_after_upload = false;
    h.transfer.error = TransferError::TransportFailure;
    h.start();

    auto handle = h.submit("alice");
    ASSERT_TRUE(h.sink.wait_for_job(handle.job_id));
    auto path = h.dir.path / (sanitize_path_component(handle.job_id) + ".mp4");
    EXPECT_TRUE(eventually([&] { return !fs::exists(path); }));
}

// ── Options ─────────────────────────────────────────────────

TEST(SchedulerOptions, FromConfig) {
    Config cfg = Config::defaults();
    cfg.downloads().max_resolution = Resolution::P720;
    cfg.downloads().timeout_seconds = 90;
    cfg.downloads().max_attempts = 3;
    cfg.cleanup().after_minutes = 5;
    cfg.progress().step_percent = 20;

    auto o = SchedulerOptions::from_config(cfg);
    EXPECT_EQ(o.max_resolution, Resolution::P720);
    EXPECT_EQ(o.fetch_timeout, std::chrono::milliseconds(90000));
    EXPECT_EQ(o.max_attempts, 3);
    EXPECT_EQ(o.cleanup_after, std::chrono::seconds(300));
    EXPECT_EQ(o.progress_step_percent, 20);
    EXPECT_EQ(o.download_dir, cfg.downloads().path);
    EXPECT_EQ(o.watchdog_tick, std::chrono::milliseconds(WATCHDOG_TICK_MS));
}
