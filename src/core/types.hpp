#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <chrono>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

// Injectable time source. Components default to SteadyClock::now; tests pass a manual clock.
using NowFn = std::function<TimePoint()>;

inline NowFn steady_now() {
    return [] { return SteadyClock::now(); };
}

// ── Media ───────────────────────────────────────────────────

enum class Resolution : int {
    P360  = 360,
    P480  = 480,
    P720  = 720,
    P1080 = 1080,
    P1440 = 1440,
    P2160 = 2160,
};

// One user request. Immutable once the scheduler has accepted it.
struct Request {
    std::string request_id;   // generated by the scheduler when empty
    std::string user_id;
    std::string source_url;
    Resolution requested_resolution = Resolution::P1080;
    std::string destination;  // channel the result is delivered to
    std::chrono::system_clock::time_point submitted_at{};
};

// A file produced by a fetch or transcode.
struct LocalArtifact {
    std::string path;
    int64_t content_length = 0;   // bytes reported by the source, 0 if unknown
    std::string title;
    int duration_seconds = 0;
    int height = 0;               // 0 if unknown
    std::string container;        // "mp4", "webm", ...
};

struct MediaInfo {
    std::string title;
    int duration_seconds = 0;
    bool available = true;
    std::string error_message;
};

// ── Errors ──────────────────────────────────────────────────

enum class ErrorClass {
    QuotaExceeded,
    CapacityFull,
    FetchTimeout,
    FetchFailed,
    UploadFailed,
    Cancelled,
    InternalFault,
};

struct FailureReason {
    ErrorClass error_class = ErrorClass::InternalFault;
    std::string message;
    bool user_may_retry = false;
};

// Delivered with NotificationSink::on_complete.
struct JobSummary {
    std::string job_id;
    std::string title;
    int64_t bytes = 0;
    int duration_seconds = 0;
    Resolution resolution = Resolution::P1080;
    int attempts = 0;
    std::chrono::milliseconds elapsed{0};
    std::string delivery_ref;     // transfer acknowledgment reference
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
