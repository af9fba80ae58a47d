#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <core/types.hpp>
#include "cancel_token.hpp"

// Phase-local progress, 0-100.
using ProgressFn = std::function<void(double percent)>;

// ── Fetch ───────────────────────────────────────────────────

enum class FetchError {
    None,
    NotFound,
    RateLimited,
    Timeout,
    Unsupported,
    TransportFailure,
    Cancelled,
};

const char* fetch_error_name(FetchError e);

struct FetchRequest {
    std::string url;
    Resolution max_resolution = Resolution::P1080;
    TimePoint deadline{};
    std::filesystem::path output_dir;
    std::string file_stem;        // unique per job; the fetcher picks the extension
};

struct FetchResult {
    FetchError error = FetchError::None;
    std::string message;
    LocalArtifact artifact;

    bool ok() const { return error == FetchError::None; }

    static FetchResult Ok(LocalArtifact a) { return {FetchError::None, "", std::move(a)}; }
    static FetchResult Err(FetchError e, std::string msg) { return {e, std::move(msg), {}}; }
};

// Pulls media from a remote source into a local file. Implementations must
// return promptly (Cancelled or Timeout) once the token is cancelled.
class SourceFetcher {
public:
    virtual ~SourceFetcher() = default;

    virtual FetchResult fetch(const FetchRequest& req, CancelToken& token,
                              const ProgressFn& on_progress) = 0;

    // Metadata lookup before downloading. Optional.
    virtual bool supports_lookup() const { return false; }
    virtual Result<MediaInfo> lookup(const std::string& url, CancelToken& token) {
        (void)url;
        (void)token;
        return Result<MediaInfo>::Err("media lookup not supported");
    }
};

// ── Transcode ───────────────────────────────────────────────

class Transcoder {
public:
    virtual ~Transcoder() = default;

    // Produce a new artifact at most `target` tall in `container`.
    virtual Result<LocalArtifact> transcode(const LocalArtifact& input, Resolution target,
                                            const std::string& container, CancelToken& token,
                                            const ProgressFn& on_progress) = 0;
};

// ── Transfer out ────────────────────────────────────────────

enum class TransferError {
    None,
    TooLarge,
    TransportFailure,
    Cancelled,
};

const char* transfer_error_name(TransferError e);

struct TransferResult {
    TransferError error = TransferError::None;
    std::string message;
    std::string delivery_ref;     // acknowledgment reference (path, message id, ...)

    bool ok() const { return error == TransferError::None; }

    static TransferResult Ok(std::string ref) { return {TransferError::None, "", std::move(ref)}; }
    static TransferResult Err(TransferError e, std::string msg) { return {e, std::move(msg), ""}; }
};

// Delivers a finished artifact to a destination. A successful return is the
// acknowledgment; the artifact may be deleted afterwards.
class TransferOut {
public:
    virtual ~TransferOut() = default;

    virtual TransferResult send(const LocalArtifact& artifact, const std::string& destination,
                                CancelToken& token, const ProgressFn& on_progress) = 0;
};

// ── Notifications ───────────────────────────────────────────

class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void on_progress(const std::string& job_id, int percent) = 0;
    virtual void on_complete(const std::string& job_id, const JobSummary& summary) = 0;
    virtual void on_failed(const std::string& job_id, const FailureReason& reason) = 0;
};

const char* error_class_name(ErrorClass c);
