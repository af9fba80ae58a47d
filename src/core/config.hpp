#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <functional>
#include <cstdint>
#include "types.hpp"

namespace fs = std::filesystem;

// Configuration structures
struct DownloadConfig {
    fs::path path;                         // working directory for fetched files
    int concurrent = 3;                    // CONCURRENT_DOWNLOADS
    Resolution max_resolution = Resolution::P1080;
    int timeout_seconds = 1800;            // DOWNLOAD_TIMEOUT
    int max_attempts = 2;                  // fetch attempts including the first
    int retry_backoff_ms = 2000;           // first backoff, doubled per retry
    int max_duration_seconds = 7200;       // 0 disables the length check
    std::string backend = "ytdlp";         // "ytdlp" or "http"
    std::string ytdlp_path = "yt-dlp";
};

struct CleanupConfig {
    int after_minutes = 30;                // CLEANUP_AFTER_MINUTES
    int sweep_interval_seconds = 60;
    bool release_after_upload = true;      // delete as soon as the upload is acknowledged
};

struct QuotaConfig {
    int max_per_user = 20;                 // MAX_DOWNLOADS_PER_USER
    int window_minutes = 60;
};

struct UploadConfig {
    int64_t max_bytes = 2LL * 1024 * 1024 * 1024;
    std::string backend = "directory";     // "directory" or "command"
    fs::path outbox;
    std::string command;                   // template with {file} {destination} {title}
};

struct TranscodeConfig {
    bool enabled = false;
    std::string ffmpeg_path = "ffmpeg";
    std::string container = "mp4";
};

struct ProgressConfig {
    int step_percent = 10;
    int min_interval_ms = 1000;
};

struct LogConfig {
    fs::path path;
    int64_t max_bytes = 5LL * 1024 * 1024;
    int backups = 3;
};

// Looks up an environment variable. Returns nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_env();

class Config {
public:
    // Defaults, then ~/.vrelay/config.yaml (or `path`) if it exists, then the environment.
    static Result<Config> load(const fs::path& path = fs::path(),
                               const EnvLookup& env = process_env());

    // Defaults overlaid with a YAML document. No environment, no validation.
    static Result<Config> from_yaml(const std::string& text);

    // Built-in defaults with paths resolved under the home directory.
    static Config defaults();

    // Overlay CONCURRENT_DOWNLOADS, MAX_VIDEO_RESOLUTION, DOWNLOAD_TIMEOUT,
    // CLEANUP_AFTER_MINUTES, MAX_DOWNLOADS_PER_USER, RATE_LIMIT_WINDOW_MINUTES,
    // DOWNLOAD_PATH and DOWNLOAD_RETRIES.
    Result<void> apply_env(const EnvLookup& env);

    // Range checks. The error names the offending key.
    Result<void> validate() const;

    // Human-readable dump for `vrelay config`
    std::string describe() const;

    // Accessors
    const DownloadConfig& downloads() const { return downloads_; }
    const CleanupConfig& cleanup() const { return cleanup_; }
    const QuotaConfig& quota() const { return quota_; }
    const UploadConfig& upload() const { return upload_; }
    const TranscodeConfig& transcode() const { return transcode_; }
    const ProgressConfig& progress() const { return progress_; }
    const LogConfig& log() const { return log_; }
    const fs::path& source_path() const { return source_path_; }

    DownloadConfig& downloads() { return downloads_; }
    CleanupConfig& cleanup() { return cleanup_; }
    QuotaConfig& quota() { return quota_; }
    UploadConfig& upload() { return upload_; }
    TranscodeConfig& transcode() { return transcode_; }
    ProgressConfig& progress() { return progress_; }
    LogConfig& log() { return log_; }

public:
    Config() = default;

private:
    DownloadConfig downloads_;
    CleanupConfig cleanup_;
    QuotaConfig quota_;
    UploadConfig upload_;
    TranscodeConfig transcode_;
    ProgressConfig progress_;
    LogConfig log_;
    fs::path source_path_;

    friend class ConfigParser;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Write the commented default config. Never overwrites an existing file.
Result<void> create_default_config(const fs::path& path = get_config_path());
