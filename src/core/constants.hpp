#pragma once

#include <cstdint>

// ── Defaults ────────────────────────────────────────────────
// Used when neither config.yaml nor the environment sets a value.
constexpr int DEFAULT_CONCURRENT_DOWNLOADS   = 3;
constexpr int DEFAULT_MAX_RESOLUTION         = 1080;
constexpr int DEFAULT_DOWNLOAD_TIMEOUT_SECS  = 1800;   // 30 min
constexpr int DEFAULT_MAX_ATTEMPTS           = 2;      // first try + one retry
constexpr int DEFAULT_RETRY_BACKOFF_MS       = 2000;   // doubles per attempt
constexpr int DEFAULT_MAX_DURATION_SECS      = 7200;   // 2 hours
constexpr int DEFAULT_CLEANUP_AFTER_MINUTES  = 30;
constexpr int DEFAULT_SWEEP_INTERVAL_SECS    = 60;
constexpr int DEFAULT_MAX_PER_USER           = 20;
constexpr int DEFAULT_QUOTA_WINDOW_MINUTES   = 60;
constexpr int64_t DEFAULT_MAX_UPLOAD_BYTES   = 2LL * 1024 * 1024 * 1024;  // 2 GB

// ── Progress coalescing ─────────────────────────────────────
constexpr int DEFAULT_PROGRESS_STEP_PERCENT  = 10;
constexpr int DEFAULT_PROGRESS_INTERVAL_MS   = 1000;

// Overall percent ranges per phase (fetch 0-60, transcode 60-70, upload 70-100)
constexpr int PROGRESS_FETCH_END             = 60;
constexpr int PROGRESS_TRANSCODE_END         = 70;

// ── Scheduler internals ─────────────────────────────────────
constexpr int WATCHDOG_TICK_MS               = 50;     // deadline check granularity
constexpr int QUOTA_EVICT_EVERY_TICKS        = 1200;   // ~1 min at 50ms ticks
constexpr int QUOTA_EVICT_GRACE_MINUTES      = 10;
constexpr int SUBPROCESS_POLL_MS             = 100;
constexpr int FINISHED_HISTORY_JOBS          = 64;     // transition logs kept after a job ends

// ── Logging ─────────────────────────────────────────────────
constexpr int64_t DEFAULT_LOG_MAX_BYTES      = 5LL * 1024 * 1024;  // 5 MB
constexpr int DEFAULT_LOG_BACKUPS            = 3;

// ── Transfer ────────────────────────────────────────────────
constexpr int64_t TRANSFER_CHUNK_BYTES       = 1024 * 1024;  // 1 MB

constexpr const char* VRELAY_VERSION         = "0.4.0";
