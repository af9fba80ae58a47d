#include "relay_log.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

namespace {

struct LogState {
    std::mutex mutex;
    fs::path path = platform::temp_dir() / "vrelay_debug.log";
    int64_t max_bytes = DEFAULT_LOG_MAX_BYTES;
    int backups = DEFAULT_LOG_BACKUPS;
};

LogState& state() {
    static LogState s;
    return s;
}

// Caller holds the mutex. Shifts .N-1 -> .N ... active -> .1
void rotate_if_needed(LogState& s) {
    if (s.max_bytes <= 0) return;
    std::error_code ec;
    auto size = fs::file_size(s.path, ec);
    if (ec || static_cast<int64_t>(size) < s.max_bytes) return;

    if (s.backups <= 0) {
        fs::remove(s.path, ec);
        return;
    }
    auto numbered = [&](int n) {
        return fs::path(s.path.string() + "." + std::to_string(n));
    };
    fs::remove(numbered(s.backups), ec);
    for (int i = s.backups - 1; i >= 1; --i) {
        if (fs::exists(numbered(i), ec)) fs::rename(numbered(i), numbered(i + 1), ec);
    }
    fs::rename(s.path, numbered(1), ec);
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", tm_buf.tm_hour, tm_buf.tm_min,
                       tm_buf.tm_sec, static_cast<int>(ms.count()));
}

} // namespace

std::string relay_log_path() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.path.string();
}

void configure_relay_log(const fs::path& path, int64_t max_bytes, int backups) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!path.empty()) {
        std::error_code ec;
        if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
        s.path = path;
    }
    s.max_bytes = max_bytes;
    s.backups = backups;
}

void relay_log(const std::string& msg) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    rotate_if_needed(s);

    std::ofstream out(s.path, std::ios::app);
    if (!out) return;
    out << "[" << timestamp() << "] " << msg << "\n";
}
