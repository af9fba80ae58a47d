#include "utils.hpp"
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <ctime>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        return pos == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string generate_job_id() {
    static std::atomic<unsigned> seq{0};

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y%m%d-%H%M%S", &tm_buf);
    return fmt::format("{}-{:03d}-{:04d}", ts, static_cast<int>(ms.count()),
                       (seq.fetch_add(1) + 1) % 10000);
}

std::string sanitize_path_component(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        out += ok ? c : '_';
    }
    // Never produce "." or ".." as a directory name
    if (out.empty() || out == "." || out == "..") out = "_";
    return out;
}
