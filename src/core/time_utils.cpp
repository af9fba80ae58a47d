#include "time_utils.hpp"
#include <fmt/format.h>

std::string format_duration(int seconds) {
    if (seconds < 0) return "-";

    int hours = seconds / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_elapsed(std::chrono::milliseconds elapsed) {
    return format_duration(static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()));
}

std::string format_bytes(int64_t bytes) {
    if (bytes < 1024) return fmt::format("{}B", bytes);
    double kb = bytes / 1024.0;
    if (kb < 1024.0) return fmt::format("{:.1f}KB", kb);
    double mb = kb / 1024.0;
    if (mb < 1024.0) return fmt::format("{:.1f}MB", mb);
    return fmt::format("{:.1f}GB", mb / 1024.0);
}

int minutes_ceil(std::chrono::seconds s) {
    if (s.count() <= 0) return 0;
    return static_cast<int>((s.count() + 59) / 60);
}
