#pragma once

#include <string>
#include <chrono>
#include <cstdint>

// Format a duration in seconds as "2h35m", "14m22s" or "8s". Negative input gives "-".
std::string format_duration(int seconds);

// Same as format_duration, rounded down from milliseconds.
std::string format_elapsed(std::chrono::milliseconds elapsed);

// Format a byte count as "512B", "14.2KB", "3.5MB" or "1.2GB".
std::string format_bytes(int64_t bytes);

// Minutes until a duration elapses, rounded up ("please wait N minutes").
int minutes_ceil(std::chrono::seconds s);
