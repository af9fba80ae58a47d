#pragma once

#include <string>
#include <cstdint>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Unique job id: "20260215-144410-637-0007" (local time, millis, process-wide sequence).
std::string generate_job_id();

// Replace anything outside [A-Za-z0-9._-] with '_' so the value is safe as a
// single path component. Empty input becomes "_".
std::string sanitize_path_component(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
