#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

// Where relay_log writes. Defaults to <temp>/vrelay_debug.log until configured.
std::string relay_log_path();

// Redirect the debug log. Rotation keeps `backups` old files (.1 .. .N) once
// the active file grows past `max_bytes`. max_bytes <= 0 disables rotation.
void configure_relay_log(const std::filesystem::path& path, int64_t max_bytes, int backups);

// Append "[HH:MM:SS.mmm] msg" to the debug log. Thread-safe; never throws.
void relay_log(const std::string& msg);
