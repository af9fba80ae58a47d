#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), or the temp directory if unset.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// A fresh path in the temp directory with the given prefix. The file is not created.
std::filesystem::path temp_file(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
