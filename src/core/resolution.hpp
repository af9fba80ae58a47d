#pragma once

#include <string>
#include <optional>
#include <vector>
#include <core/types.hpp>

// All supported resolutions in ascending order.
const std::vector<Resolution>& all_resolutions();

// Parse "1080", "1080p" or "1080P". Returns nullopt for anything not in the enum.
std::optional<Resolution> parse_resolution(const std::string& s);

// Map a pixel height to the enum. Returns nullopt for unsupported heights.
std::optional<Resolution> resolution_from_height(int height);

inline int resolution_height(Resolution r) { return static_cast<int>(r); }

// "1080p"
std::string resolution_label(Resolution r);

// Clamp a requested resolution down to the configured ceiling. Never raises it.
Resolution clamp_resolution(Resolution requested, Resolution ceiling);
