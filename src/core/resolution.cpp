#include "resolution.hpp"
#include <fmt/format.h>
#include <cctype>

const std::vector<Resolution>& all_resolutions() {
    static const std::vector<Resolution> all = {
        Resolution::P360, Resolution::P480, Resolution::P720,
        Resolution::P1080, Resolution::P1440, Resolution::P2160,
    };
    return all;
}

std::optional<Resolution> resolution_from_height(int height) {
    for (auto r : all_resolutions()) {
        if (static_cast<int>(r) == height) return r;
    }
    return std::nullopt;
}

std::optional<Resolution> parse_resolution(const std::string& s) {
    if (s.empty()) return std::nullopt;

    // Find where the numeric part ends
    size_t i = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) i++;
    if (i == 0) return std::nullopt;

    std::string suffix = s.substr(i);
    if (!suffix.empty() && suffix != "p" && suffix != "P") return std::nullopt;

    int height = 0;
    try {
        height = std::stoi(s.substr(0, i));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return resolution_from_height(height);
}

std::string resolution_label(Resolution r) {
    return fmt::format("{}p", static_cast<int>(r));
}

Resolution clamp_resolution(Resolution requested, Resolution ceiling) {
    return static_cast<int>(requested) > static_cast<int>(ceiling) ? ceiling : requested;
}
