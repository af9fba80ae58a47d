#include "validators.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

static const std::regex& youtube_regex() {
    static const std::regex re(
        R"((?:https?://)?(?:(?:www\.|m\.)?youtube\.com/(?:watch\?(?:[^\s#]*&)?v=|v/|embed/|shorts/)|youtu\.be/)([a-zA-Z0-9_-]{11}))",
        std::regex::icase);
    return re;
}

// Anything that looks like a link; filtered afterwards
static const std::regex& candidate_regex() {
    static const std::regex re(
        R"(https?://[^\s<>"{}|\\^`\[\]]+|(?:www\.|m\.)?youtube\.com/[^\s<>"{}|\\^`\[\]]+|youtu\.be/[^\s<>"{}|\\^`\[\]]+)",
        std::regex::icase);
    return re;
}

std::optional<std::string> extract_video_id(const std::string& url) {
    std::smatch m;
    if (std::regex_search(url, m, youtube_regex())) return m[1].str();
    return std::nullopt;
}

std::optional<std::string> normalize_youtube_url(const std::string& url) {
    auto id = extract_video_id(url);
    if (!id) return std::nullopt;
    return "https://www.youtube.com/watch?v=" + *id;
}

bool is_direct_media_url(const std::string& url) {
    std::string lower = url;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.rfind("http://", 0) != 0 && lower.rfind("https://", 0) != 0) return false;

    // Strip query and fragment before looking at the extension
    auto cut = lower.find_first_of("?#");
    std::string path = lower.substr(0, cut);
    for (const char* ext : {".mp4", ".webm", ".mkv", ".mov", ".m4v"}) {
        std::string e(ext);
        if (path.size() > e.size() && path.compare(path.size() - e.size(), e.size(), e) == 0) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> extract_urls(const std::string& text) {
    std::vector<std::string> out;
    auto begin = std::sregex_iterator(text.begin(), text.end(), candidate_regex());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        std::string url = it->str();
        // Trailing punctuation from prose
        while (!url.empty() && std::string(".,;:!?)'").find(url.back()) != std::string::npos) {
            url.pop_back();
        }
        if (url.rfind("http", 0) != 0) url = "https://" + url;

        std::string found;
        if (auto yt = normalize_youtube_url(url)) found = *yt;
        else if (is_direct_media_url(url)) found = url;
        else continue;

        if (std::find(out.begin(), out.end(), found) == out.end()) out.push_back(found);
    }
    return out;
}
