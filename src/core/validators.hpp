#pragma once

#include <optional>
#include <string>
#include <vector>

// 11-character YouTube video id from any watch, embed, shorts, /v/ or youtu.be form.
std::optional<std::string> extract_video_id(const std::string& url);

// https://www.youtube.com/watch?v=<id>, or nullopt if the URL is not a YouTube video.
std::optional<std::string> normalize_youtube_url(const std::string& url);

// http(s) URL whose path ends in a known media extension (.mp4, .webm, .mkv, .mov, .m4v).
bool is_direct_media_url(const std::string& url);

// Every supported URL in free-form text, in order of appearance, deduplicated.
// YouTube links are normalized; direct media links are kept as written.
// Scheme-less links ("youtu.be/...") get https:// prepended.
std::vector<std::string> extract_urls(const std::string& text);
