#pragma once

#include <optional>
#include <string>
#include <managers/capabilities.hpp>

// SourceFetcher backed by the yt-dlp executable.
class YtDlpFetcher : public SourceFetcher {
public:
    explicit YtDlpFetcher(std::string ytdlp_path = "yt-dlp");

    FetchResult fetch(const FetchRequest& req, CancelToken& token,
                      const ProgressFn& on_progress) override;

    bool supports_lookup() const override { return true; }
    Result<MediaInfo> lookup(const std::string& url, CancelToken& token) override;

    // Format selector capped at `height`, mp4 first, then any container.
    static std::string format_selector(int height);

    // "[download]  42.3% of ..." -> 42.3
    static std::optional<double> parse_progress_line(const std::string& line);

    // Seconds from yt-dlp's duration field, clamped to int range. "NA",
    // garbage, negative values and NaN give 0.
    static int parse_duration(const std::string& text);

    // Map yt-dlp's stderr to an error class and a short user-facing message.
    static FetchError classify_error(const std::string& stderr_text, std::string& message);

private:
    std::string ytdlp_path_;
};
