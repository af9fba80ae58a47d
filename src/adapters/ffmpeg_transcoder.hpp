#pragma once

#include <optional>
#include <string>
#include <managers/capabilities.hpp>

// Transcoder that scales down with the ffmpeg executable (libx264 + aac).
class FfmpegTranscoder : public Transcoder {
public:
    explicit FfmpegTranscoder(std::string ffmpeg_path = "ffmpeg");

    Result<LocalArtifact> transcode(const LocalArtifact& input, Resolution target,
                                    const std::string& container, CancelToken& token,
                                    const ProgressFn& on_progress) override;

    // Percent from one "-progress" line ("out_time_us=12345678") given the
    // total duration. nullopt for other keys or an unknown duration.
    static std::optional<double> parse_progress_line(const std::string& line,
                                                     int duration_seconds);

private:
    std::string ffmpeg_path_;
};
