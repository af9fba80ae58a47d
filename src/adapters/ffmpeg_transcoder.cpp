#include "ffmpeg_transcoder.hpp"
#include <managers/relay_log.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <core/constants.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

FfmpegTranscoder::FfmpegTranscoder(std::string ffmpeg_path)
    : ffmpeg_path_(std::move(ffmpeg_path)) {}

std::optional<double> FfmpegTranscoder::parse_progress_line(const std::string& line,
                                                            int duration_seconds) {
    if (duration_seconds <= 0) return std::nullopt;
    // out_time_ms is also microseconds in ffmpeg's output; accept either key
    std::string value;
    for (const char* key : {"out_time_us=", "out_time_ms="}) {
        std::string k(key);
        if (line.rfind(k, 0) == 0) {
            value = line.substr(k.size());
            break;
        }
    }
    if (value.empty() || value == "N/A") return std::nullopt;
    try {
        double us = std::stod(value);
        double pct = 100.0 * us / (static_cast<double>(duration_seconds) * 1e6);
        return std::min(std::max(pct, 0.0), 100.0);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Result<LocalArtifact> FfmpegTranscoder::transcode(const LocalArtifact& input, Resolution target,
                                                  const std::string& container,
                                                  CancelToken& token,
                                                  const ProgressFn& on_progress) {
    int height = static_cast<int>(target);
    std::string ext = container.empty() ? "mp4" : container;
    fs::path in_path(input.path);
    fs::path out_path = in_path.parent_path() /
                        fmt::format("{}.{}p.{}", in_path.stem().string(), height, ext);

    std::vector<std::string> args = {
        "-y", "-hide_banner", "-nostdin", "-nostats",
        "-i", input.path,
        "-vf", fmt::format("scale=-2:'min({},ih)'", height),
        "-c:v", "libx264", "-preset", "veryfast", "-crf", "23",
        "-c:a", "aac", "-b:a", "128k",
        "-movflags", "+faststart",
        "-progress", "pipe:1",
        out_path.string(),
    };

    std::string out_log = platform::temp_file("vrelay_ffmpeg_out").string();
    std::string err_log = platform::temp_file("vrelay_ffmpeg_err").string();

    relay_log(fmt::format("ffmpeg: {} -> {} ({}p)", input.path, out_path.string(), height));
    auto proc = platform::spawn(ffmpeg_path_, args, out_log, err_log);
    if (!proc.valid()) return Result<LocalArtifact>::Err("Failed to start " + ffmpeg_path_);

    std::ifstream tail;
    std::string pending;
    while (proc.running()) {
        if (token.stop_requested()) {
            proc.terminate();
            break;
        }
        if (!tail.is_open()) tail.open(out_log);
        if (tail.is_open()) {
            tail.clear();
            std::string line;
            while (std::getline(tail, line)) {
                if (tail.eof()) {
                    // Partial line; keep it for the next pass
                    pending += line;
                    break;
                }
                auto pct = parse_progress_line(pending + line, input.duration_seconds);
                pending.clear();
                if (pct && on_progress) on_progress(*pct);
            }
        }
        platform::sleep_ms(SUBPROCESS_POLL_MS);
    }

    std::error_code ec;
    std::string err_text = platform::read_file(err_log);
    fs::remove(out_log, ec);
    fs::remove(err_log, ec);

    if (token.stop_requested()) {
        fs::remove(out_path, ec);
        return Result<LocalArtifact>::Err("cancelled");
    }
    if (proc.exit_code() != 0) {
        fs::remove(out_path, ec);
        relay_log(fmt::format("ffmpeg: exit {}: {}", proc.exit_code(),
                              err_text.size() > 500 ? err_text.substr(err_text.size() - 500)
                                                    : err_text));
        if (proc.exit_code() == 127) return Result<LocalArtifact>::Err(ffmpeg_path_ + " not found");
        return Result<LocalArtifact>::Err(fmt::format("ffmpeg exited with {}", proc.exit_code()));
    }

    LocalArtifact out;
    out.path = out_path.string();
    out.content_length = static_cast<int64_t>(fs::file_size(out_path, ec));
    if (ec) return Result<LocalArtifact>::Err("ffmpeg produced no output file");
    out.title = input.title;
    out.duration_seconds = input.duration_seconds;
    out.height = input.height > 0 ? std::min(input.height, height) : height;
    out.container = ext;
    return Result<LocalArtifact>::Ok(out);
}
