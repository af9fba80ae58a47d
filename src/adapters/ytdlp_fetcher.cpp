#include "ytdlp_fetcher.hpp"
#include <managers/relay_log.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

// Marker for the single line yt-dlp prints after the final move
static const char* kResultMarker = "VRELAY|";

YtDlpFetcher::YtDlpFetcher(std::string ytdlp_path) : ytdlp_path_(std::move(ytdlp_path)) {}

// ── Parsing helpers ─────────────────────────────────────────

std::string YtDlpFetcher::format_selector(int height) {
    return fmt::format(
        "bestvideo[height<={0}][ext=mp4]+bestaudio[ext=m4a]/"
        "bestvideo[height<={0}]+bestaudio/"
        "best[height<={0}][ext=mp4][vcodec!=none][acodec!=none]/"
        "best[height<={0}][vcodec!=none][acodec!=none]/"
        "best[height<={0}]/best",
        height);
}

std::optional<double> YtDlpFetcher::parse_progress_line(const std::string& line) {
    static const std::regex re(R"(\[download\]\s+([0-9]+(?:\.[0-9]+)?)%)");
    std::smatch m;
    if (!std::regex_search(line, m, re)) return std::nullopt;
    try {
        return std::stod(m[1].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int YtDlpFetcher::parse_duration(const std::string& text) {
    double seconds = 0;
    try {
        seconds = std::stod(text);
    } catch (const std::exception&) {
        return 0;
    }
    if (!(seconds > 0)) return 0;   // also NaN
    if (seconds >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(seconds);
}

FetchError YtDlpFetcher::classify_error(const std::string& stderr_text, std::string& message) {
    std::string lower = stderr_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.find("http error 429") != std::string::npos ||
        lower.find("too many requests") != std::string::npos) {
        message = "Source is rate limiting requests";
        return FetchError::RateLimited;
    }
    if (lower.find("unsupported url") != std::string::npos) {
        message = "Unsupported URL";
        return FetchError::Unsupported;
    }
    if (lower.find("private video") != std::string::npos) {
        message = "Video is private";
        return FetchError::NotFound;
    }
    if (lower.find("copyright") != std::string::npos) {
        message = "Video blocked due to copyright";
        return FetchError::NotFound;
    }
    if (lower.find("sign in to confirm your age") != std::string::npos ||
        lower.find("age-restricted") != std::string::npos) {
        message = "Video is age-restricted";
        return FetchError::NotFound;
    }
    if (lower.find("unavailable") != std::string::npos ||
        lower.find("http error 404") != std::string::npos) {
        message = "Video is unavailable";
        return FetchError::NotFound;
    }
    if (lower.find("ffmpeg") != std::string::npos) {
        message = "Server error: ffmpeg not available";
        return FetchError::TransportFailure;
    }

    // Last ERROR: line, or a generic message
    message = "Download failed";
    std::istringstream in(stderr_text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("ERROR:", 0) == 0) message = line.substr(6);
    }
    trim(message);
    return FetchError::TransportFailure;
}

// Parse "VRELAY|path|duration|height|title"
static bool parse_result_line(const std::string& stdout_text, LocalArtifact& out) {
    std::istringstream in(stdout_text);
    std::string line, found;
    while (std::getline(in, line)) {
        if (line.rfind(kResultMarker, 0) == 0) found = line;
    }
    if (found.empty()) return false;

    std::vector<std::string> parts;
    size_t start = std::string(kResultMarker).size();
    for (int i = 0; i < 3; ++i) {
        size_t bar = found.find('|', start);
        if (bar == std::string::npos) return false;
        parts.push_back(found.substr(start, bar - start));
        start = bar + 1;
    }
    parts.push_back(found.substr(start));  // title may contain '|'

    out.path = parts[0];
    out.duration_seconds = YtDlpFetcher::parse_duration(parts[1]);
    out.height = safe_stoi(parts[2], 0);
    out.title = parts[3];
    trim(out.title);
    out.container = fs::path(out.path).extension().string();
    if (!out.container.empty() && out.container[0] == '.') out.container.erase(0, 1);
    return true;
}

static void remove_with_stem(const fs::path& dir, const std::string& stem) {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        if (name.rfind(stem + ".", 0) == 0) {
            std::error_code rm_ec;
            fs::remove(entry.path(), rm_ec);
        }
    }
}

// ── Fetch ───────────────────────────────────────────────────

FetchResult YtDlpFetcher::fetch(const FetchRequest& req, CancelToken& token,
                                const ProgressFn& on_progress) {
    std::error_code ec;
    fs::create_directories(req.output_dir, ec);
    if (ec) {
        return FetchResult::Err(FetchError::TransportFailure,
                                "Cannot create " + req.output_dir.string() + ": " + ec.message());
    }

    std::string out_log = platform::temp_file("vrelay_ytdlp_out").string();
    std::string err_log = platform::temp_file("vrelay_ytdlp_err").string();
    std::string templ = (req.output_dir / (req.file_stem + ".%(ext)s")).string();

    std::vector<std::string> args = {
        "--no-playlist", "--newline", "--no-color", "--progress",
        "-f", format_selector(static_cast<int>(req.max_resolution)),
        "--merge-output-format", "mp4",
        "--retries", "10", "--fragment-retries", "10",
        "--socket-timeout", "60",
        "--force-overwrites",
        "-o", templ,
        "--print", std::string("after_move:") + kResultMarker +
                   "%(filepath)s|%(duration)s|%(height)s|%(title)s",
        req.url,
    };

    relay_log(fmt::format("ytdlp: fetching {} -> {}", req.url, templ));
    auto proc = platform::spawn(ytdlp_path_, args, out_log, err_log);
    if (!proc.valid()) {
        return FetchResult::Err(FetchError::TransportFailure, "Failed to start " + ytdlp_path_);
    }

    // Tail stdout for progress while the child runs
    std::ifstream tail;
    std::string pending;
    auto drain = [&] {
        if (!tail.is_open()) {
            tail.open(out_log);
            if (!tail.is_open()) return;
        }
        tail.clear();
        char buf[4096];
        while (tail.read(buf, sizeof(buf)) || tail.gcount() > 0) {
            pending.append(buf, static_cast<size_t>(tail.gcount()));
            if (tail.eof()) break;
        }
        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            auto pct = parse_progress_line(pending.substr(0, nl));
            if (pct && on_progress) on_progress(*pct);
            pending.erase(0, nl + 1);
        }
    };

    bool timed_out = false;
    while (proc.running()) {
        if (token.stop_requested()) break;
        if (SteadyClock::now() >= req.deadline) {
            timed_out = true;
            break;
        }
        drain();
        platform::sleep_ms(SUBPROCESS_POLL_MS);
    }

    if (proc.running()) {
        proc.terminate();
        remove_with_stem(req.output_dir, req.file_stem);
        fs::remove(out_log, ec);
        fs::remove(err_log, ec);
        if (timed_out || token.reason() == CancelReason::Timeout) {
            return FetchResult::Err(FetchError::Timeout, "yt-dlp did not finish before the deadline");
        }
        return FetchResult::Err(FetchError::Cancelled, "cancelled");
    }
    drain();

    int code = proc.exit_code();
    std::string out_text = platform::read_file(out_log);
    std::string err_text = platform::read_file(err_log);
    fs::remove(out_log, ec);
    fs::remove(err_log, ec);

    if (code == 127) {
        return FetchResult::Err(FetchError::TransportFailure, ytdlp_path_ + " not found");
    }
    if (code != 0) {
        std::string message;
        FetchError e = classify_error(err_text, message);
        relay_log(fmt::format("ytdlp: exit {} ({}): {}", code, fetch_error_name(e),
                              err_text.substr(0, 500)));
        remove_with_stem(req.output_dir, req.file_stem);
        return FetchResult::Err(e, message);
    }

    LocalArtifact artifact;
    if (!parse_result_line(out_text, artifact)) {
        return FetchResult::Err(FetchError::TransportFailure, "yt-dlp reported no output file");
    }
    relay_log(fmt::format("ytdlp: done {} ({}p, {}s)", artifact.path, artifact.height,
                          artifact.duration_seconds));
    return FetchResult::Ok(artifact);
}

// ── Lookup ──────────────────────────────────────────────────

Result<MediaInfo> YtDlpFetcher::lookup(const std::string& url, CancelToken& token) {
    auto r = platform::run_capture(
        ytdlp_path_,
        {"--skip-download", "--no-playlist", "--no-warnings", "--no-color",
         "--socket-timeout", "15", "--print", "%(duration)s|%(title)s", url},
        [&] { return token.stop_requested(); }, SUBPROCESS_POLL_MS);

    if (r.stopped) return Result<MediaInfo>::Err("cancelled");
    if (!r.spawned) return Result<MediaInfo>::Err("Failed to start " + ytdlp_path_);

    MediaInfo info;
    if (r.exit_code != 0) {
        std::string message;
        FetchError e = classify_error(r.stderr_data, message);
        if (e == FetchError::NotFound || e == FetchError::Unsupported) {
            info.available = false;
            info.error_message = message;
            return Result<MediaInfo>::Ok(info);
        }
        return Result<MediaInfo>::Err(message);
    }

    std::string line = r.stdout_data.substr(0, r.stdout_data.find('\n'));
    auto bar = line.find('|');
    std::string duration = line.substr(0, bar);
    info.duration_seconds = parse_duration(duration);
    if (bar != std::string::npos) info.title = line.substr(bar + 1);
    return Result<MediaInfo>::Ok(info);
}
