#include "config.hpp"
#include "resolution.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace fs = std::filesystem;

// ── Paths ───────────────────────────────────────────────────

fs::path get_config_dir() {
    return platform::home_dir() / ".vrelay";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

// "~/x" → "$HOME/x"; anything else unchanged
static fs::path expand_home(const std::string& p) {
    if (p == "~") return platform::home_dir();
    if (p.rfind("~/", 0) == 0) return platform::home_dir() / p.substr(2);
    return fs::path(p);
}

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

// ── YAML overlay ────────────────────────────────────────────

class ConfigParser {
public:
    static Result<void> overlay(Config& cfg, const YAML::Node& root) {
        if (!root || root.IsNull()) return Result<void>::Ok();
        if (!root.IsMap()) return Result<void>::Err("config root must be a mapping");

        std::string err;
        if (const auto n = root["downloads"]) {
            auto& d = cfg.downloads_;
            if (n["path"]) d.path = expand_home(n["path"].as<std::string>(""));
            if (!read_int(n, "concurrent", "downloads", d.concurrent, err) ||
                !read_int(n, "timeout_seconds", "downloads", d.timeout_seconds, err) ||
                !read_int(n, "max_attempts", "downloads", d.max_attempts, err) ||
                !read_int(n, "retry_backoff_ms", "downloads", d.retry_backoff_ms, err) ||
                !read_int(n, "max_duration_seconds", "downloads", d.max_duration_seconds, err)) {
                return Result<void>::Err(err);
            }
            if (n["max_resolution"]) {
                std::string raw = n["max_resolution"].as<std::string>("");
                auto r = parse_resolution(raw);
                if (!r) {
                    return Result<void>::Err(fmt::format(
                        "downloads.max_resolution: unsupported value '{}'", raw));
                }
                d.max_resolution = *r;
            }
            d.backend = n["backend"].as<std::string>(d.backend);
            d.ytdlp_path = n["ytdlp_path"].as<std::string>(d.ytdlp_path);
        }

        if (const auto n = root["cleanup"]) {
            auto& c = cfg.cleanup_;
            if (!read_int(n, "after_minutes", "cleanup", c.after_minutes, err) ||
                !read_int(n, "sweep_interval_seconds", "cleanup", c.sweep_interval_seconds, err)) {
                return Result<void>::Err(err);
            }
            c.release_after_upload = n["release_after_upload"].as<bool>(c.release_after_upload);
        }

        if (const auto n = root["quota"]) {
            auto& q = cfg.quota_;
            if (!read_int(n, "max_per_user", "quota", q.max_per_user, err) ||
                !read_int(n, "window_minutes", "quota", q.window_minutes, err)) {
                return Result<void>::Err(err);
            }
        }

        if (const auto n = root["upload"]) {
            auto& u = cfg.upload_;
            if (n["max_bytes"]) {
                try {
                    u.max_bytes = n["max_bytes"].as<int64_t>();
                } catch (const YAML::Exception&) {
                    return Result<void>::Err("upload.max_bytes: expected an integer");
                }
            }
            u.backend = n["backend"].as<std::string>(u.backend);
            if (n["outbox"]) u.outbox = expand_home(n["outbox"].as<std::string>(""));
            u.command = n["command"].as<std::string>(u.command);
        }

        if (const auto n = root["fetch"]) {
            // Alias section: fetch.backend / fetch.ytdlp_path
            cfg.downloads_.backend = n["backend"].as<std::string>(cfg.downloads_.backend);
            cfg.downloads_.ytdlp_path = n["ytdlp_path"].as<std::string>(cfg.downloads_.ytdlp_path);
        }

        if (const auto n = root["transcode"]) {
            auto& t = cfg.transcode_;
            t.enabled = n["enabled"].as<bool>(t.enabled);
            t.ffmpeg_path = n["ffmpeg_path"].as<std::string>(t.ffmpeg_path);
            t.container = n["container"].as<std::string>(t.container);
        }

        if (const auto n = root["progress"]) {
            auto& p = cfg.progress_;
            if (!read_int(n, "step_percent", "progress", p.step_percent, err) ||
                !read_int(n, "min_interval_ms", "progress", p.min_interval_ms, err)) {
                return Result<void>::Err(err);
            }
        }

        if (const auto n = root["log"]) {
            auto& l = cfg.log_;
            if (n["path"]) l.path = expand_home(n["path"].as<std::string>(""));
            if (n["max_bytes"]) {
                try {
                    l.max_bytes = n["max_bytes"].as<int64_t>();
                } catch (const YAML::Exception&) {
                    return Result<void>::Err("log.max_bytes: expected an integer");
                }
            }
            if (!read_int(n, "backups", "log", l.backups, err)) {
                return Result<void>::Err(err);
            }
        }

        return Result<void>::Ok();
    }

private:
    // Leaves `out` untouched when the key is absent. False (with `err`) on a non-integer.
    static bool read_int(const YAML::Node& node, const char* key, const char* section,
                         int& out, std::string& err) {
        if (!node[key]) return true;
        try {
            out = node[key].as<int>();
            return true;
        } catch (const YAML::Exception&) {
            err = fmt::format("{}.{}: expected an integer", section, key);
            return false;
        }
    }
};

// ── Load ────────────────────────────────────────────────────

Config Config::defaults() {
    Config cfg;
    cfg.downloads_.path = get_config_dir() / "downloads";
    cfg.upload_.outbox = get_config_dir() / "outbox";
    cfg.log_.path = platform::temp_dir() / "vrelay_debug.log";
    return cfg;
}

Result<Config> Config::from_yaml(const std::string& text) {
    Config cfg = defaults();
    try {
        YAML::Node root = YAML::Load(text);
        auto r = ConfigParser::overlay(cfg, root);
        if (r.is_err()) return Result<Config>::Err(r.error);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("Invalid YAML: ") + e.what());
    }
    return Result<Config>::Ok(cfg);
}

Result<Config> Config::load(const fs::path& path, const EnvLookup& env) {
    fs::path config_path = path.empty() ? get_config_path() : path;

    Config cfg = defaults();
    if (fs::exists(config_path)) {
        try {
            YAML::Node root = YAML::LoadFile(config_path.string());
            auto r = ConfigParser::overlay(cfg, root);
            if (r.is_err()) {
                return Result<Config>::Err(fmt::format("{}: {}", config_path.string(), r.error));
            }
        } catch (const YAML::Exception& e) {
            return Result<Config>::Err(fmt::format("Failed to parse {}: {}",
                                                   config_path.string(), e.what()));
        }
        cfg.source_path_ = config_path;
    } else if (!path.empty()) {
        // An explicit path must exist; the default one is optional
        return Result<Config>::Err("Config file not found: " + config_path.string());
    }

    if (env) {
        auto r = cfg.apply_env(env);
        if (r.is_err()) return Result<Config>::Err(r.error);
    }

    auto v = cfg.validate();
    if (v.is_err()) return Result<Config>::Err(v.error);

    return Result<Config>::Ok(cfg);
}

Result<void> Config::apply_env(const EnvLookup& env) {
    auto env_int = [&](const char* name, int& out) -> Result<void> {
        auto v = env(name);
        if (!v || v->empty()) return Result<void>::Ok();
        try {
            size_t pos = 0;
            int parsed = std::stoi(*v, &pos);
            if (pos != v->size()) throw std::invalid_argument(*v);
            out = parsed;
        } catch (const std::exception&) {
            return Result<void>::Err(fmt::format("{}: expected an integer, got '{}'", name, *v));
        }
        return Result<void>::Ok();
    };

    for (auto r : {env_int("CONCURRENT_DOWNLOADS", downloads_.concurrent),
                   env_int("DOWNLOAD_TIMEOUT", downloads_.timeout_seconds),
                   env_int("DOWNLOAD_RETRIES", downloads_.max_attempts),
                   env_int("CLEANUP_AFTER_MINUTES", cleanup_.after_minutes),
                   env_int("MAX_DOWNLOADS_PER_USER", quota_.max_per_user),
                   env_int("RATE_LIMIT_WINDOW_MINUTES", quota_.window_minutes)}) {
        if (r.is_err()) return r;
    }

    if (auto v = env("MAX_VIDEO_RESOLUTION"); v && !v->empty()) {
        auto r = parse_resolution(*v);
        if (!r) {
            return Result<void>::Err(fmt::format(
                "MAX_VIDEO_RESOLUTION: unsupported value '{}'", *v));
        }
        downloads_.max_resolution = *r;
    }

    if (auto v = env("DOWNLOAD_PATH"); v && !v->empty()) {
        downloads_.path = expand_home(*v);
    }

    return Result<void>::Ok();
}

Result<void> Config::validate() const {
    if (downloads_.concurrent < 1)
        return Result<void>::Err("downloads.concurrent (CONCURRENT_DOWNLOADS) must be >= 1");
    if (downloads_.timeout_seconds <= 0)
        return Result<void>::Err("downloads.timeout_seconds (DOWNLOAD_TIMEOUT) must be > 0");
    if (downloads_.max_attempts < 1)
        return Result<void>::Err("downloads.max_attempts must be >= 1");
    if (downloads_.retry_backoff_ms < 0)
        return Result<void>::Err("downloads.retry_backoff_ms must be >= 0");
    if (downloads_.max_duration_seconds < 0)
        return Result<void>::Err("downloads.max_duration_seconds must be >= 0");
    if (downloads_.path.empty())
        return Result<void>::Err("downloads.path must not be empty");
    if (downloads_.backend != "ytdlp" && downloads_.backend != "http")
        return Result<void>::Err("downloads.backend must be 'ytdlp' or 'http'");
    if (cleanup_.after_minutes < 0)
        return Result<void>::Err("cleanup.after_minutes (CLEANUP_AFTER_MINUTES) must be >= 0");
    if (cleanup_.sweep_interval_seconds < 1)
        return Result<void>::Err("cleanup.sweep_interval_seconds must be >= 1");
    if (quota_.max_per_user < 1)
        return Result<void>::Err("quota.max_per_user (MAX_DOWNLOADS_PER_USER) must be >= 1");
    if (quota_.window_minutes < 1)
        return Result<void>::Err("quota.window_minutes must be >= 1");
    if (upload_.max_bytes <= 0)
        return Result<void>::Err("upload.max_bytes must be > 0");
    if (upload_.backend != "directory" && upload_.backend != "command")
        return Result<void>::Err("upload.backend must be 'directory' or 'command'");
    if (upload_.backend == "command" && upload_.command.empty())
        return Result<void>::Err("upload.command is required when upload.backend is 'command'");
    if (progress_.step_percent < 1 || progress_.step_percent > 100)
        return Result<void>::Err("progress.step_percent must be in 1..100");
    if (progress_.min_interval_ms < 0)
        return Result<void>::Err("progress.min_interval_ms must be >= 0");
    if (log_.backups < 0)
        return Result<void>::Err("log.backups must be >= 0");
    return Result<void>::Ok();
}

std::string Config::describe() const {
    std::ostringstream out;
    out << fmt::format("source:               {}\n",
                       source_path_.empty() ? "(defaults)" : source_path_.string());
    out << fmt::format("downloads.path:       {}\n", downloads_.path.string());
    out << fmt::format("downloads.concurrent: {}\n", downloads_.concurrent);
    out << fmt::format("downloads.max_res:    {}\n", resolution_label(downloads_.max_resolution));
    out << fmt::format("downloads.timeout:    {}s\n", downloads_.timeout_seconds);
    out << fmt::format("downloads.attempts:   {} (backoff {}ms x2)\n",
                       downloads_.max_attempts, downloads_.retry_backoff_ms);
    out << fmt::format("downloads.backend:    {}\n", downloads_.backend);
    out << fmt::format("cleanup.after:        {}m (sweep every {}s)\n",
                       cleanup_.after_minutes, cleanup_.sweep_interval_seconds);
    out << fmt::format("quota:                {} per {}m\n",
                       quota_.max_per_user, quota_.window_minutes);
    out << fmt::format("upload.backend:       {}\n", upload_.backend);
    out << fmt::format("upload.max_bytes:     {}\n", upload_.max_bytes);
    out << fmt::format("transcode:            {}\n", transcode_.enabled ? "on" : "off");
    out << fmt::format("log.path:             {}\n", log_.path.string());
    return out.str();
}

// ── Default file ────────────────────────────────────────────

Result<void> create_default_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# vrelay configuration
# Environment variables (CONCURRENT_DOWNLOADS, MAX_VIDEO_RESOLUTION,
# DOWNLOAD_TIMEOUT, CLEANUP_AFTER_MINUTES, MAX_DOWNLOADS_PER_USER) override
# the values below.

downloads:
  path: "~/.vrelay/downloads"
  concurrent: 3
  max_resolution: 1080            # 360, 480, 720, 1080, 1440, 2160
  timeout_seconds: 1800
  max_attempts: 2                 # first try + retries
  retry_backoff_ms: 2000          # doubled after each retry
  max_duration_seconds: 7200      # 0 = no limit
  backend: "ytdlp"                # ytdlp | http
  ytdlp_path: "yt-dlp"

cleanup:
  after_minutes: 30
  sweep_interval_seconds: 60
  release_after_upload: true

quota:
  max_per_user: 20
  window_minutes: 60

upload:
  max_bytes: 2147483648
  backend: "directory"            # directory | command
  outbox: "~/.vrelay/outbox"
  # command: "/usr/local/bin/send-video {destination} {file}"

transcode:
  enabled: false
  ffmpeg_path: "ffmpeg"
  container: "mp4"

progress:
  step_percent: 10
  min_interval_ms: 1000
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}
