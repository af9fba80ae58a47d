#include "relay_cli.hpp"
#include "theme.hpp"
#include <adapters/console_sink.hpp>
#include <core/config.hpp>
#include <core/resolution.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <core/validators.hpp>
#include <managers/relay_log.hpp>
#include <managers/relay_service.hpp>
#include <platform/singleton.hpp>
#include <fmt/format.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <vector>
#include <unistd.h>
#include <readline/readline.h>
#include <readline/history.h>

// SIGINT/SIGTERM close stdin so the read loop sees EOF and shuts down cleanly
extern "C" void relay_cli_on_signal(int) {
    close(STDIN_FILENO);
}

std::optional<SubmitLine> parse_submit_line(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    if (tokens.size() < 2) return std::nullopt;

    SubmitLine out;
    out.user_id = tokens.front();
    size_t end = tokens.size();

    if (end >= 3) {
        if (auto r = parse_resolution(tokens[end - 1])) {
            out.resolution = r;
            end -= 1;
        } else if (end >= 4) {
            if (auto r2 = parse_resolution(tokens[end - 2])) {
                out.resolution = r2;
                out.destination = tokens[end - 1];
                end -= 2;
            }
        }
    }

    for (size_t i = 1; i < end; ++i) {
        if (!out.text.empty()) out.text += " ";
        out.text += tokens[i];
    }
    return out;
}

RelayCLI::RelayCLI() {
    register_commands();
}

RelayCLI::~RelayCLI() = default;

void RelayCLI::register_commands() {
    add_command("status", [this](BaseCLI&, const std::string&) {
        auto s = service_->stats();
        std::cout << theme::section("Status");
        std::cout << theme::kv("slots", fmt::format("{}/{}", s.slots_in_use, s.slots_capacity));
        std::cout << theme::kv("pending", std::to_string(s.pending));
        std::cout << theme::kv("active", std::to_string(s.active));
        for (const auto& [state, count] : s.by_state) {
            std::cout << theme::kv(std::string("  ") + job_state_name(state),
                                   std::to_string(count));
        }
        std::cout << theme::kv("completed", std::to_string(s.completed));
        std::cout << theme::kv("failed", std::to_string(s.failed));
        std::cout << theme::kv("rejected", std::to_string(s.rejected));
        std::cout << theme::kv("disk", format_bytes(service_->download_dir_size()));
        std::cout << theme::kv("retained", std::to_string(service_->retained_files()));
        std::cout << "\n";
    }, "Slots, queue and totals");

    add_command("cancel", [this](BaseCLI&, const std::string& args) {
        std::string id = args;
        trim(id);
        if (id.empty()) {
            std::cout << theme::fail("Usage: cancel <job-id>");
            return;
        }
        auto r = service_->cancel(id);
        if (r.is_err()) std::cout << theme::fail(r.error);
        else std::cout << theme::info("Cancelling " + id);
    }, "Cancel a queued or running job");

    add_command("history", [this](BaseCLI&, const std::string& args) {
        std::string id = args;
        trim(id);
        if (id.empty()) {
            std::cout << theme::fail("Usage: history <job-id>");
            return;
        }
        auto transitions = service_->history(id);
        if (transitions.empty()) {
            std::cout << theme::fail(fmt::format("No recent job '{}'", id));
            return;
        }
        std::cout << theme::section(id);
        auto origin = transitions.front().at;
        for (const auto& t : transitions) {
            auto offset = std::chrono::duration_cast<std::chrono::milliseconds>(t.at - origin);
            std::cout << theme::kv(fmt::format("+{}ms", offset.count()),
                                   fmt::format("{} -> {}", job_state_name(t.from),
                                               job_state_name(t.to)));
        }
        std::cout << "\n";
    }, "State changes of a recent job");

    add_command("quota", [this](BaseCLI&, const std::string& args) {
        std::string user = args;
        trim(user);
        if (user.empty()) {
            std::cout << theme::fail("Usage: quota <user>");
            return;
        }
        auto q = service_->quota_status(user);
        std::string line = fmt::format("{}: {}/{} left", user, q.remaining, q.limit);
        if (q.reset_in.count() > 0) {
            line += fmt::format(", resets in {} min", minutes_ceil(q.reset_in));
        }
        std::cout << theme::info(line);
    }, "Requests left for a user");

    add_command("help", [this](BaseCLI&, const std::string&) {
        std::cout << theme::section("Requests");
        std::cout << theme::dim("    <user> <url-or-text> [resolution] [destination]") << "\n";
        print_help({
            {"Jobs",    {"status", "cancel", "history", "quota"}},
            {"General", {"help", "quit"}},
        });
    }, "Show this help");

    add_command("quit", [this](BaseCLI&, const std::string&) {
        quit_ = true;
    }, "Finish running jobs' cancellation and exit");
}

void RelayCLI::handle_line(const std::string& raw) {
    std::string line = raw;
    trim(line);
    if (line.empty() || line[0] == '#') return;

    std::istringstream iss(line);
    std::string command;
    iss >> command;
    if (has_command(command)) {
        std::string args;
        std::getline(iss, args);
        execute_command(command, args);
        return;
    }

    auto req = parse_submit_line(line);
    if (!req) {
        std::cout << theme::fail("Expected: <user> <url-or-text> [resolution] [destination]");
        return;
    }
    auto r = service_->submit_text(req->user_id, req->text, req->resolution, req->destination);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return;
    }
    const auto& h = r.value;
    if (!h.admitted) return;  // the sink already reported why
    if (h.queue_position > 1) {
        std::cout << theme::info(fmt::format("{} queued (position {})", h.job_id,
                                             h.queue_position));
    } else {
        std::cout << theme::info(fmt::format("{} processing", h.job_id));
    }
}

bool RelayCLI::read_line(std::string& line, bool interactive) {
    if (interactive) {
        char* raw = readline("vrelay> ");
        if (!raw) return false;  // EOF / Ctrl-D
        line = raw;
        free(raw);
        if (!line.empty()) add_history(line.c_str());
        return true;
    }
    return static_cast<bool>(std::getline(std::cin, line));
}

// ── Subcommands ─────────────────────────────────────────────

int RelayCLI::run_serve(const std::filesystem::path& config_path) {
    auto cfg = Config::load(config_path);
    if (cfg.is_err()) {
        std::cout << theme::fail("Invalid configuration: " + cfg.error);
        return 1;
    }
    const Config& config = cfg.value;

    SingletonLock lock((config.downloads().path / ".vrelay.lock").string());
    if (!lock.held()) {
        std::cout << theme::fail(fmt::format(
            "Another vrelay is already serving {}{}", config.downloads().path.string(),
            lock.owner_pid() > 0 ? fmt::format(" (pid {})", lock.owner_pid()) : ""));
        return 1;
    }

    bool interactive = isatty(STDIN_FILENO);
    if (interactive) std::cout << theme::banner();

    sink_ = std::make_unique<ConsoleSink>(std::cout);
    service_ = std::make_unique<RelayService>(config);
    auto started = service_->start(*sink_);
    if (started.is_err()) {
        std::cout << theme::fail(started.error);
        return 1;
    }

    std::cout << theme::ok(fmt::format("Serving with {} slots, max {}, {} per user per {} min",
                                       config.downloads().concurrent,
                                       resolution_label(config.downloads().max_resolution),
                                       config.quota().max_per_user,
                                       config.quota().window_minutes));
    std::cout << theme::dim("    Log: " + relay_log_path()) << "\n";

    std::signal(SIGINT, relay_cli_on_signal);
    std::signal(SIGTERM, relay_cli_on_signal);

    std::string line;
    while (!quit_ && read_line(line, interactive)) {
        handle_line(line);
    }

    std::cout << theme::step("Shutting down...");
    service_->stop();
    std::cout << theme::ok("Stopped");
    return 0;
}

int RelayCLI::run_config(const std::filesystem::path& config_path, bool init) {
    if (init) {
        auto path = config_path.empty() ? get_config_path() : config_path;
        bool existed = std::filesystem::exists(path);
        auto r = create_default_config(path);
        if (r.is_err()) {
            std::cout << theme::fail(r.error);
            return 1;
        }
        if (existed) std::cout << theme::info("Config already exists: " + path.string());
        else std::cout << theme::ok("Wrote " + path.string());
        return 0;
    }

    auto cfg = Config::load(config_path);
    if (cfg.is_err()) {
        std::cout << theme::fail("Invalid configuration: " + cfg.error);
        return 1;
    }
    std::cout << theme::section("Configuration");
    std::istringstream lines(cfg.value.describe());
    std::string row;
    while (std::getline(lines, row)) std::cout << "    " << row << "\n";
    std::cout << "\n";
    return 0;
}

int RelayCLI::run_check_url(const std::string& text) {
    auto urls = extract_urls(text);
    if (urls.empty()) {
        std::cout << theme::fail("No supported video URL found");
        return 1;
    }
    for (const auto& u : urls) std::cout << u << "\n";
    return 0;
}
