#include "relay_service.hpp"
#include "relay_log.hpp"
#include <adapters/command_transfer.hpp>
#include <adapters/directory_transfer.hpp>
#include <adapters/ffmpeg_transcoder.hpp>
#include <adapters/http_fetcher.hpp>
#include <adapters/ytdlp_fetcher.hpp>
#include <core/constants.hpp>
#include <core/validators.hpp>
#include <fmt/format.h>

RelayService::RelayService(Config config) : config_(std::move(config)) {
    configure_relay_log(config_.log().path, config_.log().max_bytes, config_.log().backups);
}

RelayService::~RelayService() {
    stop();
}

void RelayService::set_capabilities(std::unique_ptr<SourceFetcher> fetcher,
                                    std::unique_ptr<TransferOut> transfer,
                                    std::unique_ptr<Transcoder> transcoder) {
    fetcher_ = std::move(fetcher);
    transfer_ = std::move(transfer);
    transcoder_ = std::move(transcoder);
}

Result<void> RelayService::build_capabilities() {
    const auto& d = config_.downloads();
    if (!fetcher_) {
        if (d.backend == "ytdlp") fetcher_ = std::make_unique<YtDlpFetcher>(d.ytdlp_path);
        else if (d.backend == "http") fetcher_ = std::make_unique<HttpFetcher>();
        else return Result<void>::Err("Unknown fetch backend: " + d.backend);
    }

    const auto& u = config_.upload();
    if (!transfer_) {
        if (u.backend == "directory") {
            transfer_ = std::make_unique<DirectoryTransfer>(u.outbox, u.max_bytes);
        } else if (u.backend == "command") {
            if (u.command.empty()) return Result<void>::Err("upload.command is empty");
            transfer_ = std::make_unique<CommandTransfer>(u.command, u.max_bytes);
        } else {
            return Result<void>::Err("Unknown upload backend: " + u.backend);
        }
    }

    if (!transcoder_ && config_.transcode().enabled) {
        transcoder_ = std::make_unique<FfmpegTranscoder>(config_.transcode().ffmpeg_path);
    }
    return Result<void>::Ok();
}

Result<void> RelayService::start(NotificationSink& sink) {
    if (scheduler_) return Result<void>::Ok();

    auto caps = build_capabilities();
    if (caps.is_err()) return caps;

    const auto& d = config_.downloads();
    std::error_code ec;
    std::filesystem::create_directories(d.path, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create download directory {}: {}",
                                             d.path.string(), ec.message()));
    }

    quota_ = std::make_unique<QuotaTracker>(
        config_.quota().max_per_user, std::chrono::minutes(config_.quota().window_minutes),
        std::chrono::minutes(QUOTA_EVICT_GRACE_MINUTES));
    gate_ = std::make_unique<ConcurrencyGate>(d.concurrent);
    retention_ = std::make_unique<RetentionManager>(
        std::chrono::seconds(config_.cleanup().sweep_interval_seconds));

    // Leftovers from a previous run are older than any live job
    size_t orphans = retention_->sweep_orphans(
        d.path, std::chrono::minutes(config_.cleanup().after_minutes));
    if (orphans > 0) relay_log(fmt::format("service: removed {} stale files", orphans));
    retention_->start();

    scheduler_ = std::make_unique<Scheduler>(SchedulerOptions::from_config(config_), *quota_,
                                             *gate_, *retention_, *fetcher_, *transfer_, sink,
                                             transcoder_.get());
    scheduler_->start();
    relay_log(fmt::format("service: started (fetch={}, upload={}, transcode={})", d.backend,
                          config_.upload().backend, transcoder_ ? "on" : "off"));
    return Result<void>::Ok();
}

void RelayService::stop() {
    if (!scheduler_) return;
    scheduler_->shutdown();
    retention_->stop();
    scheduler_.reset();
    relay_log("service: stopped");
}

Result<JobHandle> RelayService::submit_text(const std::string& user_id, const std::string& text,
                                            std::optional<Resolution> resolution,
                                            const std::string& destination) {
    if (!scheduler_) return Result<JobHandle>::Err("Service is not running");
    if (user_id.empty()) return Result<JobHandle>::Err("Missing user id");

    auto urls = extract_urls(text);
    if (urls.empty()) return Result<JobHandle>::Err("No supported video URL found");

    Request req;
    req.user_id = user_id;
    req.source_url = urls.front();  // first URL only
    req.requested_resolution = resolution.value_or(config_.downloads().max_resolution);
    req.destination = destination.empty() ? user_id : destination;
    return Result<JobHandle>::Ok(scheduler_->submit(req));
}

Result<void> RelayService::cancel(const std::string& job_id) {
    if (!scheduler_) return Result<void>::Err("Service is not running");
    return scheduler_->cancel(job_id);
}

SchedulerStats RelayService::stats() const {
    if (!scheduler_) return SchedulerStats{};
    return scheduler_->stats();
}

std::vector<JobTransition> RelayService::history(const std::string& job_id) const {
    if (!scheduler_) return {};
    return scheduler_->history(job_id);
}

QuotaStatus RelayService::quota_status(const std::string& user_id) {
    QuotaStatus s;
    s.limit = config_.quota().max_per_user;
    if (!quota_) {
        s.remaining = s.limit;
        return s;
    }
    s.remaining = quota_->remaining(user_id);
    s.reset_in = quota_->reset_in(user_id);
    return s;
}

int64_t RelayService::download_dir_size() const {
    return RetentionManager::directory_size(config_.downloads().path);
}

size_t RelayService::retained_files() const {
    return retention_ ? retention_->tracked().size() : 0;
}
