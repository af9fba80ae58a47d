#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include "capabilities.hpp"
#include "concurrency_gate.hpp"
#include "quota_tracker.hpp"
#include "retention_manager.hpp"
#include "scheduler.hpp"

struct QuotaStatus {
    int remaining = 0;
    int limit = 0;
    std::chrono::seconds reset_in{0};
};

// Headless service facade: builds every component from a Config and owns
// them for the life of the relay. Any front-end can drive it.
class RelayService {
public:
    explicit RelayService(Config config);
    ~RelayService();

    RelayService(const RelayService&) = delete;
    RelayService& operator=(const RelayService&) = delete;

    // Build adapters from config, sweep leftovers, start retention and the
    // scheduler. Fails on unusable config values (unknown backend, ...).
    Result<void> start(NotificationSink& sink);

    // Graceful stop: cancel jobs, join threads, final retention sweep.
    void stop();

    bool running() const { return scheduler_ != nullptr; }

    // Find the first supported URL in `text` and submit it.
    Result<JobHandle> submit_text(const std::string& user_id, const std::string& text,
                                  std::optional<Resolution> resolution = std::nullopt,
                                  const std::string& destination = "");

    Result<void> cancel(const std::string& job_id);

    SchedulerStats stats() const;
    std::vector<JobTransition> history(const std::string& job_id) const;
    QuotaStatus quota_status(const std::string& user_id);

    int64_t download_dir_size() const;
    size_t retained_files() const;

    const Config& config() const { return config_; }

    // Test seam: use these capabilities instead of building them from config.
    void set_capabilities(std::unique_ptr<SourceFetcher> fetcher,
                          std::unique_ptr<TransferOut> transfer,
                          std::unique_ptr<Transcoder> transcoder = nullptr);

private:
    Result<void> build_capabilities();

    Config config_;
    std::unique_ptr<QuotaTracker> quota_;
    std::unique_ptr<ConcurrencyGate> gate_;
    std::unique_ptr<RetentionManager> retention_;
    std::unique_ptr<SourceFetcher> fetcher_;
    std::unique_ptr<TransferOut> transfer_;
    std::unique_ptr<Transcoder> transcoder_;
    std::unique_ptr<Scheduler> scheduler_;
};
