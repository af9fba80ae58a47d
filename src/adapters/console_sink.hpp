#pragma once

#include <iosfwd>
#include <mutex>
#include <managers/capabilities.hpp>

// NotificationSink for the stdin front-end: one themed line per event.
class ConsoleSink : public NotificationSink {
public:
    explicit ConsoleSink(std::ostream& out);

    void on_progress(const std::string& job_id, int percent) override;
    void on_complete(const std::string& job_id, const JobSummary& summary) override;
    void on_failed(const std::string& job_id, const FailureReason& reason) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};
