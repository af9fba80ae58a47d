#include "console_sink.hpp"
#include <cli/theme.hpp>
#include <core/resolution.hpp>
#include <core/time_utils.hpp>
#include <managers/relay_log.hpp>
#include <fmt/format.h>
#include <ostream>

ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::on_progress(const std::string& job_id, int percent) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << theme::step(fmt::format("{} {}%", theme::dim(job_id), percent)) << std::flush;
}

void ConsoleSink::on_complete(const std::string& job_id, const JobSummary& summary) {
    relay_log(fmt::format("sink: {} complete -> {}", job_id, summary.delivery_ref));
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << theme::ok(fmt::format("{} {} ({}, {}, {}) -> {}", theme::dim(job_id),
                                  theme::bold(summary.title.empty() ? "video" : summary.title),
                                  resolution_label(summary.resolution),
                                  format_bytes(summary.bytes),
                                  format_duration(summary.duration_seconds),
                                  summary.delivery_ref))
         << std::flush;
}

void ConsoleSink::on_failed(const std::string& job_id, const FailureReason& reason) {
    relay_log(fmt::format("sink: {} failed [{}] {}", job_id,
                          error_class_name(reason.error_class), reason.message));
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << theme::fail(fmt::format("{} {}{}", theme::dim(job_id), reason.message,
                                    reason.user_may_retry ? theme::dim(" (you can retry)") : ""))
         << std::flush;
}
