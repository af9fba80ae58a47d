#include "command_transfer.hpp"
#include <managers/relay_log.hpp>
#include <platform/process.hpp>
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>

CommandTransfer::CommandTransfer(std::string command_template, int64_t max_bytes)
    : template_(std::move(command_template)), max_bytes_(max_bytes) {}

std::string CommandTransfer::shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string CommandTransfer::render(const LocalArtifact& artifact,
                                    const std::string& destination) const {
    std::string out;
    size_t i = 0;
    while (i < template_.size()) {
        bool replaced = false;
        for (const auto& [key, value] : {std::make_pair("{file}", artifact.path),
                                         std::make_pair("{destination}", destination),
                                         std::make_pair("{title}", artifact.title)}) {
            std::string k(key);
            if (template_.compare(i, k.size(), k) == 0) {
                out += shell_quote(value);
                i += k.size();
                replaced = true;
                break;
            }
        }
        if (!replaced) out += template_[i++];
    }
    return out;
}

TransferResult CommandTransfer::send(const LocalArtifact& artifact,
                                     const std::string& destination, CancelToken& token,
                                     const ProgressFn& on_progress) {
    std::error_code ec;
    auto size = static_cast<int64_t>(std::filesystem::file_size(artifact.path, ec));
    if (!ec && size > max_bytes_) {
        return TransferResult::Err(TransferError::TooLarge,
                                   fmt::format("{} exceeds the {} limit", format_bytes(size),
                                               format_bytes(max_bytes_)));
    }

    std::string cmd = render(artifact, destination);
    relay_log("transfer: running " + cmd);
    if (on_progress) on_progress(0);

    auto r = platform::run_capture("/bin/sh", {"-c", cmd},
                                   [&] { return token.stop_requested(); }, SUBPROCESS_POLL_MS);
    if (r.stopped) return TransferResult::Err(TransferError::Cancelled, "cancelled");
    if (r.exit_code != 0) {
        std::string err = r.stderr_data;
        trim(err);
        if (err.size() > 300) err = err.substr(err.size() - 300);
        return TransferResult::Err(TransferError::TransportFailure,
                                   fmt::format("command exited with {}{}", r.exit_code,
                                               err.empty() ? "" : ": " + err));
    }

    std::string ref = r.stdout_data.substr(0, r.stdout_data.find('\n'));
    trim(ref);
    return TransferResult::Ok(ref.empty() ? artifact.path : ref);
}
