#include "directory_transfer.hpp"
#include <managers/relay_log.hpp>
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

DirectoryTransfer::DirectoryTransfer(fs::path outbox, int64_t max_bytes)
    : outbox_(std::move(outbox)), max_bytes_(max_bytes) {}

TransferResult DirectoryTransfer::send(const LocalArtifact& artifact,
                                       const std::string& destination, CancelToken& token,
                                       const ProgressFn& on_progress) {
    std::error_code ec;
    auto total = static_cast<int64_t>(fs::file_size(artifact.path, ec));
    if (ec) {
        return TransferResult::Err(TransferError::TransportFailure,
                                   "Cannot read " + artifact.path + ": " + ec.message());
    }
    if (total > max_bytes_) {
        return TransferResult::Err(TransferError::TooLarge,
                                   fmt::format("{} exceeds the {} limit", format_bytes(total),
                                               format_bytes(max_bytes_)));
    }

    fs::path dir = outbox_ / sanitize_path_component(destination);
    fs::create_directories(dir, ec);
    if (ec) {
        return TransferResult::Err(TransferError::TransportFailure,
                                   "Cannot create " + dir.string() + ": " + ec.message());
    }
    fs::path target = dir / fs::path(artifact.path).filename();
    fs::path part = target;
    part += ".part";

    std::ifstream in(artifact.path, std::ios::binary);
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!in || !out) {
        return TransferResult::Err(TransferError::TransportFailure,
                                   "Cannot open files for " + target.string());
    }

    std::vector<char> buf(static_cast<size_t>(TRANSFER_CHUNK_BYTES));
    int64_t copied = 0;
    while (copied < total) {
        if (token.stop_requested()) {
            out.close();
            fs::remove(part, ec);
            return TransferResult::Err(TransferError::Cancelled, "cancelled");
        }
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n <= 0) break;
        out.write(buf.data(), n);
        if (!out) break;
        copied += n;
        if (on_progress && total > 0) on_progress(100.0 * copied / total);
    }
    out.close();

    if (copied != total || out.fail()) {
        fs::remove(part, ec);
        return TransferResult::Err(TransferError::TransportFailure,
                                   fmt::format("short write to {} ({} of {} bytes)",
                                               target.string(), copied, total));
    }

    fs::rename(part, target, ec);
    if (ec) {
        fs::remove(part, ec);
        return TransferResult::Err(TransferError::TransportFailure,
                                   "Cannot finalize " + target.string());
    }

    relay_log(fmt::format("transfer: delivered {} to {}", format_bytes(total), target.string()));
    return TransferResult::Ok(target.string());
}
