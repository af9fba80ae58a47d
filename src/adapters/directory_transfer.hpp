#pragma once

#include <cstdint>
#include <filesystem>
#include <managers/capabilities.hpp>

// TransferOut that delivers into <outbox>/<destination>/ by chunked copy.
// Files appear atomically: data goes to a .part file that is renamed at the end.
class DirectoryTransfer : public TransferOut {
public:
    DirectoryTransfer(std::filesystem::path outbox, int64_t max_bytes);

    TransferResult send(const LocalArtifact& artifact, const std::string& destination,
                        CancelToken& token, const ProgressFn& on_progress) override;

private:
    std::filesystem::path outbox_;
    int64_t max_bytes_;
};
