#pragma once

#include <cstdint>
#include <string>
#include <managers/capabilities.hpp>

// TransferOut that runs a shell command template per delivery.
// {file}, {destination} and {title} are replaced by single-quoted values.
// Exit status 0 is the acknowledgment; the first stdout line is the delivery ref.
class CommandTransfer : public TransferOut {
public:
    CommandTransfer(std::string command_template, int64_t max_bytes);

    TransferResult send(const LocalArtifact& artifact, const std::string& destination,
                        CancelToken& token, const ProgressFn& on_progress) override;

    // Expanded command line for an artifact, exposed for tests.
    std::string render(const LocalArtifact& artifact, const std::string& destination) const;

    static std::string shell_quote(const std::string& s);

private:
    std::string template_;
    int64_t max_bytes_;
};
