#pragma once

#include <string>
#include <managers/capabilities.hpp>

// SourceFetcher for direct media URLs, downloaded with libcurl.
// Each fetch uses its own easy handle, so concurrent fetches are safe.
class HttpFetcher : public SourceFetcher {
public:
    HttpFetcher();
    ~HttpFetcher() override;

    HttpFetcher(const HttpFetcher&) = delete;
    HttpFetcher& operator=(const HttpFetcher&) = delete;

    FetchResult fetch(const FetchRequest& req, CancelToken& token,
                      const ProgressFn& on_progress) override;

    // HTTP status -> error class; FetchError::None for 2xx.
    static FetchError classify_status(long status);

    // Lower-case extension from the URL path ("mp4" when none).
    static std::string extension_for(const std::string& url);
};
