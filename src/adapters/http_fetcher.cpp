#include "http_fetcher.hpp"
#include <managers/relay_log.hpp>
#include <fmt/format.h>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

struct TransferState {
    std::ofstream* file;
    CancelToken* token;
    TimePoint deadline;
    const ProgressFn* on_progress;
    bool deadline_hit = false;
};

size_t write_callback(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    state->file->write(static_cast<char*>(ptr), static_cast<std::streamsize>(size * nmemb));
    return state->file->good() ? size * nmemb : 0;
}

int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* state = static_cast<TransferState*>(clientp);
    if (state->token->stop_requested()) return 1;
    if (SteadyClock::now() >= state->deadline) {
        state->deadline_hit = true;
        return 1;
    }
    if (dltotal > 0 && *state->on_progress) {
        (*state->on_progress)(100.0 * static_cast<double>(dlnow) / static_cast<double>(dltotal));
    }
    return 0;
}

} // namespace

HttpFetcher::HttpFetcher() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpFetcher::~HttpFetcher() {
    curl_global_cleanup();
}

FetchError HttpFetcher::classify_status(long status) {
    if (status >= 200 && status < 300) return FetchError::None;
    if (status == 404 || status == 410 || status == 401 || status == 403) return FetchError::NotFound;
    if (status == 429) return FetchError::RateLimited;
    if (status == 415) return FetchError::Unsupported;
    return FetchError::TransportFailure;
}

std::string HttpFetcher::extension_for(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto slash = path.rfind('/');
    auto dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "mp4";
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext.empty() ? "mp4" : ext;
}

FetchResult HttpFetcher::fetch(const FetchRequest& req, CancelToken& token,
                               const ProgressFn& on_progress) {
    std::error_code ec;
    fs::create_directories(req.output_dir, ec);
    std::string ext = extension_for(req.url);
    fs::path out_path = req.output_dir / (req.file_stem + "." + ext);
    fs::path part_path = req.output_dir / (req.file_stem + ".part");

    CURL* curl = curl_easy_init();
    if (!curl) {
        return FetchResult::Err(FetchError::TransportFailure, "Failed to initialize CURL");
    }

    std::ofstream file(part_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        curl_easy_cleanup(curl);
        return FetchResult::Err(FetchError::TransportFailure,
                                "Failed to open output file " + part_path.string());
    }

    TransferState state{&file, &token, req.deadline, &on_progress};
    char errbuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "vrelay/1");

    relay_log(fmt::format("http: fetching {} -> {}", req.url, out_path.string()));
    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_off_t content_length = -1;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &content_length);
    curl_easy_cleanup(curl);
    file.close();

    // The partial file never outlives a failed attempt
    auto fail = [&](FetchError e, const std::string& msg) {
        fs::remove(part_path, ec);
        relay_log(fmt::format("http: {} failed ({}): {}", req.url, fetch_error_name(e), msg));
        return FetchResult::Err(e, msg);
    };

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        if (state.deadline_hit || token.reason() == CancelReason::Timeout) {
            return fail(FetchError::Timeout, "download did not finish before the deadline");
        }
        return fail(FetchError::Cancelled, "cancelled");
    }
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return fail(FetchError::Timeout, errbuf[0] ? errbuf : curl_easy_strerror(res));
    }
    if (res == CURLE_UNSUPPORTED_PROTOCOL || res == CURLE_URL_MALFORMAT) {
        return fail(FetchError::Unsupported, curl_easy_strerror(res));
    }
    if (res != CURLE_OK) {
        return fail(FetchError::TransportFailure, errbuf[0] ? errbuf : curl_easy_strerror(res));
    }

    FetchError by_status = classify_status(status);
    if (by_status != FetchError::None) {
        return fail(by_status, "HTTP error: " + std::to_string(status));
    }

    fs::rename(part_path, out_path, ec);
    if (ec) {
        return fail(FetchError::TransportFailure,
                    fmt::format("cannot move download into place: {}", ec.message()));
    }

    LocalArtifact artifact;
    artifact.path = out_path.string();
    artifact.content_length = content_length > 0 ? static_cast<int64_t>(content_length) : 0;
    artifact.title = fs::path(req.url.substr(0, req.url.find_first_of("?#"))).stem().string();
    artifact.container = ext;
    return FetchResult::Ok(artifact);
}
