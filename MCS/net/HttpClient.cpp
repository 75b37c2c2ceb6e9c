#include "HttpClient.h"

#include <curl/curl.h>
#include <sstream>
#include <cctype>
#include <cstdlib>
#include <algorithm>

namespace {

// A transfer slower than this many bytes per second for the whole
// window is dropped as stalled.
constexpr long StallBytesPerSec = 1;
constexpr long StallWindowSec = 60;

struct HeadInfo {
    std::uint64_t contentLength = 0;
    bool haveLength = false;
    bool acceptRanges = false;
    long retryAfterSec = -1;
};

struct BodyContext {
    CURL* handle;
    const IClient::DataCallback* onData;
    std::uint64_t offset;
    bool statusChecked = false;
    bool forward = false;
    bool aborted = false;
};

std::string lowerName(const std::string& header) {
    auto colon = header.find(':');
    std::string name = header.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::string headerValue(const std::string& header) {
    auto colon = header.find(':');
    if (colon == std::string::npos)
        return {};

    auto first = header.find_first_not_of(" \t", colon + 1);
    auto last = header.find_last_not_of(" \t\r\n");
    if (first == std::string::npos || last < first)
        return {};
    return header.substr(first, last - first + 1);
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* info = static_cast<HeadInfo*>(userdata);

    std::string header(buffer, total);
    const std::string name = lowerName(header);
    const std::string value = headerValue(header);

    if (name == "content-length" && !value.empty()) {
        if (std::isdigit(static_cast<unsigned char>(value[0]))) {
            info->contentLength = std::strtoull(value.c_str(), nullptr, 10);
            info->haveLength = true;
        }
    }
    else if (name == "accept-ranges") {
        if (value.find("bytes") != std::string::npos)
            info->acceptRanges = true;
    }
    else if (name == "retry-after" && !value.empty()) {
        // Only the delta-seconds form is honoured.
        if (std::isdigit(static_cast<unsigned char>(value[0])))
            info->retryAfterSec = std::strtol(value.c_str(), nullptr, 10);
    }

    return total;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<BodyContext*>(userdata);
    std::size_t total = size * nmemb;

    // Error bodies (429 pages and the like) never reach the caller.
    if (!ctx->statusChecked) {
        long status = 0;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status);
        ctx->forward = status == 206 || (status == 200 && ctx->offset == 0);
        ctx->statusChecked = true;
    }

    if (!ctx->forward)
        return total;

    if (!(*ctx->onData)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

// Runs while the socket is idle too, so a stalled server still sees the
// consumer's stop request.
int transferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<BodyContext*>(clientp);
    if (!(*ctx->onData)(nullptr, 0)) {
        ctx->aborted = true;
        return 1;
    }
    return 0;
}

std::chrono::milliseconds retryDelay(const HeadInfo& info) {
    if (info.retryAfterSec >= 0)
        return std::chrono::seconds(info.retryAfterSec);
    return std::chrono::seconds(1);
}

ReadStatus fromHttpStatus(long status, const HeadInfo& info) {
    switch (status) {
    case 401:
    case 403:
        return ReadStatus::failure(ReadOutcome::ConnectionFatal,
            "server rejected credentials (HTTP " + std::to_string(status) + ")");
    case 404:
    case 410:
        return ReadStatus::failure(ReadOutcome::NotFound,
            "media not found (HTTP " + std::to_string(status) + ")");
    case 429:
    case 503:
        return ReadStatus::failure(ReadOutcome::RateLimited,
            "rate limited (HTTP " + std::to_string(status) + ")", retryDelay(info));
    default:
        return ReadStatus::failure(ReadOutcome::Failed,
            "unexpected HTTP status " + std::to_string(status));
    }
}

ReadStatus fromCurlCode(CURLcode res) {
    switch (res) {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
    case CURLE_LOGIN_DENIED:
    case CURLE_SSL_CONNECT_ERROR:
        return ReadStatus::failure(ReadOutcome::ConnectionFatal, curl_easy_strerror(res));
    default:
        return ReadStatus::failure(ReadOutcome::Failed, curl_easy_strerror(res));
    }
}

}

HttpClient::HttpClient(const std::string& baseUrl)
    : base(baseUrl) {
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    curl = curl_easy_init();
}

HttpClient::~HttpClient() {
    if (curl)
        curl_easy_cleanup(static_cast<CURL*>(curl));
}

std::string HttpClient::urlFor(const std::string& mediaId) const {
    if (!mediaId.empty() && mediaId.front() == '/')
        return base + mediaId;
    return base + "/" + mediaId;
}

ReadStatus HttpClient::getMediaRef(const std::string& mediaId, MediaRef& out) {
    CURL* c = static_cast<CURL*>(curl);
    if (!c)
        return ReadStatus::failure(ReadOutcome::ConnectionFatal, "curl handle unavailable");

    std::lock_guard<std::mutex> lock(requestMutex);

    HeadInfo info;
    const std::string url = urlFor(mediaId);

    curl_easy_reset(c);
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(c, CURLOPT_HEADERDATA, &info);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(c);
    if (res != CURLE_OK)
        return fromCurlCode(res);

    long status = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
    if (status != 200)
        return fromHttpStatus(status, info);

    if (!info.haveLength)
        return ReadStatus::failure(ReadOutcome::Failed, "no Content-Length for " + mediaId);

    out.mediaId = mediaId;
    out.size = info.contentLength;
    out.streamable = info.acceptRanges;
    return ReadStatus::success();
}

ReadStatus HttpClient::rangeRead(const MediaRef& media,
    std::uint64_t offset,
    std::uint64_t limit,
    const DataCallback& onData) {
    CURL* c = static_cast<CURL*>(curl);
    if (!c)
        return ReadStatus::failure(ReadOutcome::ConnectionFatal, "curl handle unavailable");
    if (limit == 0)
        return ReadStatus::success();

    std::lock_guard<std::mutex> lock(requestMutex);

    HeadInfo info;
    BodyContext body{ c, &onData, offset };
    const std::string url = urlFor(media.mediaId);

    std::ostringstream range;
    range << offset << "-" << (offset + limit - 1);
    const std::string rangeStr = range.str();

    curl_easy_reset(c);
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_RANGE, rangeStr.c_str());
    curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(c, CURLOPT_HEADERDATA, &info);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, static_cast<void*>(&body));
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, transferInfoCallback);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, static_cast<void*>(&body));
    curl_easy_setopt(c, CURLOPT_LOW_SPEED_LIMIT, StallBytesPerSec);
    curl_easy_setopt(c, CURLOPT_LOW_SPEED_TIME, StallWindowSec);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(c);
    if (body.aborted || res == CURLE_ABORTED_BY_CALLBACK)
        return ReadStatus::failure(ReadOutcome::Aborted, "read aborted by consumer");
    if (res != CURLE_OK)
        return fromCurlCode(res);

    long status = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);

    if (status == 206)
        return ReadStatus::success();

    // A plain 200 is the whole body from byte 0; usable only for reads at 0.
    if (status == 200) {
        if (offset == 0)
            return ReadStatus::success();
        return ReadStatus::failure(ReadOutcome::Failed, "server ignored range request");
    }

    return fromHttpStatus(status, info);
}
