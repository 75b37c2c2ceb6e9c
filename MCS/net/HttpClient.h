#pragma once
#include <string>
#include <mutex>
#include <cstdint>

#include "IClient.h"

class HttpClient : public IClient {
public:
    explicit HttpClient(const std::string& baseUrl);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    ReadStatus getMediaRef(const std::string& mediaId, MediaRef& out) override;
    ReadStatus rangeRead(const MediaRef& media,
        std::uint64_t offset,
        std::uint64_t limit,
        const DataCallback& onData) override;

private:
    std::string urlFor(const std::string& mediaId) const;

private:
    void* curl;
    std::string base;
    std::mutex requestMutex; // one transfer at a time per connection
};
