#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>

#include "../core/utils.h"

enum class ReadOutcome {
    Ok,
    RateLimited,
    ConnectionFatal,
    NotFound,
    Failed,
    Aborted // onData returned false
};

struct ReadStatus {
    ReadOutcome outcome = ReadOutcome::Ok;
    std::chrono::milliseconds retryAfter{ 0 };
    std::string message;

    bool ok() const { return outcome == ReadOutcome::Ok; }

    static ReadStatus success() { return {}; }
    static ReadStatus failure(ReadOutcome outcome, std::string msg,
        std::chrono::milliseconds wait = std::chrono::milliseconds(0)) {
        ReadStatus s;
        s.outcome = outcome;
        s.retryAfter = wait;
        s.message = std::move(msg);
        return s;
    }
};

// One connection to the remote host that owns the media.
class IClient {
public:
    using DataCallback = std::function<bool(const char*, std::size_t)>;

    virtual ~IClient() = default;

    virtual ReadStatus getMediaRef(const std::string& mediaId, MediaRef& out) = 0;

    // Delivers bytes starting at offset; may deliver more than limit.
    virtual ReadStatus rangeRead(const MediaRef& media,
        std::uint64_t offset,
        std::uint64_t limit,
        const DataCallback& onData) = 0;
};

class ClientSource {
public:
    virtual ~ClientSource() = default;
    virtual std::vector<ClientEntry> listAvailableClients() const = 0;
};
