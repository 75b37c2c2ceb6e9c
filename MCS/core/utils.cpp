#include "utils.h"

#include <thread>
#include <algorithm>

bool TransferConfig::validate(std::string& why) const {
    if (unitChunkSize == 0) {
        why = "unit chunk size must be positive";
        return false;
    }
    if (readUnitSize == 0) {
        why = "read unit size must be positive";
        return false;
    }
    if (maxWorkers == 0) {
        why = "max workers must be positive";
        return false;
    }
    if (queueDepthPerChunk == 0) {
        why = "queue depth must be positive";
        return false;
    }
    if (copyBufferSize == 0) {
        why = "copy buffer size must be positive";
        return false;
    }
    return true;
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:         return "ok";
    case ErrorKind::Connection:   return "connection error";
    case ErrorKind::RateLimit:    return "rate limited";
    case ErrorKind::NotFound:     return "not found";
    case ErrorKind::Integrity:    return "integrity error";
    case ErrorKind::Cancelled:    return "cancelled";
    case ErrorKind::Io:           return "i/o error";
    case ErrorKind::Precondition: return "precondition failed";
    case ErrorKind::Failed:       return "failed";
    }
    return "unknown";
}

void TransferError::set(ErrorKind k, std::string msg, std::int64_t index) {
    kind = k;
    chunkIndex = index;
    message = std::move(msg);
}

std::string TransferError::describe() const {
    std::string out = errorKindName(kind);
    if (chunkIndex >= 0)
        out += " [chunk " + std::to_string(chunkIndex) + "]";
    if (!message.empty())
        out += ": " + message;
    return out;
}

bool sleepUnlessStopped(std::chrono::milliseconds duration,
    const std::atomic<bool>& stopFlag,
    volatile std::sig_atomic_t* externalStop) {
    const auto slice = std::chrono::milliseconds(50);
    const auto deadline = std::chrono::steady_clock::now() + duration;

    while (!stopFlag.load(std::memory_order_relaxed)) {
        if (externalStop && *externalStop != 0)
            return false;

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return true;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(slice, left));
    }
    return false;
}
