#pragma once
#include <atomic>
#include <cstdint>
#include <functional>

#include "utils.h"
#include "../net/IClient.h"
#include "../monitor/Logger.h"
#include "../monitor/ProgressTracker.h"

// Pulls [start, start + length) out of one client in read units, riding
// out rate limits and clipping whatever the client sends past the end.
class RangeReader {
public:
    using Sink = std::function<bool(const char*, std::size_t)>;

    RangeReader(std::uint64_t readUnitSize,
        std::atomic<bool>& stopFlag,
        Logger& logger,
        ProgressTracker* progress = nullptr);

    bool read(IClient& client,
        const MediaRef& media,
        std::uint64_t start,
        std::uint64_t length,
        std::int64_t chunkIndex,
        const Sink& sink,
        TransferError& err);

private:
    std::uint64_t readUnit;
    std::atomic<bool>& shouldStop;
    Logger& logger;
    ProgressTracker* progress;
};
