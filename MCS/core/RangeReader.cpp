#include "RangeReader.h"

#include <algorithm>
#include <string>

namespace {
std::string chunkLabel(std::int64_t chunkIndex) {
    return chunkIndex >= 0 ? "chunk " + std::to_string(chunkIndex) : "range";
}
}

RangeReader::RangeReader(std::uint64_t readUnitSize,
    std::atomic<bool>& stopFlag,
    Logger& log,
    ProgressTracker* tracker)
    : readUnit(readUnitSize == 0 ? 1 : readUnitSize),
    shouldStop(stopFlag),
    logger(log),
    progress(tracker) {
}

bool RangeReader::read(IClient& client,
    const MediaRef& media,
    std::uint64_t start,
    std::uint64_t length,
    std::int64_t chunkIndex,
    const Sink& sink,
    TransferError& err) {
    if (length == 0)
        return true;

    const std::uint64_t end = start + length - 1;
    std::uint64_t cursor = start;

    while (cursor <= end) {
        if (shouldStop.load(std::memory_order_relaxed)) {
            err.set(ErrorKind::Cancelled, "transfer cancelled", chunkIndex);
            return false;
        }

        const std::uint64_t remaining = end - cursor + 1;
        // Objects without range support only come back whole
        const std::uint64_t limit = media.streamable ? std::min(readUnit, remaining) : remaining;
        const std::uint64_t before = cursor;
        bool reachedEnd = false;
        bool sinkFailed = false;

        ReadStatus status = client.rangeRead(media, cursor, limit,
            [&](const char* data, std::size_t size) {
                if (shouldStop.load(std::memory_order_relaxed))
                    return false;
                if (size == 0)
                    return true;

                const std::uint64_t room = end - cursor + 1;
                const std::size_t take = static_cast<std::size_t>(std::min<std::uint64_t>(size, room));

                if (!sink(data, take)) {
                    sinkFailed = true;
                    return false;
                }

                cursor += take;
                if (progress)
                    progress->add(take);

                // Anything past the chunk end is dropped here
                if (cursor > end) {
                    reachedEnd = true;
                    return false;
                }
                return true;
            });

        if (reachedEnd)
            break;

        switch (status.outcome) {
        case ReadOutcome::Ok:
            if (cursor == before) {
                err.set(ErrorKind::Failed,
                    "client returned no data at offset " + std::to_string(cursor), chunkIndex);
                return false;
            }
            continue;

        case ReadOutcome::RateLimited:
            logger.warn(chunkLabel(chunkIndex) + " rate limited at offset " +
                std::to_string(cursor) + ", waiting " +
                std::to_string(status.retryAfter.count()) + " ms");
            if (!sleepUnlessStopped(status.retryAfter, shouldStop)) {
                err.set(ErrorKind::Cancelled, "transfer cancelled during backoff", chunkIndex);
                return false;
            }
            continue;

        case ReadOutcome::ConnectionFatal:
            err.set(ErrorKind::Connection, status.message, chunkIndex);
            return false;

        case ReadOutcome::NotFound:
            err.set(ErrorKind::NotFound, status.message, chunkIndex);
            return false;

        case ReadOutcome::Aborted:
            if (sinkFailed)
                err.set(ErrorKind::Io, "failed to store received data", chunkIndex);
            else if (shouldStop.load(std::memory_order_relaxed))
                err.set(ErrorKind::Cancelled, "transfer cancelled", chunkIndex);
            else
                err.set(ErrorKind::Failed, status.message, chunkIndex);
            return false;

        case ReadOutcome::Failed:
            err.set(ErrorKind::Failed, status.message, chunkIndex);
            return false;
        }
    }

    return true;
}
