#include "ChunkFetcher.h"

ChunkFetcher::ChunkFetcher(LoadBalancer& balancer, RangeReader& reader, Logger& log)
    : loadBalancer(balancer),
    rangeReader(reader),
    logger(log) {
}

bool ChunkFetcher::fetchTo(const MediaRef& media,
    const ChunkDescriptor& chunk,
    const Sink& sink,
    TransferError& err) {
    LoadGuard guard(loadBalancer, chunk.clientId);

    const auto index = static_cast<std::int64_t>(chunk.index);
    if (!chunk.client) {
        err.set(ErrorKind::Precondition, "chunk has no client", index);
        return false;
    }

    bool ok = rangeReader.read(*chunk.client, media, chunk.start, chunk.size, index, sink, err);

    if (ok) {
        loadBalancer.resetErrors(chunk.clientId);
        return true;
    }

    switch (err.kind) {
    case ErrorKind::Connection:
    case ErrorKind::NotFound:
    case ErrorKind::Failed:
        loadBalancer.recordError(chunk.clientId);
        logger.error("Chunk " + std::to_string(chunk.index) + " (client " +
            std::to_string(chunk.clientId) + ") failed: " + err.describe());
        break;
    case ErrorKind::Cancelled:
        break;
    default:
        logger.error("Chunk " + std::to_string(chunk.index) + " failed: " + err.describe());
        break;
    }
    return false;
}

FetchResult ChunkFetcher::fetch(const MediaRef& media, const ChunkDescriptor& chunk) {
    FetchResult result;
    result.index = chunk.index;
    result.payload.reserve(static_cast<std::size_t>(chunk.size));

    result.success = fetchTo(media, chunk,
        [&](const char* data, std::size_t size) {
            result.payload.insert(result.payload.end(), data, data + size);
            return true;
        },
        result.error);

    if (!result.success)
        result.payload.clear();

    return result;
}
