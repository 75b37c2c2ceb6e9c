#include "StreamReassembler.h"

#include <algorithm>

namespace {
std::uint64_t totalBytes(const ChunkPlan& plan) {
    std::uint64_t sum = 0;
    for (const auto& chunk : plan)
        sum += chunk.size;
    return sum;
}
}

ReorderBuffer::ReorderBuffer(std::uint64_t chunkCount)
    : total(chunkCount) {
}

bool ReorderBuffer::accept(std::uint64_t index,
    std::vector<char> payload,
    std::vector<std::vector<char>>& released) {
    if (index < nextExpectedIndex || index >= total || buffered.count(index) != 0)
        return false;

    if (index != nextExpectedIndex) {
        buffered.emplace(index, std::move(payload));
        return true;
    }

    released.push_back(std::move(payload));
    ++nextExpectedIndex;

    // Drain successors that were already waiting
    auto it = buffered.find(nextExpectedIndex);
    while (it != buffered.end()) {
        released.push_back(std::move(it->second));
        buffered.erase(it);
        ++nextExpectedIndex;
        it = buffered.find(nextExpectedIndex);
    }

    return true;
}

ChunkedStream::ChunkedStream(const MediaRef& mediaRef,
    const ChunkPlan& chunkPlan,
    LoadBalancer& balancer,
    Logger& log,
    volatile std::sig_atomic_t* externalStop,
    const TransferConfig& config)
    : QueuedStream(std::max<std::size_t>(2, config.queueDepthPerChunk * chunkPlan.size()),
        totalBytes(chunkPlan),
        externalStop),
    media(mediaRef),
    plan(chunkPlan),
    logger(log),
    reader(config.readUnitSize, stopFlag, log, &progress),
    fetcher(balancer, reader, log),
    chunkQueue(chunkPlan),
    reorder(chunkPlan.size()) {
}

ChunkedStream::~ChunkedStream() {
    halt();
}

void ChunkedStream::start() {
    logger.info("Streaming " + media.mediaId + " in " + std::to_string(plan.size()) + " chunks");
    pool.start(plan.size(), [this]() { runWorker(); });
}

void ChunkedStream::runWorker() {
    while (!stopFlag.load(std::memory_order_relaxed)) {
        auto chunk = chunkQueue.getNext();
        if (!chunk.has_value())
            return;

        FetchResult result = fetcher.fetch(media, *chunk);

        if (result.success) {
            chunkQueue.markDone(chunk->index);
            if (errorRaised.load())
                return;

            StreamItem item;
            item.kind = StreamItem::Kind::Data;
            item.index = result.index;
            item.data = std::move(result.payload);
            if (!items.push(std::move(item)))
                return;
            continue;
        }

        chunkQueue.markFailed(chunk->index);

        // Only the first failure is reported; it also cancels the others
        bool expected = false;
        if (!errorRaised.compare_exchange_strong(expected, true))
            return;

        stopFlag.store(true);

        StreamItem item;
        item.kind = StreamItem::Kind::Failure;
        item.index = result.index;
        item.error = result.error;
        items.push(std::move(item));
        return;
    }
}

bool ChunkedStream::next(std::vector<char>& out) {
    while (ready.empty()) {
        if (finished)
            return false;

        if (reorder.complete()) {
            finish();
            return false;
        }

        StreamItem item;
        if (!pull(item)) {
            finish();
            return false;
        }

        if (item.kind == StreamItem::Kind::Failure) {
            err = item.error;
            logger.error("Stream of " + media.mediaId + " aborted: " + err.describe());
            finish();
            return false;
        }

        std::vector<std::vector<char>> released;
        if (!reorder.accept(item.index, std::move(item.data), released)) {
            err.set(ErrorKind::Failed, "unexpected chunk delivered", static_cast<std::int64_t>(item.index));
            finish();
            return false;
        }

        for (auto& payload : released)
            ready.push_back(std::move(payload));
    }

    out = std::move(ready.front());
    ready.pop_front();
    return true;
}
