#pragma once
#include <map>
#include <deque>
#include <vector>
#include <atomic>
#include <csignal>
#include <cstdint>

#include "utils.h"
#include "ByteStream.h"
#include "ChunkQueue.h"
#include "ChunkFetcher.h"
#include "LoadBalancer.h"
#include "RangeReader.h"
#include "../monitor/Logger.h"

// Turns chunks arriving in any order into strictly ascending order.
// Early arrivals wait in a pending map until everything before them has
// been released.
class ReorderBuffer {
public:
    explicit ReorderBuffer(std::uint64_t chunkCount);

    // Appends every payload that became releasable to `released`.
    // Rejects indices already released, buffered, or out of range.
    bool accept(std::uint64_t index,
        std::vector<char> payload,
        std::vector<std::vector<char>>& released);

    std::uint64_t nextExpected() const { return nextExpectedIndex; }
    std::size_t pending() const { return buffered.size(); }
    bool complete() const { return nextExpectedIndex >= total; }

private:
    std::uint64_t total;
    std::uint64_t nextExpectedIndex = 0;
    std::map<std::uint64_t, std::vector<char>> buffered;
};

// Fetches every chunk of a plan concurrently and yields the bytes in
// chunk order. The first failing chunk stops the rest of the session.
class ChunkedStream : public QueuedStream {
public:
    ChunkedStream(const MediaRef& media,
        const ChunkPlan& plan,
        LoadBalancer& balancer,
        Logger& logger,
        volatile std::sig_atomic_t* externalStop,
        const TransferConfig& config);
    ~ChunkedStream() override;

    void start();
    bool next(std::vector<char>& out) override;

    std::size_t chunkCount() const { return plan.size(); }
    std::size_t bufferedChunks() const { return reorder.pending(); }

private:
    void runWorker();

private:
    MediaRef media;
    ChunkPlan plan;
    Logger& logger;

    RangeReader reader;
    ChunkFetcher fetcher;
    ChunkQueue chunkQueue;
    std::atomic<bool> errorRaised{ false };

    ReorderBuffer reorder;
    std::deque<std::vector<char>> ready;
};
