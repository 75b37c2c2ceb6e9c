#pragma once
#include <vector>
#include <mutex>
#include <optional>
#include "utils.h"

// Hands out the chunks of a plan to worker threads and tracks their state.
class ChunkQueue {
public:
    explicit ChunkQueue(const ChunkPlan& plan);

    std::optional<ChunkDescriptor> getNext();
    void markDone(std::uint64_t chunkIndex);
    void markFailed(std::uint64_t chunkIndex);

    bool allSettled() const;
    std::size_t doneCount() const;

private:
    void setState(std::uint64_t chunkIndex, ChunkState state);

private:
    struct Entry {
        ChunkDescriptor chunk;
        ChunkState state;
    };

    std::vector<Entry> entries;
    mutable std::mutex mtx;
};
