#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

#include "utils.h"

class ChunkPlanner {
public:
    explicit ChunkPlanner(std::uint64_t unitChunkSize);

    // Splits [rangeStart, rangeStart + totalRangeBytes) into contiguous
    // chunks assigned round-robin over clients. Fails only when clients
    // is empty.
    bool plan(std::uint64_t totalRangeBytes,
        std::uint64_t rangeStart,
        std::size_t maxWorkers,
        const std::vector<ClientEntry>& clients,
        ChunkPlan& out,
        TransferError& err) const;

    std::size_t chunkCount(std::uint64_t totalRangeBytes,
        std::size_t maxWorkers,
        std::size_t clientCount) const;

    std::uint64_t unitSize() const { return unit; }

private:
    std::uint64_t unit;
};
