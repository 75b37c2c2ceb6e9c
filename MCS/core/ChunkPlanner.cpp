#include "ChunkPlanner.h"

#include <algorithm>

ChunkPlanner::ChunkPlanner(std::uint64_t unitChunkSize)
    : unit(unitChunkSize == 0 ? 1 : unitChunkSize) {
}

std::size_t ChunkPlanner::chunkCount(std::uint64_t totalRangeBytes,
    std::size_t maxWorkers,
    std::size_t clientCount) const {
    if (totalRangeBytes < unit || clientCount == 0)
        return 1;

    const std::uint64_t byUnit = std::max<std::uint64_t>(1, totalRangeBytes / unit);
    const std::uint64_t n = std::min<std::uint64_t>({
        std::max<std::uint64_t>(1, maxWorkers),
        clientCount,
        byUnit });

    return static_cast<std::size_t>(n);
}

bool ChunkPlanner::plan(std::uint64_t totalRangeBytes,
    std::uint64_t rangeStart,
    std::size_t maxWorkers,
    const std::vector<ClientEntry>& clients,
    ChunkPlan& out,
    TransferError& err) const {
    out.clear();

    if (clients.empty()) {
        err.set(ErrorKind::Precondition, "no clients available for transfer");
        return false;
    }

    if (totalRangeBytes == 0) {
        const auto& c = clients.front();
        out.push_back({ 0, rangeStart, rangeStart, 0, c.id, c.client });
        return true;
    }

    const std::size_t n = chunkCount(totalRangeBytes, maxWorkers, clients.size());
    const std::uint64_t partSize = totalRangeBytes / n;
    const std::uint64_t rangeEnd = rangeStart + totalRangeBytes - 1;

    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const std::uint64_t start = rangeStart + i * partSize;
        // Last chunk absorbs the remainder
        const std::uint64_t end = (i == n - 1) ? rangeEnd : start + partSize - 1;
        const auto& c = clients[i % clients.size()];

        out.push_back({
            i,
            start,
            end,
            end - start + 1,
            c.id,
            c.client
            });
    }

    return true;
}
