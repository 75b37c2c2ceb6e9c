#include "ChunkQueue.h"

ChunkQueue::ChunkQueue(const ChunkPlan& plan) {
    entries.reserve(plan.size());
    for (const auto& chunk : plan)
        entries.push_back({ chunk, ChunkState::Pending });
}

std::optional<ChunkDescriptor> ChunkQueue::getNext() {
    std::lock_guard<std::mutex> lock(mtx);
    for (auto& e : entries) {
        if (e.state == ChunkState::Pending) {
            e.state = ChunkState::InProgress;
            return e.chunk;
        }
    }
    return std::nullopt;
}

void ChunkQueue::setState(std::uint64_t chunkIndex, ChunkState state) {
    std::lock_guard<std::mutex> lock(mtx);
    for (auto& e : entries) {
        if (e.chunk.index == chunkIndex) {
            e.state = state;
            break;
        }
    }
}

void ChunkQueue::markDone(std::uint64_t chunkIndex) {
    setState(chunkIndex, ChunkState::Done);
}

void ChunkQueue::markFailed(std::uint64_t chunkIndex) {
    setState(chunkIndex, ChunkState::Failed);
}

bool ChunkQueue::allSettled() const {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& e : entries) {
        if (e.state == ChunkState::Pending || e.state == ChunkState::InProgress)
            return false;
    }
    return true;
}

std::size_t ChunkQueue::doneCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::size_t done = 0;
    for (const auto& e : entries) {
        if (e.state == ChunkState::Done)
            ++done;
    }
    return done;
}
