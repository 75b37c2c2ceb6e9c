#include "ProgressTracker.h"

ProgressTracker::ProgressTracker(std::uint64_t totalBytes)
    : total(totalBytes),
    start(std::chrono::steady_clock::now()) {
}

void ProgressTracker::add(std::uint64_t bytes) {
    current.fetch_add(bytes, std::memory_order_relaxed);
}

std::uint64_t ProgressTracker::transferred() const {
    return current.load(std::memory_order_relaxed);
}

double ProgressTracker::progress() const {
    const std::uint64_t t = total.load(std::memory_order_relaxed);
    return t == 0 ? 0.0 : (double)transferred() / (double)t;
}

double ProgressTracker::speedBytesPerSec() const {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    return elapsed.count() > 0 ? transferred() / elapsed.count() : 0.0;
}
