#pragma once
#include <atomic>
#include <cstdint>
#include <chrono>

class ProgressTracker {
public:
    explicit ProgressTracker(std::uint64_t totalBytes = 0);

    void add(std::uint64_t bytes);
    std::uint64_t transferred() const;
    double progress() const;
    double speedBytesPerSec() const;

private:
    std::atomic<std::uint64_t> total{ 0 };
    std::atomic<std::uint64_t> current{ 0 };
    const std::chrono::steady_clock::time_point start;
};
