#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <functional>
#include <mutex>

class ThreadPool {
public:
    using WorkerFn = std::function<void()>;

    explicit ThreadPool(std::atomic<bool>& stopFlag);
    ~ThreadPool();

    void start(std::size_t n, WorkerFn worker);

    // Waits for workers to return on their own.
    void join();
    // Raises the stop flag, then waits.
    void shutdown();

private:
    std::vector<std::thread> threads;
    std::atomic<bool>& shouldStop;
    mutable std::mutex mtx;
};
