#include "ThreadPool.h"

ThreadPool::ThreadPool(std::atomic<bool>& stopFlag)
    : shouldStop(stopFlag) {
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::start(std::size_t n, WorkerFn worker) {
    std::lock_guard<std::mutex> lock(mtx);

    for (std::size_t i = 0; i < n; ++i) {
        threads.emplace_back(worker);
    }
}

void ThreadPool::join() {
    std::lock_guard<std::mutex> lock(mtx);

    for (auto& t : threads) {
        if (t.joinable())
            t.join();
    }

    threads.clear();
}

void ThreadPool::shutdown() {
    shouldStop.store(true);
    join();
}
