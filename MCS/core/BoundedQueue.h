#pragma once
#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstddef>

enum class PopStatus {
    Item,
    Timeout,
    Closed
};

// Blocking FIFO with a fixed capacity. close() releases every waiter:
// push then fails, pop drains what is left and then fails.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
        : cap(capacity == 0 ? 1 : capacity) {
    }

    bool push(T item) {
        std::unique_lock<std::mutex> lock(mtx);
        notFull.wait(lock, [&]() { return closed || items.size() < cap; });
        if (closed)
            return false;

        items.push_back(std::move(item));
        lock.unlock();
        notEmpty.notify_one();
        return true;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mtx);
        notEmpty.wait(lock, [&]() { return closed || !items.empty(); });
        if (items.empty())
            return false;

        out = std::move(items.front());
        items.pop_front();
        lock.unlock();
        notFull.notify_one();
        return true;
    }

    // Like pop(), but gives up after `timeout` with nothing to hand out.
    template <typename Rep, typename Period>
    PopStatus popFor(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        if (!notEmpty.wait_for(lock, timeout, [&]() { return closed || !items.empty(); }))
            return PopStatus::Timeout;
        if (items.empty())
            return PopStatus::Closed;

        out = std::move(items.front());
        items.pop_front();
        lock.unlock();
        notFull.notify_one();
        return PopStatus::Item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            closed = true;
        }
        notFull.notify_all();
        notEmpty.notify_all();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return items.size();
    }

private:
    std::size_t cap;
    std::deque<T> items;
    bool closed = false;
    mutable std::mutex mtx;
    std::condition_variable notFull;
    std::condition_variable notEmpty;
};
