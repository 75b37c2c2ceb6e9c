#pragma once
#include <atomic>
#include <vector>
#include <csignal>
#include <cstdint>
#include <cstddef>

#include "utils.h"
#include "BoundedQueue.h"
#include "ThreadPool.h"
#include "../monitor/ProgressTracker.h"

// Finite, non-restartable byte sequence. next() returns false at the end
// or on failure; failed()/error() tell the two apart.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual bool next(std::vector<char>& out) = 0;

    // Safe from any thread. Stops background work; a later next() fails.
    virtual void cancel() = 0;

    virtual bool failed() const = 0;
    virtual const TransferError& error() const = 0;

    // Bytes fetched from clients so far in this session.
    virtual std::uint64_t transferred() const = 0;
};

struct StreamItem {
    enum class Kind {
        Data,
        Failure,
        End
    };

    Kind kind = Kind::Data;
    std::uint64_t index = 0;
    std::vector<char> data;
    TransferError error;
};

// Background producers push StreamItems, the consumer pulls them.
// Each session counts its own bytes; a raised external signal cancels it.
class QueuedStream : public ByteStream {
public:
    QueuedStream(std::size_t queueCapacity,
        std::uint64_t totalBytes,
        volatile std::sig_atomic_t* externalStop);
    ~QueuedStream() override;

    void cancel() override;
    bool failed() const override { return err.isSet(); }
    const TransferError& error() const override { return err; }
    std::uint64_t transferred() const override { return progress.transferred(); }

protected:
    // Pops one item; on a closed queue or a raised external signal
    // records a cancellation.
    bool pull(StreamItem& item);
    // Consumer side: ends the session and waits for every producer.
    void finish();
    // Cancel and join; derived destructors call this before their members go.
    void halt();

protected:
    std::atomic<bool> stopFlag{ false };
    std::atomic<bool> cancelled{ false };
    volatile std::sig_atomic_t* externalStop;
    ProgressTracker progress;
    BoundedQueue<StreamItem> items;
    ThreadPool pool;

    TransferError err;
    bool finished = false;
};
