#include "ByteStream.h"

#include <chrono>

QueuedStream::QueuedStream(std::size_t queueCapacity,
    std::uint64_t totalBytes,
    volatile std::sig_atomic_t* stopSignal)
    : externalStop(stopSignal),
    progress(totalBytes),
    items(queueCapacity),
    pool(stopFlag) {
}

QueuedStream::~QueuedStream() {
    halt();
}

void QueuedStream::cancel() {
    cancelled.store(true);
    stopFlag.store(true);
    items.close();
}

void QueuedStream::halt() {
    cancel();
    pool.join();
}

bool QueuedStream::pull(StreamItem& item) {
    const auto pollInterval = std::chrono::milliseconds(50);

    while (!cancelled.load()) {
        if (externalStop && *externalStop != 0) {
            cancel();
            break;
        }

        const PopStatus status = items.popFor(item, pollInterval);
        if (status == PopStatus::Item)
            return true;
        if (status == PopStatus::Closed)
            break;
    }

    if (!err.isSet())
        err.set(ErrorKind::Cancelled, "stream cancelled");
    return false;
}

void QueuedStream::finish() {
    finished = true;
    halt();
}
