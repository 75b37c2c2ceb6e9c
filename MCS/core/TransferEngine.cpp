#include "TransferEngine.h"

#include <atomic>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <algorithm>

TransferEngine::TransferEngine(const TransferConfig& config,
    ClientSource& clients,
    Logger& log,
    volatile std::sig_atomic_t* externalStop)
    : cfg(config),
    source(clients),
    logger(log),
    externalStopSignal(externalStop),
    balancer(config.unhealthyThreshold) {
}

TransferContext TransferEngine::context(ProgressTracker* progress) {
    return { cfg, balancer, logger, progress, externalStopSignal };
}

bool TransferEngine::resolveMedia(const std::vector<ClientEntry>& candidates,
    const std::string& mediaId,
    MediaRef& out,
    TransferError& err) {
    ClientEntry entry{};
    if (!balancer.selectClient(candidates, entry) || !entry.client) {
        err.set(ErrorKind::Precondition, "no clients available for transfer");
        return false;
    }

    LoadGuard guard(balancer, entry.id);
    std::atomic<bool> stopFlag{ false };

    for (;;) {
        ReadStatus status = entry.client->getMediaRef(mediaId, out);

        switch (status.outcome) {
        case ReadOutcome::Ok:
            balancer.resetErrors(entry.id);
            return true;

        case ReadOutcome::RateLimited: {
            logger.warn("Metadata lookup for " + mediaId + " rate limited, waiting " +
                std::to_string(status.retryAfter.count()) + " ms");
            if (!sleepUnlessStopped(status.retryAfter, stopFlag, externalStopSignal)) {
                err.set(ErrorKind::Cancelled, "cancelled while waiting for " + mediaId);
                return false;
            }
            continue;
        }

        case ReadOutcome::ConnectionFatal:
            balancer.recordError(entry.id);
            err.set(ErrorKind::Connection, status.message);
            break;

        case ReadOutcome::NotFound:
            err.set(ErrorKind::NotFound, mediaId + ": " + status.message);
            break;

        case ReadOutcome::Failed:
        case ReadOutcome::Aborted:
            balancer.recordError(entry.id);
            err.set(ErrorKind::Failed, status.message);
            break;
        }

        logger.error("Metadata lookup for " + mediaId + " via client " +
            std::to_string(entry.id) + " failed: " + err.describe());
        return false;
    }
}

bool TransferEngine::prepare(const std::string& mediaId,
    std::vector<ClientEntry>& candidates,
    MediaRef& media,
    TransferError& err) {
    const auto all = source.listAvailableClients();
    if (all.empty()) {
        err.set(ErrorKind::Precondition, "no clients available for transfer");
        logger.error(err.describe());
        return false;
    }

    candidates = balancer.healthyClients(all);
    if (candidates.size() < all.size()) {
        logger.warn("Skipping " + std::to_string(all.size() - candidates.size()) +
            " unhealthy client(s)");
    }

    if (!resolveMedia(candidates, mediaId, media, err))
        return false;

    // Without range support only one plain read of the object is possible
    if (!media.streamable && candidates.size() > 1) {
        ClientEntry only{};
        balancer.selectClient(candidates, only);
        candidates.assign(1, only);
    }

    return true;
}

std::unique_ptr<ByteStream> TransferEngine::streamRange(const std::string& mediaId,
    std::uint64_t offset,
    std::uint64_t limit,
    TransferError& err) {
    std::vector<ClientEntry> candidates;
    MediaRef media;
    if (!prepare(mediaId, candidates, media, err))
        return nullptr;

    if (offset > 0 && !media.streamable) {
        err.set(ErrorKind::Precondition, mediaId + " does not support range reads");
        logger.error(err.describe());
        return nullptr;
    }

    std::uint64_t length = 0;
    if (media.size > 0) {
        if (offset >= media.size) {
            err.set(ErrorKind::Precondition, "offset " + std::to_string(offset) +
                " is past the end of " + mediaId + " (" + std::to_string(media.size) + " bytes)");
            logger.error(err.describe());
            return nullptr;
        }

        const std::uint64_t last = media.size - 1;
        // limit - 1 >= last - offset also covers limits that would overflow offset + limit
        const std::uint64_t end = (limit == 0 || limit - 1 >= last - offset) ? last : offset + limit - 1;
        length = end - offset + 1;
    }
    else if (offset > 0) {
        err.set(ErrorKind::Precondition, mediaId + " is empty");
        logger.error(err.describe());
        return nullptr;
    }

    auto transfer = makeRangeTransfer(context(nullptr), candidates, length);
    if (!transfer) {
        err.set(ErrorKind::Precondition, "no clients available for transfer");
        return nullptr;
    }

    logger.info("Streaming " + mediaId + " bytes " + std::to_string(offset) + "+" +
        std::to_string(length) + " via " + transfer->name() + " path");

    return transfer->openStream(media, offset, length, err);
}

bool TransferEngine::downloadToFile(const std::string& mediaId,
    const std::string& destination,
    TransferError& err) {
    std::vector<ClientEntry> candidates;
    MediaRef media;
    if (!prepare(mediaId, candidates, media, err))
        return false;

    ProgressTracker progress(media.size);
    auto transfer = makeRangeTransfer(context(&progress), candidates, media.size);
    if (!transfer) {
        err.set(ErrorKind::Precondition, "no clients available for transfer");
        return false;
    }

    const auto startTime = std::chrono::steady_clock::now();
    const bool success = transfer->downloadToFile(media, destination, err);
    const std::chrono::duration<double> duration = std::chrono::steady_clock::now() - startTime;

    const double avgSpeed = progress.speedBytesPerSec();

    std::ostringstream conclusion;
    conclusion << "Download of " << mediaId << " "
        << (success ? "completed" : "failed")
        << " in " << std::fixed << std::setprecision(2)
        << duration.count() << "s, avg speed "
        << std::setprecision(2) << (avgSpeed * 8.0 / 1'000'000.0)
        << " Mbps, " << transfer->name() << " path, "
        << candidates.size() << " client(s)";
    if (!success)
        conclusion << " (" << err.describe() << ")";

    if (success)
        logger.info(conclusion.str());
    else
        logger.error(conclusion.str());
    logger.info(balancer.formatStats());

    return success;
}
