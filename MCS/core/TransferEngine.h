#pragma once
#include <memory>
#include <string>
#include <vector>
#include <csignal>
#include <cstdint>

#include "utils.h"
#include "ByteStream.h"
#include "LoadBalancer.h"
#include "RangeTransfer.h"
#include "../net/IClient.h"
#include "../monitor/Logger.h"
#include "../monitor/ProgressTracker.h"

// Entry point for callers. Streams handed out borrow the engine's
// balancer and logger, so the engine must outlive them. Every session
// tracks its own progress; sessions may run concurrently.
class TransferEngine {
public:
    TransferEngine(const TransferConfig& config,
        ClientSource& clients,
        Logger& logger,
        volatile std::sig_atomic_t* externalStop = nullptr);

    // limit == 0 reads to the end of the object. Null on setup failure.
    std::unique_ptr<ByteStream> streamRange(const std::string& mediaId,
        std::uint64_t offset,
        std::uint64_t limit,
        TransferError& err);

    bool downloadToFile(const std::string& mediaId,
        const std::string& destination,
        TransferError& err);

    LoadBalancer& loadBalancer() { return balancer; }

private:
    bool prepare(const std::string& mediaId,
        std::vector<ClientEntry>& candidates,
        MediaRef& media,
        TransferError& err);
    bool resolveMedia(const std::vector<ClientEntry>& candidates,
        const std::string& mediaId,
        MediaRef& out,
        TransferError& err);
    TransferContext context(ProgressTracker* progress);

private:
    const TransferConfig& cfg;
    ClientSource& source;
    Logger& logger;
    volatile std::sig_atomic_t* externalStopSignal{ nullptr };

    LoadBalancer balancer;
};
