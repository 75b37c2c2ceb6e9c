#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <csignal>
#include <cstdint>
#include <functional>

#include "utils.h"
#include "ByteStream.h"
#include "LoadBalancer.h"
#include "../monitor/Logger.h"
#include "../monitor/ProgressTracker.h"

// Everything a transfer borrows from the engine that created it.
// progress belongs to one download session and may be null; streams
// count their own bytes.
struct TransferContext {
    const TransferConfig& config;
    LoadBalancer& balancer;
    Logger& logger;
    ProgressTracker* progress;
    volatile std::sig_atomic_t* externalStop;
};

class RangeTransfer {
public:
    virtual ~RangeTransfer() = default;

    virtual std::unique_ptr<ByteStream> openStream(const MediaRef& media,
        std::uint64_t start,
        std::uint64_t length,
        TransferError& err) = 0;

    virtual bool downloadToFile(const MediaRef& media,
        const std::string& destination,
        TransferError& err) = 0;

    virtual const char* name() const = 0;
};

class ChunkedTransfer : public RangeTransfer {
public:
    ChunkedTransfer(const TransferContext& ctx, std::vector<ClientEntry> clients);

    std::unique_ptr<ByteStream> openStream(const MediaRef& media,
        std::uint64_t start,
        std::uint64_t length,
        TransferError& err) override;

    bool downloadToFile(const MediaRef& media,
        const std::string& destination,
        TransferError& err) override;

    const char* name() const override { return "chunked"; }

private:
    TransferContext ctx;
    std::vector<ClientEntry> clients;
};

// Chunking pays off only with several clients and at least one unit of data.
bool shouldChunk(const TransferConfig& config, std::size_t clientCount, std::uint64_t totalBytes);

// Null only when clients is empty.
std::unique_ptr<RangeTransfer> makeRangeTransfer(const TransferContext& ctx,
    const std::vector<ClientEntry>& clients,
    std::uint64_t totalBytes);

// Waits until finished() holds or the stop flag is raised, logging
// progress. The external signal raises the stop flag.
void superviseTransfer(const TransferContext& ctx,
    std::atomic<bool>& stopFlag,
    const std::function<bool()>& finished,
    std::uint64_t totalBytes);
