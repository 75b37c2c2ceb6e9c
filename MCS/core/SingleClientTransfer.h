#pragma once
#include <memory>
#include <string>
#include <csignal>

#include "RangeTransfer.h"
#include "RangeReader.h"

// Streams one range straight from one client, buffer by buffer.
class DirectStream : public QueuedStream {
public:
    DirectStream(const MediaRef& media,
        const ClientEntry& client,
        std::uint64_t start,
        std::uint64_t length,
        Logger& logger,
        volatile std::sig_atomic_t* externalStop,
        const TransferConfig& config);
    ~DirectStream() override;

    void start();
    bool next(std::vector<char>& out) override;

private:
    void produce();

private:
    MediaRef media;
    ClientEntry client;
    std::uint64_t rangeStart;
    std::uint64_t rangeLength;
    Logger& logger;
    RangeReader reader;
};

class SingleClientTransfer : public RangeTransfer {
public:
    SingleClientTransfer(const TransferContext& ctx, const ClientEntry& client);

    std::unique_ptr<ByteStream> openStream(const MediaRef& media,
        std::uint64_t start,
        std::uint64_t length,
        TransferError& err) override;

    bool downloadToFile(const MediaRef& media,
        const std::string& destination,
        TransferError& err) override;

    const char* name() const override { return "single-client"; }

private:
    TransferContext ctx;
    ClientEntry client;
};
