#include "SingleClientTransfer.h"
#include "FileAssembler.h"
#include "ThreadPool.h"
#include "../io/FileWriter.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

DirectStream::DirectStream(const MediaRef& mediaRef,
    const ClientEntry& entry,
    std::uint64_t start,
    std::uint64_t length,
    Logger& log,
    volatile std::sig_atomic_t* externalStop,
    const TransferConfig& config)
    : QueuedStream(std::max<std::size_t>(2, config.queueDepthPerChunk), length, externalStop),
    media(mediaRef),
    client(entry),
    rangeStart(start),
    rangeLength(length),
    logger(log),
    reader(config.readUnitSize, stopFlag, log, &progress) {
}

DirectStream::~DirectStream() {
    halt();
}

void DirectStream::start() {
    pool.start(1, [this]() { produce(); });
}

void DirectStream::produce() {
    TransferError readErr;
    bool ok = false;

    if (!client.client) {
        readErr.set(ErrorKind::Precondition, "no client for direct stream");
    }
    else {
        ok = reader.read(*client.client, media, rangeStart, rangeLength, -1,
            [this](const char* data, std::size_t size) {
                StreamItem item;
                item.kind = StreamItem::Kind::Data;
                item.data.assign(data, data + size);
                return items.push(std::move(item));
            },
            readErr);
    }

    StreamItem last;
    if (ok) {
        last.kind = StreamItem::Kind::End;
    }
    else {
        last.kind = StreamItem::Kind::Failure;
        last.error = readErr;
    }
    items.push(std::move(last));
}

bool DirectStream::next(std::vector<char>& out) {
    if (finished)
        return false;

    StreamItem item;
    if (!pull(item)) {
        finish();
        return false;
    }

    switch (item.kind) {
    case StreamItem::Kind::Data:
        out = std::move(item.data);
        return true;

    case StreamItem::Kind::End:
        finish();
        return false;

    case StreamItem::Kind::Failure:
        err = item.error;
        logger.error("Stream of " + media.mediaId + " from client " +
            std::to_string(client.id) + " aborted: " + err.describe());
        finish();
        return false;
    }
    return false;
}

SingleClientTransfer::SingleClientTransfer(const TransferContext& context, const ClientEntry& entry)
    : ctx(context),
    client(entry) {
}

std::unique_ptr<ByteStream> SingleClientTransfer::openStream(const MediaRef& media,
    std::uint64_t start,
    std::uint64_t length,
    TransferError& err) {
    if (!client.client) {
        err.set(ErrorKind::Precondition, "no client available for transfer");
        return nullptr;
    }

    auto stream = std::make_unique<DirectStream>(media, client, start, length,
        ctx.logger, ctx.externalStop, ctx.config);
    stream->start();
    return stream;
}

bool SingleClientTransfer::downloadToFile(const MediaRef& media,
    const std::string& destination,
    TransferError& err) {
    if (!client.client) {
        err.set(ErrorKind::Precondition, "no client available for transfer");
        return false;
    }

    FileWriter writer(destination);
    if (!writer.open()) {
        err.set(ErrorKind::Io, "cannot open " + destination + " for writing");
        return false;
    }

    ctx.logger.info("Downloading " + media.mediaId + " (" + std::to_string(media.size) +
        " bytes) from client " + std::to_string(client.id));

    std::atomic<bool> stopFlag{ false };
    std::atomic<bool> done{ false };
    RangeReader reader(ctx.config.readUnitSize, stopFlag, ctx.logger, ctx.progress);

    bool ok = false;
    TransferError readErr;

    {
        ThreadPool pool(stopFlag);
        pool.start(1, [&]() {
            ok = reader.read(*client.client, media, 0, media.size, -1,
                [&writer](const char* data, std::size_t size) {
                    return writer.append(data, size);
                },
                readErr);
            done.store(true);
        });

        superviseTransfer(ctx, stopFlag, [&done]() { return done.load(); }, media.size);
        pool.join();
    }

    const bool flushed = writer.flush();
    writer.close();

    if (ok && !flushed) {
        ok = false;
        readErr.set(ErrorKind::Io, "failed to flush " + destination);
    }

    if (!ok) {
        std::error_code ec;
        std::filesystem::remove(destination, ec);
        err = readErr;
        return false;
    }

    return verifyFileSize(destination, media.size, ctx.logger, err);
}
