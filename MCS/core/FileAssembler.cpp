#include "FileAssembler.h"
#include "ChunkFetcher.h"
#include "ChunkQueue.h"
#include "RangeReader.h"
#include "ThreadPool.h"
#include "../io/FileWriter.h"
#include "../io/TempDirectory.h"

#include <mutex>
#include <atomic>
#include <cstdio>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
fs::path partPath(const fs::path& dir, std::uint64_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%03llu", static_cast<unsigned long long>(index));
    return dir / name;
}
}

FileAssembler::FileAssembler(const TransferContext& context)
    : ctx(context) {
}

bool FileAssembler::assemble(const MediaRef& media,
    const ChunkPlan& plan,
    const std::string& destination,
    TransferError& err) {
    TempDirectory workDir(ctx.config.tempDirectory, "mcs_parallel_", ctx.logger);
    if (!workDir.valid()) {
        err.set(ErrorKind::Io, "cannot create temporary working directory");
        return false;
    }

    std::vector<fs::path> parts;
    parts.reserve(plan.size());
    for (const auto& chunk : plan)
        parts.push_back(partPath(workDir.path(), chunk.index));

    ctx.logger.info("Downloading " + media.mediaId + " (" + std::to_string(media.size) +
        " bytes) in " + std::to_string(plan.size()) + " chunks");

    std::atomic<bool> stopFlag{ false };
    RangeReader reader(ctx.config.readUnitSize, stopFlag, ctx.logger, ctx.progress);
    ChunkFetcher fetcher(ctx.balancer, reader, ctx.logger);
    ChunkQueue queue(plan);

    std::mutex errMutex;
    TransferError firstError;

    auto worker = [&]() {
        while (!stopFlag.load(std::memory_order_relaxed)) {
            auto chunk = queue.getNext();
            if (!chunk.has_value())
                return;

            TransferError chunkErr;
            const fs::path& part = parts[static_cast<std::size_t>(chunk->index)];
            FileWriter writer(part.string());

            bool ok = writer.open();
            if (!ok) {
                chunkErr.set(ErrorKind::Io, "cannot create " + part.string(),
                    static_cast<std::int64_t>(chunk->index));
            }
            else {
                ok = fetcher.fetchTo(media, *chunk,
                    [&writer](const char* data, std::size_t size) {
                        return writer.append(data, size);
                    },
                    chunkErr);
            }
            writer.close();

            if (ok) {
                queue.markDone(chunk->index);
                continue;
            }

            queue.markFailed(chunk->index);
            {
                std::lock_guard<std::mutex> lock(errMutex);
                if (!firstError.isSet())
                    firstError = chunkErr;
            }
            stopFlag.store(true);
            return;
        }
    };

    {
        ThreadPool pool(stopFlag);
        pool.start(plan.size(), worker);
        superviseTransfer(ctx, stopFlag, [&queue]() { return queue.allSettled(); }, media.size);
        pool.join();
    }

    if (firstError.isSet()) {
        err = firstError;
        return false;
    }

    if (queue.doneCount() != plan.size()) {
        err.set(ErrorKind::Cancelled, "download of " + media.mediaId + " cancelled");
        return false;
    }

    return concatenate(parts, destination, media.size, err);
}

bool FileAssembler::concatenate(const std::vector<fs::path>& parts,
    const std::string& destination,
    std::uint64_t expectedSize,
    TransferError& err) {
    FileWriter out(destination);
    if (!out.open()) {
        err.set(ErrorKind::Io, "cannot open " + destination + " for writing");
        return false;
    }

    std::vector<char> buffer(ctx.config.copyBufferSize);
    bool ok = true;

    for (std::size_t i = 0; i < parts.size() && ok; ++i) {
        std::ifstream in(parts[i], std::ios::binary);
        if (!in) {
            err.set(ErrorKind::Io, "cannot read " + parts[i].string(), static_cast<std::int64_t>(i));
            ok = false;
            break;
        }

        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize n = in.gcount();
            if (n > 0 && !out.append(buffer.data(), static_cast<std::size_t>(n))) {
                err.set(ErrorKind::Io, "write to " + destination + " failed", static_cast<std::int64_t>(i));
                ok = false;
                break;
            }
        }

        if (ok && in.bad()) {
            err.set(ErrorKind::Io, "read from " + parts[i].string() + " failed", static_cast<std::int64_t>(i));
            ok = false;
        }
        in.close();

        std::error_code ec;
        fs::remove(parts[i], ec);
        if (ec)
            ctx.logger.warn("Could not delete " + parts[i].string() + ": " + ec.message());
    }

    if (ok && !out.flush()) {
        err.set(ErrorKind::Io, "failed to flush " + destination);
        ok = false;
    }
    out.close();

    if (!ok) {
        std::error_code ec;
        fs::remove(destination, ec);
        return false;
    }

    return verifyFileSize(destination, expectedSize, ctx.logger, err);
}

bool verifyFileSize(const std::string& path,
    std::uint64_t expectedSize,
    Logger& logger,
    TransferError& err) {
    std::error_code ec;
    const std::uint64_t actual = fs::file_size(path, ec);
    if (ec) {
        err.set(ErrorKind::Io, "cannot stat " + path + ": " + ec.message());
        return false;
    }

    if (actual != expectedSize) {
        err.set(ErrorKind::Integrity, path + " is " + std::to_string(actual) +
            " bytes, expected " + std::to_string(expectedSize));
        logger.error("Size check failed: " + err.message);
        return false;
    }

    logger.info("Verified " + path + " (" + std::to_string(actual) + " bytes)");
    return true;
}
