#include "RangeTransfer.h"
#include "ChunkPlanner.h"
#include "FileAssembler.h"
#include "SingleClientTransfer.h"
#include "StreamReassembler.h"

#include <thread>
#include <chrono>
#include <sstream>
#include <iomanip>

bool shouldChunk(const TransferConfig& config, std::size_t clientCount, std::uint64_t totalBytes) {
    return clientCount >= 2
        && config.maxWorkers >= 2
        && totalBytes >= config.unitChunkSize;
}

std::unique_ptr<RangeTransfer> makeRangeTransfer(const TransferContext& ctx,
    const std::vector<ClientEntry>& clients,
    std::uint64_t totalBytes) {
    if (clients.empty())
        return nullptr;

    if (shouldChunk(ctx.config, clients.size(), totalBytes))
        return std::make_unique<ChunkedTransfer>(ctx, clients);

    ClientEntry best{};
    ctx.balancer.selectClient(clients, best);
    return std::make_unique<SingleClientTransfer>(ctx, best);
}

void superviseTransfer(const TransferContext& ctx,
    std::atomic<bool>& stopFlag,
    const std::function<bool()>& finished,
    std::uint64_t totalBytes) {
    auto lastProgressLog = std::chrono::steady_clock::now();

    while (!stopFlag.load(std::memory_order_relaxed)) {
        if (ctx.externalStop && *ctx.externalStop != 0) {
            ctx.logger.warn("Stop requested, cancelling transfer");
            stopFlag.store(true, std::memory_order_relaxed);
            break;
        }

        if (finished())
            return;

        auto now = std::chrono::steady_clock::now();
        if (ctx.progress && now - lastProgressLog >= ctx.config.progressInterval) {
            const auto done = ctx.progress->transferred();
            const double pct = ctx.progress->progress() * 100.0;

            std::ostringstream os;
            os << "Progress: "
                << done << "/" << totalBytes << " bytes ("
                << std::fixed << std::setprecision(1) << pct << "%)";

            ctx.logger.info(os.str());
            lastProgressLog = now;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

ChunkedTransfer::ChunkedTransfer(const TransferContext& context, std::vector<ClientEntry> available)
    : ctx(context),
    clients(std::move(available)) {
}

std::unique_ptr<ByteStream> ChunkedTransfer::openStream(const MediaRef& media,
    std::uint64_t start,
    std::uint64_t length,
    TransferError& err) {
    ChunkPlanner planner(ctx.config.unitChunkSize);
    ChunkPlan plan;
    if (!planner.plan(length, start, ctx.config.maxWorkers, clients, plan, err))
        return nullptr;

    // A single chunk gains nothing from the reordering machinery
    if (plan.size() == 1) {
        SingleClientTransfer direct(ctx, { plan.front().client, plan.front().clientId });
        return direct.openStream(media, start, length, err);
    }

    auto stream = std::make_unique<ChunkedStream>(media, plan, ctx.balancer, ctx.logger, ctx.externalStop, ctx.config);
    stream->start();
    return stream;
}

bool ChunkedTransfer::downloadToFile(const MediaRef& media,
    const std::string& destination,
    TransferError& err) {
    ChunkPlanner planner(ctx.config.unitChunkSize);
    ChunkPlan plan;
    if (!planner.plan(media.size, 0, ctx.config.maxWorkers, clients, plan, err))
        return false;

    if (plan.size() == 1) {
        SingleClientTransfer direct(ctx, { plan.front().client, plan.front().clientId });
        return direct.downloadToFile(media, destination, err);
    }

    FileAssembler assembler(ctx);
    return assembler.assemble(media, plan, destination, err);
}
