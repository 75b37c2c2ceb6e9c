#include <gtest/gtest.h>

#include <csignal>
#include <limits>
#include <sstream>
#include <thread>

#include "FakeClient.h"
#include "core/TransferEngine.h"
#include "core/RangeTransfer.h"

namespace fs = std::filesystem;

namespace {
constexpr std::size_t ObjectSize = 40000;

class EngineTest : public ::testing::Test {
protected:
    EngineTest()
        : content(makeContent(ObjectSize)) {
        config.unitChunkSize = 1024;
        config.readUnitSize = 4096;
        config.tempDirectory = work.path();
        config.progressInterval = std::chrono::milliseconds(20);
    }

    std::vector<char> drain(ByteStream& stream) {
        std::vector<char> out, piece;
        while (stream.next(piece))
            out.insert(out.end(), piece.begin(), piece.end());
        return out;
    }

    void expectBaselineLoads(TransferEngine& engine, int clients) {
        for (int id = 0; id < clients; ++id)
            EXPECT_EQ(engine.loadBalancer().load(id), 0u) << "client " << id;
    }

    std::vector<char> content;
    ScratchDir work;
    ScratchDir out;
    TransferConfig config;
    std::ostringstream sink;
    Logger logger{ sink };
};
}

TEST_F(EngineTest, FactoryPicksPathBySizeAndClients) {
    FakeClientSource source(content, 3);
    LoadBalancer balancer;
    ProgressTracker progress;
    TransferContext ctx{ config, balancer, logger, &progress, nullptr };

    auto all = source.listAvailableClients();
    std::vector<ClientEntry> one(all.begin(), all.begin() + 1);

    EXPECT_TRUE(makeRangeTransfer(ctx, {}, ObjectSize) == nullptr);
    EXPECT_STREQ(makeRangeTransfer(ctx, all, ObjectSize)->name(), "chunked");
    EXPECT_STREQ(makeRangeTransfer(ctx, one, ObjectSize)->name(), "single-client");
    EXPECT_STREQ(makeRangeTransfer(ctx, all, 1023)->name(), "single-client");

    config.maxWorkers = 1;
    EXPECT_STREQ(makeRangeTransfer(ctx, all, ObjectSize)->name(), "single-client");
}

TEST_F(EngineTest, DownloadWithOneClient) {
    FakeClientSource source(content, 1);
    TransferEngine engine(config, source, logger);
    const auto dest = out.file("clip.bin");

    TransferError err;
    ASSERT_TRUE(engine.downloadToFile("clip", dest.string(), err)) << err.describe();
    EXPECT_EQ(readWholeFile(dest), content);
    EXPECT_EQ(source.at(0).reads.load(), 10);
}

TEST_F(EngineTest, DownloadAcrossClients) {
    FakeClientSource source(content, 4);
    source.at(1).rateLimitAt = 10000;
    TransferEngine engine(config, source, logger);
    const auto dest = out.file("clip.bin");

    TransferError err;
    ASSERT_TRUE(engine.downloadToFile("clip", dest.string(), err)) << err.describe();

    EXPECT_EQ(readWholeFile(dest), content);
    EXPECT_TRUE(source.at(1).rateLimited.load());
    for (std::size_t i = 0; i < 4; ++i)
        EXPECT_GT(source.at(i).reads.load(), 0) << "client " << i;
    EXPECT_TRUE(work.isEmpty());
    expectBaselineLoads(engine, 4);
}

TEST_F(EngineTest, DownloadWithoutRangeSupportUsesOneRead) {
    FakeClientSource source(content, 3, false);
    TransferEngine engine(config, source, logger);
    const auto dest = out.file("clip.bin");

    TransferError err;
    ASSERT_TRUE(engine.downloadToFile("clip", dest.string(), err)) << err.describe();
    EXPECT_EQ(readWholeFile(dest), content);
    EXPECT_EQ(source.at(0).reads + source.at(1).reads + source.at(2).reads, 1);
}

TEST_F(EngineTest, ConnectionErrorFailsTheWholeDownload) {
    FakeClientSource source(content, 3);
    source.at(0).delay = std::chrono::milliseconds(300);
    source.at(2).delay = std::chrono::milliseconds(300);
    source.at(1).fatalAt = 15000;
    TransferEngine engine(config, source, logger);
    const auto dest = out.file("clip.bin");

    TransferError err;
    EXPECT_FALSE(engine.downloadToFile("clip", dest.string(), err));

    EXPECT_EQ(err.kind, ErrorKind::Connection);
    EXPECT_EQ(err.chunkIndex, 1);
    EXPECT_FALSE(fs::exists(dest));
    EXPECT_TRUE(work.isEmpty());
    expectBaselineLoads(engine, 3);
    EXPECT_EQ(engine.loadBalancer().snapshot()[1].errors, 1u);
}

TEST_F(EngineTest, ExternalStopCancelsDownload) {
    volatile std::sig_atomic_t stop = 1;
    FakeClientSource source(content, 3);
    for (std::size_t i = 0; i < 3; ++i)
        source.at(i).hang = true;
    TransferEngine engine(config, source, logger, &stop);

    TransferError err;
    EXPECT_FALSE(engine.downloadToFile("clip", out.file("clip.bin").string(), err));
    EXPECT_EQ(err.kind, ErrorKind::Cancelled);
    expectBaselineLoads(engine, 3);
}

TEST_F(EngineTest, MissingMediaIsNotFound) {
    FakeClientSource source(content, 2);
    source.at(0).notFound = true;
    source.at(1).notFound = true;
    TransferEngine engine(config, source, logger);

    TransferError err;
    EXPECT_TRUE(engine.streamRange("clip", 0, 0, err) == nullptr);
    EXPECT_EQ(err.kind, ErrorKind::NotFound);

    TransferError downloadErr;
    EXPECT_FALSE(engine.downloadToFile("clip", out.file("clip.bin").string(), downloadErr));
    EXPECT_EQ(downloadErr.kind, ErrorKind::NotFound);
    expectBaselineLoads(engine, 2);
}

TEST_F(EngineTest, NoClientsIsAPreconditionFailure) {
    FakeClientSource source(content, 0);
    TransferEngine engine(config, source, logger);

    TransferError err;
    EXPECT_TRUE(engine.streamRange("clip", 0, 0, err) == nullptr);
    EXPECT_EQ(err.kind, ErrorKind::Precondition);
}

TEST_F(EngineTest, StreamsWholeObjectInOrder) {
    FakeClientSource source(content, 3);
    source.at(0).delay = std::chrono::milliseconds(200);
    TransferEngine engine(config, source, logger);

    TransferError err;
    auto stream = engine.streamRange("clip", 0, 0, err);
    ASSERT_TRUE(stream != nullptr) << err.describe();

    EXPECT_EQ(drain(*stream), content);
    EXPECT_FALSE(stream->failed());
    expectBaselineLoads(engine, 3);
}

TEST_F(EngineTest, RangeIsClampedToObjectSize) {
    FakeClientSource source(content, 3);
    TransferEngine engine(config, source, logger);

    TransferError err;
    auto stream = engine.streamRange("clip", 30000, 1000000, err);
    ASSERT_TRUE(stream != nullptr) << err.describe();

    std::vector<char> expected(content.begin() + 30000, content.end());
    EXPECT_EQ(drain(*stream), expected);
}

TEST_F(EngineTest, MaximalLimitReadsToEnd) {
    FakeClientSource source(content, 3);
    TransferEngine engine(config, source, logger);

    TransferError err;
    auto stream = engine.streamRange("clip", 10, std::numeric_limits<std::uint64_t>::max(), err);
    ASSERT_TRUE(stream != nullptr) << err.describe();

    std::vector<char> expected(content.begin() + 10, content.end());
    EXPECT_EQ(drain(*stream), expected);
    EXPECT_FALSE(stream->failed());
}

TEST_F(EngineTest, InnerRangeStreamsExactBytes) {
    FakeClientSource source(content, 3);
    TransferEngine engine(config, source, logger);

    TransferError err;
    auto stream = engine.streamRange("clip", 1234, 20000, err);
    ASSERT_TRUE(stream != nullptr) << err.describe();

    std::vector<char> expected(content.begin() + 1234, content.begin() + 21234);
    EXPECT_EQ(drain(*stream), expected);
}

TEST_F(EngineTest, SmallRangeStreamsFromOneClient) {
    FakeClientSource source(content, 3);
    TransferEngine engine(config, source, logger);

    TransferError err;
    auto stream = engine.streamRange("clip", 100, 500, err);
    ASSERT_TRUE(stream != nullptr) << err.describe();

    std::vector<char> expected(content.begin() + 100, content.begin() + 600);
    EXPECT_EQ(drain(*stream), expected);
    EXPECT_EQ(source.at(0).reads + source.at(1).reads + source.at(2).reads, 1);
}

TEST_F(EngineTest, OffsetPastEndIsRejected) {
    FakeClientSource source(content, 3);
    TransferEngine engine(config, source, logger);

    TransferError err;
    EXPECT_TRUE(engine.streamRange("clip", ObjectSize, 10, err) == nullptr);
    EXPECT_EQ(err.kind, ErrorKind::Precondition);
}

TEST_F(EngineTest, StreamFailureReportsRootCause) {
    FakeClientSource source(content, 3);
    source.at(0).hang = true;
    source.at(2).fatalAt = 35000;
    TransferEngine engine(config, source, logger);

    TransferError err;
    auto stream = engine.streamRange("clip", 0, 0, err);
    ASSERT_TRUE(stream != nullptr) << err.describe();

    auto received = drain(*stream);
    ASSERT_TRUE(stream->failed());
    EXPECT_EQ(stream->error().kind, ErrorKind::Connection);
    EXPECT_EQ(stream->error().chunkIndex, 2);
    EXPECT_LT(received.size(), content.size());
    expectBaselineLoads(engine, 3);
}

TEST_F(EngineTest, EmptyObject) {
    std::vector<char> empty;
    FakeClientSource source(empty, 3);
    TransferEngine engine(config, source, logger);

    TransferError err;
    auto stream = engine.streamRange("clip", 0, 0, err);
    ASSERT_TRUE(stream != nullptr) << err.describe();
    std::vector<char> piece;
    EXPECT_FALSE(stream->next(piece));
    EXPECT_FALSE(stream->failed());

    const auto dest = out.file("empty.bin");
    TransferError downloadErr;
    ASSERT_TRUE(engine.downloadToFile("clip", dest.string(), downloadErr)) << downloadErr.describe();
    EXPECT_TRUE(fs::exists(dest));
    EXPECT_EQ(fs::file_size(dest), 0u);
}

TEST_F(EngineTest, ConcurrentStreamsCountTheirOwnBytes) {
    FakeClientSource source(content, 3);
    TransferEngine engine(config, source, logger);

    TransferError err;
    auto first = engine.streamRange("clip", 0, 10000, err);
    ASSERT_TRUE(first != nullptr) << err.describe();
    auto second = engine.streamRange("clip", 20000, 5000, err);
    ASSERT_TRUE(second != nullptr) << err.describe();

    EXPECT_EQ(drain(*second).size(), 5000u);
    EXPECT_EQ(drain(*first).size(), 10000u);
    EXPECT_EQ(first->transferred(), 10000u);
    EXPECT_EQ(second->transferred(), 5000u);
}

TEST_F(EngineTest, StopSignalEndsDirectStreamDuringBackoff) {
    volatile std::sig_atomic_t stop = 0;
    FakeClientSource source(content, 1);
    source.at(0).rateLimitAt = 0;
    source.at(0).rateLimitWait = std::chrono::seconds(30);
    TransferEngine engine(config, source, logger, &stop);

    TransferError err;
    auto stream = engine.streamRange("clip", 0, 0, err);
    ASSERT_TRUE(stream != nullptr) << err.describe();

    std::thread signaller([&stop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stop = 1;
    });

    const auto started = std::chrono::steady_clock::now();
    std::vector<char> piece;
    EXPECT_FALSE(stream->next(piece));
    signaller.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(stream->error().kind, ErrorKind::Cancelled);

    stream.reset();
    expectBaselineLoads(engine, 1);
}

TEST_F(EngineTest, StopSignalEndsChunkedStream) {
    volatile std::sig_atomic_t stop = 0;
    FakeClientSource source(content, 3);
    for (std::size_t i = 0; i < 3; ++i)
        source.at(i).hang = true;
    TransferEngine engine(config, source, logger, &stop);

    TransferError err;
    auto stream = engine.streamRange("clip", 0, 0, err);
    ASSERT_TRUE(stream != nullptr) << err.describe();

    stop = 1;
    std::vector<char> piece;
    EXPECT_FALSE(stream->next(piece));
    EXPECT_EQ(stream->error().kind, ErrorKind::Cancelled);

    stream.reset();
    expectBaselineLoads(engine, 3);
}

TEST_F(EngineTest, RateLimitedLookupIsRetried) {
    FakeClientSource source(content, 1);
    source.at(0).lookupRateLimits = 1;
    TransferEngine engine(config, source, logger);
    const auto dest = out.file("clip.bin");

    TransferError err;
    ASSERT_TRUE(engine.downloadToFile("clip", dest.string(), err)) << err.describe();
    EXPECT_EQ(readWholeFile(dest), content);
    EXPECT_EQ(source.at(0).lookups.load(), 2);
}

TEST_F(EngineTest, StopSignalEndsLookupBackoff) {
    volatile std::sig_atomic_t stop = 1;
    FakeClientSource source(content, 1);
    source.at(0).lookupRateLimits = 1;
    source.at(0).lookupWait = std::chrono::seconds(30);
    TransferEngine engine(config, source, logger, &stop);

    const auto started = std::chrono::steady_clock::now();
    TransferError err;
    EXPECT_TRUE(engine.streamRange("clip", 0, 0, err) == nullptr);

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(err.kind, ErrorKind::Cancelled);
    EXPECT_EQ(source.at(0).lookups.load(), 1);
    expectBaselineLoads(engine, 1);
}
