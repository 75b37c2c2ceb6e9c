#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>

#include "FakeClient.h"
#include "core/RangeReader.h"
#include "monitor/Logger.h"

namespace {
class RangeReaderTest : public ::testing::Test {
protected:
    MediaRef mediaFor(FakeClient& client) {
        MediaRef media;
        client.getMediaRef("clip", media);
        return media;
    }

    bool readAll(RangeReader& reader, FakeClient& client, std::uint64_t start, std::uint64_t length,
        std::vector<char>& out, TransferError& err, std::int64_t index = 0) {
        return reader.read(client, mediaFor(client), start, length, index,
            [&out](const char* data, std::size_t size) {
                out.insert(out.end(), data, data + size);
                return true;
            },
            err);
    }

    std::ostringstream sink;
    Logger logger{ sink };
    std::atomic<bool> stopFlag{ false };
};
}

TEST_F(RangeReaderTest, ReadsInUnits) {
    auto content = makeContent(10000);
    FakeClient client(content);
    RangeReader reader(4096, stopFlag, logger);

    std::vector<char> out;
    TransferError err;
    ASSERT_TRUE(readAll(reader, client, 0, content.size(), out, err));

    EXPECT_EQ(out, content);
    EXPECT_EQ(client.reads.load(), 3);
}

TEST_F(RangeReaderTest, TrimsBytesPastTheEnd) {
    auto content = makeContent(10000);
    FakeClient client(content);
    client.overshoot = 500;
    RangeReader reader(3000, stopFlag, logger);

    std::vector<char> out;
    TransferError err;
    ASSERT_TRUE(readAll(reader, client, 1000, 4000, out, err));

    std::vector<char> expected(content.begin() + 1000, content.begin() + 5000);
    EXPECT_EQ(out, expected);
}

TEST_F(RangeReaderTest, FeedsProgressTracker) {
    auto content = makeContent(5000);
    FakeClient client(content);
    ProgressTracker progress(5000);
    RangeReader reader(1024, stopFlag, logger, &progress);

    std::vector<char> out;
    TransferError err;
    ASSERT_TRUE(readAll(reader, client, 0, 5000, out, err));
    EXPECT_EQ(progress.transferred(), 5000u);
    EXPECT_DOUBLE_EQ(progress.progress(), 1.0);
    EXPECT_GT(progress.speedBytesPerSec(), 0.0);
}

TEST_F(RangeReaderTest, RetriesAfterRateLimitWithoutLosingBytes) {
    auto content = makeContent(10000);
    FakeClient client(content);
    client.rateLimitAt = 4096;
    client.rateLimitWait = std::chrono::milliseconds(30);
    RangeReader reader(4096, stopFlag, logger);

    std::vector<char> out;
    TransferError err;
    ASSERT_TRUE(readAll(reader, client, 0, content.size(), out, err));

    EXPECT_TRUE(client.rateLimited.load());
    EXPECT_EQ(client.reads.load(), 4);
    EXPECT_EQ(out, content);
}

TEST_F(RangeReaderTest, ConnectionFatalIsNotRetried) {
    auto content = makeContent(10000);
    FakeClient client(content);
    client.fatalAt = 5000;
    RangeReader reader(4096, stopFlag, logger);

    std::vector<char> out;
    TransferError err;
    EXPECT_FALSE(readAll(reader, client, 0, content.size(), out, err, 7));

    EXPECT_EQ(err.kind, ErrorKind::Connection);
    EXPECT_EQ(err.chunkIndex, 7);
    EXPECT_EQ(client.reads.load(), 2);
}

TEST_F(RangeReaderTest, NotFoundIsReported) {
    auto content = makeContent(100);

    // Object vanished between lookup and read
    class Gone : public FakeClient {
    public:
        using FakeClient::FakeClient;
        ReadStatus rangeRead(const MediaRef&, std::uint64_t, std::uint64_t, const DataCallback&) override {
            return ReadStatus::failure(ReadOutcome::NotFound, "gone");
        }
    } gone(content);
    MediaRef media = mediaFor(gone);

    RangeReader reader(64, stopFlag, logger);
    TransferError err;
    EXPECT_FALSE(reader.read(gone, media, 0, 100, 2,
        [](const char*, std::size_t) { return true; }, err));
    EXPECT_EQ(err.kind, ErrorKind::NotFound);
    EXPECT_EQ(err.chunkIndex, 2);
}

TEST_F(RangeReaderTest, SinkFailureIsAnIoError) {
    auto content = makeContent(1000);
    FakeClient client(content);
    RangeReader reader(1000, stopFlag, logger);

    TransferError err;
    EXPECT_FALSE(reader.read(client, mediaFor(client), 0, 1000, 0,
        [](const char*, std::size_t) { return false; }, err));
    EXPECT_EQ(err.kind, ErrorKind::Io);
}

TEST_F(RangeReaderTest, ShortObjectFailsInsteadOfSpinning) {
    auto content = makeContent(1000);
    FakeClient client(content);
    RangeReader reader(512, stopFlag, logger);

    std::vector<char> out;
    TransferError err;
    EXPECT_FALSE(readAll(reader, client, 0, 2000, out, err));
    EXPECT_EQ(err.kind, ErrorKind::Failed);
    EXPECT_EQ(out.size(), 1000u);
}

TEST_F(RangeReaderTest, StopDuringBackoffCancels) {
    auto content = makeContent(1000);
    FakeClient client(content);
    client.rateLimitAt = 0;
    client.rateLimitWait = std::chrono::seconds(30);
    RangeReader reader(1000, stopFlag, logger);

    std::thread stopper([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stopFlag = true;
    });

    const auto begin = std::chrono::steady_clock::now();
    std::vector<char> out;
    TransferError err;
    EXPECT_FALSE(readAll(reader, client, 0, 1000, out, err));
    stopper.join();

    EXPECT_EQ(err.kind, ErrorKind::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
}

TEST_F(RangeReaderTest, WholeObjectWithoutRangeSupportIsOneRead) {
    auto content = makeContent(10000);
    FakeClient client(content, false);
    RangeReader reader(1024, stopFlag, logger);

    std::vector<char> out;
    TransferError err;
    ASSERT_TRUE(readAll(reader, client, 0, content.size(), out, err));
    EXPECT_EQ(out, content);
    EXPECT_EQ(client.reads.load(), 1);
}
