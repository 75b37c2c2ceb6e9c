#pragma once
#include <string>
#include <vector>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstddef>
#include <filesystem>

class IClient;

struct TransferConfig {
    std::uint64_t unitChunkSize = 1 * 1024 * 1024;
    std::size_t maxWorkers = 8;
    std::uint64_t readUnitSize = 1 * 1024 * 1024;

    // Completed-chunk queue capacity = queueDepthPerChunk * chunk count
    std::size_t queueDepthPerChunk = 2;
    std::size_t copyBufferSize = 64 * 1024;
    std::size_t unhealthyThreshold = 3;

    std::filesystem::path tempDirectory; // empty = system temp dir
    std::chrono::milliseconds progressInterval{ 1000 };

    bool validate(std::string& why) const;
};

struct AppConfig {
    std::string mediaId;
    std::vector<std::string> servers;
    std::size_t connectionsPerServer;
    std::string outputPath;

    bool streamMode;
    std::uint64_t rangeOffset;
    std::uint64_t rangeLimit;

    TransferConfig transfer;
};

enum class ErrorKind {
    None,
    Connection,
    RateLimit,
    NotFound,
    Integrity,
    Cancelled,
    Io,
    Precondition,
    Failed
};

const char* errorKindName(ErrorKind kind);

struct TransferError {
    ErrorKind kind = ErrorKind::None;
    std::int64_t chunkIndex = -1;
    std::string message;

    bool isSet() const { return kind != ErrorKind::None; }
    void set(ErrorKind k, std::string msg, std::int64_t index = -1);
    std::string describe() const;
};

struct MediaRef {
    std::string mediaId;
    std::uint64_t size = 0;
    bool streamable = false;
};

// Non-owning: handles belong to whoever supplied the client list.
struct ClientEntry {
    IClient* client;
    int id;
};

// An empty chunk has size 0 and end == start.
struct ChunkDescriptor {
    std::uint64_t index;
    std::uint64_t start;
    std::uint64_t end;
    std::uint64_t size;
    int clientId;
    IClient* client;
};

using ChunkPlan = std::vector<ChunkDescriptor>;

enum class ChunkState {
    Pending,
    InProgress,
    Done,
    Failed
};

struct FetchResult {
    std::uint64_t index = 0;
    std::vector<char> payload;
    bool success = false;
    TransferError error;
};

// Sleeps in short slices; returns false if stopFlag or the optional
// external signal was raised meanwhile.
bool sleepUnlessStopped(std::chrono::milliseconds duration,
    const std::atomic<bool>& stopFlag,
    volatile std::sig_atomic_t* externalStop = nullptr);
