#pragma once
#include "utils.h"
#include "LoadBalancer.h"
#include "RangeReader.h"
#include "../monitor/Logger.h"

// Fetches one planned chunk from its assigned client. The client's load
// counter is held for exactly the duration of the fetch.
class ChunkFetcher {
public:
    using Sink = RangeReader::Sink;

    ChunkFetcher(LoadBalancer& balancer, RangeReader& reader, Logger& logger);

    FetchResult fetch(const MediaRef& media, const ChunkDescriptor& chunk);
    bool fetchTo(const MediaRef& media,
        const ChunkDescriptor& chunk,
        const Sink& sink,
        TransferError& err);

private:
    LoadBalancer& loadBalancer;
    RangeReader& rangeReader;
    Logger& logger;
};
