#include <iostream>
#include <cstdio>
#include <string>
#include <vector>
#include <csignal>
#include <curl/curl.h>

#include "cli/ArgumentParser.h"
#include "core/ClientPool.h"
#include "core/TransferEngine.h"
#include "monitor/Logger.h"

namespace {
volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int) {
    gStopRequested = 1;
}

int streamToStdout(TransferEngine& engine, const AppConfig& config, Logger& logger) {
    TransferError err;
    auto stream = engine.streamRange(config.mediaId, config.rangeOffset, config.rangeLimit, err);
    if (!stream) {
        logger.error("Cannot stream " + config.mediaId + ": " + err.describe());
        return 1;
    }

    std::vector<char> buffer;
    // The stream watches gStopRequested itself and ends as cancelled.
    while (stream->next(buffer)) {
        if (std::fwrite(buffer.data(), 1, buffer.size(), stdout) != buffer.size()) {
            logger.error("Write to stdout failed");
            stream->cancel();
            return 1;
        }
    }
    std::fflush(stdout);
    logger.info("Fetched " + std::to_string(stream->transferred()) + " bytes of " + config.mediaId);

    if (stream->failed()) {
        logger.error("Stream of " + config.mediaId + " ended early: " + stream->error().describe());
        return 1;
    }
    return 0;
}
}

int main(int argc, char* argv[]) {
    AppConfig config;
    ArgumentParser parser;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (!parser.parse(argc, argv, config))
        return 2;

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "curl initialisation failed\n";
        return 1;
    }

    int rc = 0;
    {
        // stdout carries the data in stream mode
        Logger logger(config.streamMode ? std::cerr : std::cout);
        logger.start();

        ClientPool clients(config.servers, config.connectionsPerServer);
        logger.info("Opened " + std::to_string(clients.size()) + " connection(s) to " +
            std::to_string(config.servers.size()) + " server(s)");
        TransferEngine engine(config.transfer, clients, logger, &gStopRequested);

        if (config.streamMode) {
            rc = streamToStdout(engine, config, logger);
        }
        else {
            TransferError err;
            if (!engine.downloadToFile(config.mediaId, config.outputPath, err)) {
                logger.error("Download of " + config.mediaId + " failed: " + err.describe());
                rc = 1;
            }
        }

        logger.stop();
    }

    curl_global_cleanup();
    return rc;
}
