#include "ArgumentParser.h"
#include <iostream>
#include <cstdlib>
#include <stdexcept>

namespace {
std::string deriveOutputFromMediaId(const std::string& mediaId) {
    // Last path segment of the media id
    auto slash = mediaId.find_last_of('/');
    std::string name = (slash == std::string::npos) ? mediaId : mediaId.substr(slash + 1);

    auto special = name.find_first_of("?#");
    if (special != std::string::npos)
        name = name.substr(0, special);

    if (name.empty())
        name = "download";

    return name;
}

bool parseNumber(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text[0] == '-')
        return false;
    try {
        std::size_t used = 0;
        out = std::stoull(text, &used);
        return used == text.size();
    }
    catch (const std::exception&) {
        return false;
    }
}
}

bool ArgumentParser::parse(int argc, char* argv[], AppConfig& out) {
    if (argc < 2) {
        printUsage();
        return false;
    }

    out.mediaId = argv[1];
    out.servers.clear();
    out.connectionsPerServer = 1;
    out.outputPath.clear();
    out.streamMode = false;
    out.rangeOffset = 0;
    out.rangeLimit = 0;
    out.transfer = TransferConfig{};

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::uint64_t value = 0;

        if (arg == "-s" && i + 1 < argc) {
            out.servers.push_back(argv[++i]);
        }
        else if (arg == "-o" && i + 1 < argc) {
            out.outputPath = argv[++i];
        }
        else if (arg == "-n" && i + 1 < argc && parseNumber(argv[i + 1], value)) {
            out.connectionsPerServer = static_cast<std::size_t>(value);
            ++i;
        }
        else if (arg == "-w" && i + 1 < argc && parseNumber(argv[i + 1], value)) {
            out.transfer.maxWorkers = static_cast<std::size_t>(value);
            ++i;
        }
        else if (arg == "-u" && i + 1 < argc && parseNumber(argv[i + 1], value)) {
            out.transfer.unitChunkSize = value;
            ++i;
        }
        else if (arg == "-r" && i + 1 < argc && parseNumber(argv[i + 1], value)) {
            out.transfer.readUnitSize = value;
            ++i;
        }
        else if (arg == "--range" && i + 2 < argc
            && parseNumber(argv[i + 1], out.rangeOffset)
            && parseNumber(argv[i + 2], out.rangeLimit)) {
            out.streamMode = true;
            i += 2;
        }
        else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            printUsage();
            return false;
        }
    }

    if (out.servers.empty()) {
        std::cerr << "At least one server (-s) is required\n";
        printUsage();
        return false;
    }

    if (out.connectionsPerServer == 0) {
        std::cerr << "Connections per server must be positive\n";
        return false;
    }

    std::string why;
    if (!out.transfer.validate(why)) {
        std::cerr << "Invalid configuration: " << why << "\n";
        return false;
    }

    if (out.outputPath.empty())
        out.outputPath = deriveOutputFromMediaId(out.mediaId);

    return true;
}

void ArgumentParser::printUsage() const {
    std::cerr <<
        "Usage:\n"
        "  mcs <media-id> -s <server-url> [-s <server-url>...] [options]\n\n"
        "Options:\n"
        "  -s <url>                 Server base URL (repeat for more servers)\n"
        "  -n <count>               Connections per server (default: 1)\n"
        "  -o <file>                Output file path (default: name from media id)\n"
        "  -w <workers>             Max concurrent chunks (default: 8)\n"
        "  -u <bytes>               Unit chunk size (default: 1MB)\n"
        "  -r <bytes>               Bytes per range read (default: 1MB)\n"
        "  --range <offset> <limit> Stream bytes to stdout instead (limit 0 = to end)\n";
}
