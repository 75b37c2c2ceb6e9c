#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

#include "utils.h"
#include "RangeTransfer.h"
#include "../monitor/Logger.h"

// Downloads every chunk of a plan into its own temporary file, then
// stitches them together in index order.
class FileAssembler {
public:
    explicit FileAssembler(const TransferContext& ctx);

    bool assemble(const MediaRef& media,
        const ChunkPlan& plan,
        const std::string& destination,
        TransferError& err);

    // Copies parts into destination in order, deleting each part once
    // copied, and checks the result against expectedSize.
    bool concatenate(const std::vector<std::filesystem::path>& parts,
        const std::string& destination,
        std::uint64_t expectedSize,
        TransferError& err);

private:
    TransferContext ctx;
};

// A size mismatch is an Integrity error; the file itself is left alone.
bool verifyFileSize(const std::string& path,
    std::uint64_t expectedSize,
    Logger& logger,
    TransferError& err);
