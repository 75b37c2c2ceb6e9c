#include "TempDirectory.h"

#include <random>

namespace fs = std::filesystem;

TempDirectory::TempDirectory(const fs::path& parent, const std::string& prefix, Logger& log)
    : logger(log) {
    std::error_code ec;
    fs::path base = parent.empty() ? fs::temp_directory_path(ec) : parent;
    if (ec) {
        logger.error("No temporary directory available: " + ec.message());
        return;
    }

    std::random_device rd;
    for (int attempt = 0; attempt < 8 && !created; ++attempt) {
        fs::path candidate = base / (prefix + std::to_string(rd()));
        created = fs::create_directories(candidate, ec) && !ec;
        if (created)
            dir = candidate;
    }

    if (!created)
        logger.error("Could not create working directory under " + base.string());
}

TempDirectory::~TempDirectory() {
    if (!created)
        return;

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        logger.warn("Failed to clean up temp directory " + dir.string() + ": " + ec.message());
}
