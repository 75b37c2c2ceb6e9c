#pragma once
#include <string>
#include <filesystem>

#include "../monitor/Logger.h"

// Uniquely named scratch directory, removed with its contents on destruction.
class TempDirectory {
public:
    TempDirectory(const std::filesystem::path& parent, const std::string& prefix, Logger& logger);
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    bool valid() const { return created; }
    const std::filesystem::path& path() const { return dir; }

private:
    std::filesystem::path dir;
    bool created = false;
    Logger& logger;
};
