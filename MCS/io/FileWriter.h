#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

// Sequential writer over a raw file descriptor.
class FileWriter
{
public:
    explicit FileWriter(const std::string& path);
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Creates the file, truncating any previous content.
    bool open();
    bool append(const char* data, std::size_t size);
    bool flush();
    void close();

    bool isOpen() const { return fileHandle >= 0; }
    std::uint64_t bytesWritten() const { return written; }
    const std::string& path() const { return filePath; }

private:
    std::string filePath;
    std::uint64_t written = 0;
    int fileHandle = -1;
};
