#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

// Append-only writer for one destination file.
class FileWriter
{
public:
    explicit FileWriter(const std::string& path);
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // truncate == true discards any existing content first
    bool open(bool truncate);
    bool append(const char* data, std::size_t size);
    // Forces written bytes to stable storage.
    bool flush();
    void close();

    bool isOpen() const { return fileHandle >= 0; }
    // Bytes appended since open().
    std::uint64_t written() const { return bytesWritten; }

    // Current size of the file on disk, 0 when it does not exist.
    static std::uint64_t sizeOnDisk(const std::string& path);

private:
    std::string filePath;
    std::uint64_t bytesWritten = 0;
    int fileHandle = -1;
};
