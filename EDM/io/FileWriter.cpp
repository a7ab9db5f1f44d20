#include "FileWriter.h"

#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#include <sys/stat.h>
#else
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#endif

namespace fs = std::filesystem;

FileWriter::FileWriter(const std::string& path)
    : filePath(path) {
}

FileWriter::~FileWriter() {
    close();
}

bool FileWriter::open(bool truncate) {
    close();

#ifdef _WIN32
    int flags = _O_BINARY | _O_WRONLY | _O_CREAT | _O_APPEND;
    if (truncate)
        flags |= _O_TRUNC;
    int mode = _S_IREAD | _S_IWRITE;
    fileHandle = _open(filePath.c_str(), flags, mode);
#else
    int flags = O_WRONLY | O_CREAT | O_APPEND;
    if (truncate)
        flags |= O_TRUNC;
    fileHandle = ::open(filePath.c_str(), flags, 0644);
#endif

    bytesWritten = 0;
    return fileHandle >= 0;
}

bool FileWriter::append(const char* data, std::size_t size) {
    if (fileHandle < 0)
        return false;

    while (size > 0) {
#ifdef _WIN32
        int n = _write(fileHandle, data, static_cast<unsigned int>(size));
        if (n <= 0)
            return false;
#else
        ssize_t n = ::write(fileHandle, data, size);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
#endif
        data += n;
        size -= static_cast<std::size_t>(n);
        bytesWritten += static_cast<std::uint64_t>(n);
    }
    return true;
}

bool FileWriter::flush() {
    if (fileHandle < 0)
        return false;
#ifdef _WIN32
    return _commit(fileHandle) == 0;
#else
    return ::fsync(fileHandle) == 0;
#endif
}

void FileWriter::close() {
    if (fileHandle >= 0) {
#ifdef _WIN32
        _close(fileHandle);
#else
        ::close(fileHandle);
#endif
        fileHandle = -1;
    }
}

std::uint64_t FileWriter::sizeOnDisk(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return 0;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}
