#include "SourceRecord.h"
#include <fstream>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

SourceRecord::SourceRecord(const std::string& path)
    : recordPath(path) {}

bool SourceRecord::load(std::string& url) const {
    std::ifstream in(recordPath);
    if (!in.is_open())
        return false;

    return static_cast<bool>(std::getline(in, url)) && !url.empty();
}

bool SourceRecord::save(const std::string& url) const {
    const std::string tmpPath = recordPath + ".tmp";

    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out.is_open())
            return false;

        out << url << '\n';
        if (!out.good())
            return false;
    }

    std::error_code ec;
    fs::rename(tmpPath, recordPath, ec);

    if (ec) {
        fs::remove(tmpPath, ec);
        return false;
    }

    return true;
}

bool SourceRecord::remove() const {
    std::error_code ec;
    fs::remove(recordPath, ec);
    return !ec;
}
