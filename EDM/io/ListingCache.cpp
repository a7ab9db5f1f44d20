#include "ListingCache.h"
#include <fstream>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

ListingCache::ListingCache(const std::string& path)
    : cachePath(path) {}

bool ListingCache::exists() const {
    std::error_code ec;
    return fs::is_regular_file(cachePath, ec);
}

bool ListingCache::load(nlohmann::json& out) const {
    std::ifstream in(cachePath);
    if (!in.is_open())
        return false;

    out = nlohmann::json::parse(in, nullptr, false);
    return !out.is_discarded() && out.is_array();
}

bool ListingCache::save(const nlohmann::json& records) const {
    const std::string tmpPath = cachePath + ".tmp";

    std::error_code ec;
    const fs::path parent = fs::path(cachePath).parent_path();
    if (!parent.empty())
        fs::create_directories(parent, ec);
    if (ec)
        return false;

    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out.is_open())
            return false;

        out << records.dump(2) << '\n';
        if (!out.good())
            return false;
    }

    fs::rename(tmpPath, cachePath, ec);

    if (ec) {
        fs::remove(tmpPath, ec);
        return false;
    }

    return true;
}
