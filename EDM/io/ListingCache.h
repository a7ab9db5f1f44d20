#pragma once
#include <string>

#include <nlohmann/json.hpp>

// Snapshot of the entity listing kept between runs.
class ListingCache
{
public:
    explicit ListingCache(const std::string& path);

    bool load(nlohmann::json& out) const;
    bool save(const nlohmann::json& records) const;

    bool exists() const;
    const std::string& path() const { return cachePath; }

private:
    std::string cachePath;
};
