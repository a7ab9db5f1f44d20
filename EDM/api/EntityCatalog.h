#pragma once
#include <string>
#include <vector>
#include <functional>

#include "../core/utils.h"
#include "../net/HttpClient.h"
#include "../io/ListingCache.h"
#include "../monitor/Logger.h"

// Full entity listing: served from the cached snapshot when present,
// otherwise fetched page by page following the Link header.
class EntityCatalog {
public:
    using PageFetcher = std::function<bool(const std::string&, HttpResponse&)>;

    EntityCatalog(const ExportConfig& config, PageFetcher fetcher, Logger& logger);

    // false means no listing could be obtained; lastError() says why.
    bool load(std::vector<Entity>& out);

    const std::string& lastError() const { return error; }
    std::string firstPageUrl() const;

private:
    bool fetchAll(nlohmann::json& records);
    void decode(const nlohmann::json& records, std::vector<Entity>& out);

private:
    const ExportConfig& cfg;
    PageFetcher fetch;
    Logger& logger;
    ListingCache cache;
    std::string error;
};
