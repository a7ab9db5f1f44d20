#include "EntityCatalog.h"
#include "JsonCodec.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace {
constexpr const char* kSnapshotName = "courses.json";
}

EntityCatalog::EntityCatalog(const ExportConfig& config, PageFetcher fetcher, Logger& log)
    : cfg(config),
    fetch(std::move(fetcher)),
    logger(log),
    cache((fs::path(config.rootDir) / kSnapshotName).string()) {
}

std::string EntityCatalog::firstPageUrl() const {
    std::string base = cfg.apiBase;
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    return base + "/accounts/" + cfg.accountId + "/courses?per_page=100";
}

bool EntityCatalog::load(std::vector<Entity>& out) {
    out.clear();
    error.clear();

    nlohmann::json records;

    if (!cfg.refreshListing && cache.exists()) {
        if (cache.load(records)) {
            logger.info("Loaded " + std::to_string(records.size()) + " entities from " + cache.path());
            decode(records, out);
            return true;
        }
        logger.warn("Listing snapshot " + cache.path() + " is unreadable, fetching again");
    }

    if (!fetchAll(records))
        return false;

    if (!cache.save(records))
        logger.warn("Could not write listing snapshot " + cache.path());

    decode(records, out);
    return true;
}

bool EntityCatalog::fetchAll(nlohmann::json& records) {
    records = nlohmann::json::array();

    std::string url = firstPageUrl();
    while (!url.empty()) {
        HttpResponse res;
        if (!fetch(url, res)) {
            error = "listing endpoint unreachable: " + res.error;
            return false;
        }

        if (res.status == 401 || res.status == 403) {
            error = "listing rejected the credentials (HTTP " + std::to_string(res.status) + ")";
            return false;
        }

        if (!res.ok()) {
            error = "listing failed with HTTP " + std::to_string(res.status);
            return false;
        }

        nlohmann::json page;
        if (!parseEntityPage(res.body, page, error))
            return false;

        if (page.empty())
            break;

        for (auto& item : page)
            records.push_back(std::move(item));

        logger.info("Fetched " + std::to_string(page.size()) + " entities. Total: " +
            std::to_string(records.size()));

        url = nextPageLink(res.header("link"));
    }

    return true;
}

void EntityCatalog::decode(const nlohmann::json& records, std::vector<Entity>& out) {
    std::size_t skipped = 0;

    for (const auto& item : records) {
        Entity e{};
        if (parseEntity(item, e))
            out.push_back(std::move(e));
        else
            ++skipped;
    }

    if (skipped > 0)
        logger.warn("Ignored " + std::to_string(skipped) + " malformed entity record(s)");
}
