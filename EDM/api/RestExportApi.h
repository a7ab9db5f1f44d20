#pragma once
#include <string>

#include "ExportApi.h"
#include "../net/HttpClient.h"
#include "../monitor/Logger.h"

// ExportApi over the REST content_exports endpoints. Not thread-safe: the
// poller is its only caller.
class RestExportApi : public ExportApi {
public:
    RestExportApi(HttpClient& client,
        const std::string& apiBase,
        const std::string& exportType,
        Logger& logger);

    ApiResult listExports(std::int64_t entityId, std::vector<ExportJob>& out) override;
    ApiResult createExport(std::int64_t entityId) override;

private:
    std::string exportsUrl(std::int64_t entityId) const;

private:
    HttpClient& http;
    std::string base;
    std::string type;
    Logger& logger;
};
