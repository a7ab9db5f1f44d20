#include "RestExportApi.h"
#include "JsonCodec.h"

namespace {
ApiResult fromResponse(bool transportOk, const HttpResponse& res) {
    ApiResult result;
    result.httpStatus = res.status;

    if (!transportOk) {
        result.error = res.error;
        return result;
    }

    if (!res.ok()) {
        result.error = "HTTP " + std::to_string(res.status);
        return result;
    }

    result.ok = true;
    return result;
}
}

RestExportApi::RestExportApi(HttpClient& client,
    const std::string& apiBase,
    const std::string& exportType,
    Logger& log)
    : http(client),
    base(apiBase),
    type(exportType),
    logger(log) {
    while (!base.empty() && base.back() == '/')
        base.pop_back();
}

std::string RestExportApi::exportsUrl(std::int64_t entityId) const {
    return base + "/courses/" + std::to_string(entityId) + "/content_exports";
}

ApiResult RestExportApi::listExports(std::int64_t entityId, std::vector<ExportJob>& out) {
    out.clear();

    HttpResponse res;
    const bool sent = http.get(exportsUrl(entityId) + "?per_page=100", res);
    ApiResult result = fromResponse(sent, res);
    if (!result.ok)
        return result;

    std::size_t skipped = 0;
    if (!parseExportJobs(entityId, res.body, out, skipped, result.error)) {
        result.ok = false;
        return result;
    }

    if (skipped > 0)
        logger.warn("Entity " + std::to_string(entityId) + ": ignored " +
            std::to_string(skipped) + " malformed export record(s)");
    return result;
}

ApiResult RestExportApi::createExport(std::int64_t entityId) {
    HttpResponse res;
    const bool sent = http.postJson(exportsUrl(entityId), createExportBody(type), res);
    return fromResponse(sent, res);
}
