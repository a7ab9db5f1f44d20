#pragma once
#include <string>
#include <vector>
#include <cstdint>

#include "../core/utils.h"

struct ApiResult {
    bool ok = false;
    long httpStatus = 0;
    std::string error;

    bool unauthorized() const { return httpStatus == 401 || httpStatus == 403; }
};

// Remote side of the export workflow.
class ExportApi {
public:
    virtual ~ExportApi() = default;

    virtual ApiResult listExports(std::int64_t entityId, std::vector<ExportJob>& out) = 0;
    virtual ApiResult createExport(std::int64_t entityId) = 0;
};
