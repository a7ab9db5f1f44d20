#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#include <nlohmann/json.hpp>

#include "../core/utils.h"

// Decodes a content_exports listing. Entries that cannot be decoded are
// skipped and counted in `skipped`.
bool parseExportJobs(std::int64_t entityId,
    const std::string& body,
    std::vector<ExportJob>& out,
    std::size_t& skipped,
    std::string& error);

bool parseEntity(const nlohmann::json& item, Entity& out);

// Decodes one page of the entity listing, keeping the raw records so the
// cached snapshot preserves every field the server sent.
bool parseEntityPage(const std::string& body,
    nlohmann::json& records,
    std::string& error);

std::string createExportBody(const std::string& exportType);

// Target of the rel="next" entry of a Link header, empty when absent.
std::string nextPageLink(const std::string& linkHeader);
