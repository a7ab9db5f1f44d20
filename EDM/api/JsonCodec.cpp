#include "JsonCodec.h"

#include <regex>

using json = nlohmann::json;

namespace {
WorkflowState workflowFrom(const std::string& state) {
    if (state == "exported")
        return WorkflowState::Exported;
    if (state == "failed")
        return WorkflowState::Failed;
    // created, queued, exporting
    return WorkflowState::Queued;
}

bool parseExportJob(std::int64_t entityId, const json& item, ExportJob& job) {
    if (!item.is_object())
        return false;

    const auto state = item.find("workflow_state");
    const auto created = item.find("created_at");
    if (state == item.end() || !state->is_string() || created == item.end() || !created->is_string())
        return false;

    auto createdAt = parseTimestamp(created->get<std::string>());
    if (!createdAt)
        return false;

    job.entityId = entityId;
    job.state = workflowFrom(state->get<std::string>());
    job.createdAt = *createdAt;
    job.attachment.reset();

    const auto attachment = item.find("attachment");
    if (attachment != item.end() && attachment->is_object()) {
        const auto url = attachment->find("url");
        const auto filename = attachment->find("filename");
        if (filename != attachment->end() && !filename->is_string())
            return false;

        if (url != attachment->end() && url->is_string()) {
            Attachment a;
            a.url = url->get<std::string>();
            if (filename != attachment->end())
                a.filename = filename->get<std::string>();
            job.attachment = a;
        }
    }
    return true;
}
}

bool parseExportJobs(std::int64_t entityId,
    const std::string& body,
    std::vector<ExportJob>& out,
    std::size_t& skipped,
    std::string& error) {
    out.clear();
    skipped = 0;

    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        error = "export listing is not a JSON array";
        return false;
    }

    for (const auto& item : doc) {
        ExportJob job{};
        if (parseExportJob(entityId, item, job))
            out.push_back(std::move(job));
        else
            ++skipped;
    }
    return true;
}

bool parseEntity(const json& item, Entity& out) {
    if (!item.is_object())
        return false;

    const auto id = item.find("id");
    const auto name = item.find("name");
    if (id == item.end() || !id->is_number_integer() || name == item.end() || !name->is_string())
        return false;

    out.id = id->get<std::int64_t>();
    out.name = name->get<std::string>();
    out.startAt.clear();

    for (const char* key : { "start_at", "created_at" }) {
        const auto it = item.find(key);
        if (it != item.end() && it->is_string() && !it->get<std::string>().empty()) {
            out.startAt = it->get<std::string>();
            break;
        }
    }
    return true;
}

bool parseEntityPage(const std::string& body, json& records, std::string& error) {
    records = json::parse(body, nullptr, false);
    if (records.is_discarded() || !records.is_array()) {
        error = "entity listing is not a JSON array";
        return false;
    }
    return true;
}

std::string createExportBody(const std::string& exportType) {
    json body = {
        { "export_type", exportType },
        { "skip_notifications", true },
        { "include_quiz_questions", false }
    };
    return body.dump();
}

std::string nextPageLink(const std::string& linkHeader) {
    static const std::regex next(R"re(<([^>]+)>;\s*rel="next")re");

    std::smatch match;
    if (std::regex_search(linkHeader, match, next))
        return match[1].str();
    return {};
}
