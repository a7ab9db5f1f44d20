#include <gtest/gtest.h>
#include "api/JsonCodec.h"

TEST(JsonCodecTest, DecodesExportListing) {
    const std::string body = R"([
        {"id": 1, "workflow_state": "exported", "created_at": "2025-06-08T12:00:00Z",
         "attachment": {"url": "https://files.test/a", "filename": "a.imscc"}},
        {"id": 2, "workflow_state": "exporting", "created_at": "2025-06-09T00:00:00Z", "attachment": null},
        {"id": 3, "workflow_state": "failed", "created_at": "2025-06-10T00:00:00Z"}
    ])";

    std::vector<ExportJob> jobs;
    std::size_t skipped = 0;
    std::string error;
    ASSERT_TRUE(parseExportJobs(42, body, jobs, skipped, error)) << error;

    ASSERT_EQ(jobs.size(), 3u);
    EXPECT_EQ(skipped, 0u);

    EXPECT_EQ(jobs[0].entityId, 42);
    EXPECT_EQ(jobs[0].state, WorkflowState::Exported);
    EXPECT_EQ(jobs[0].createdAt, 1749340800 + 12 * 3600);
    ASSERT_TRUE(jobs[0].attachment.has_value());
    EXPECT_EQ(jobs[0].attachment->url, "https://files.test/a");
    EXPECT_EQ(jobs[0].attachment->filename, "a.imscc");

    EXPECT_EQ(jobs[1].state, WorkflowState::Queued);
    EXPECT_FALSE(jobs[1].attachment.has_value());

    EXPECT_EQ(jobs[2].state, WorkflowState::Failed);
}

TEST(JsonCodecTest, SkipsMalformedExportRecords) {
    const std::string body = R"([
        {"workflow_state": "exported"},
        {"workflow_state": "exported", "created_at": "not a date"},
        "junk",
        {"workflow_state": "exported", "created_at": "2025-06-08T12:00:00Z",
         "attachment": {"url": "https://files.test/a", "filename": null}},
        {"workflow_state": "exported", "created_at": "2025-06-08T12:00:00Z",
         "attachment": {"url": "https://files.test/b", "filename": 12}},
        {"workflow_state": "created", "created_at": "2025-01-01"}
    ])";

    std::vector<ExportJob> jobs;
    std::size_t skipped = 0;
    std::string error;
    bool parsed = false;
    ASSERT_NO_THROW(parsed = parseExportJobs(1, body, jobs, skipped, error));
    ASSERT_TRUE(parsed);
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].state, WorkflowState::Queued);
    EXPECT_EQ(skipped, 5u);
}

TEST(JsonCodecTest, RejectsNonArrayListing) {
    std::vector<ExportJob> jobs;
    std::size_t skipped = 0;
    std::string error;
    EXPECT_FALSE(parseExportJobs(1, R"({"errors": []})", jobs, skipped, error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(parseExportJobs(1, "<html>", jobs, skipped, error));
    EXPECT_FALSE(error.empty());
}

TEST(JsonCodecTest, EntityStartFallsBackToCreation) {
    Entity e;
    ASSERT_TRUE(parseEntity(nlohmann::json::parse(
        R"({"id": 7, "name": "ABC101 Biology", "start_at": null, "created_at": "2020-08-01T00:00:00Z"})"), e));
    EXPECT_EQ(e.id, 7);
    EXPECT_EQ(e.name, "ABC101 Biology");
    EXPECT_EQ(e.startAt, "2020-08-01T00:00:00Z");

    ASSERT_TRUE(parseEntity(nlohmann::json::parse(
        R"({"id": 8, "name": "X", "start_at": "2021-01-10T00:00:00Z", "created_at": "2020-08-01T00:00:00Z"})"), e));
    EXPECT_EQ(e.startAt, "2021-01-10T00:00:00Z");

    ASSERT_TRUE(parseEntity(nlohmann::json::parse(R"({"id": 9, "name": "Y"})"), e));
    EXPECT_TRUE(e.startAt.empty());

    EXPECT_FALSE(parseEntity(nlohmann::json::parse(R"({"name": "no id"})"), e));
    EXPECT_FALSE(parseEntity(nlohmann::json::parse(R"({"id": "7", "name": "string id"})"), e));
}

TEST(JsonCodecTest, FindsNextLinkAmongOthers) {
    const std::string header =
        R"(<https://host/api/v1/accounts/1/courses?page=1&per_page=100>; rel="current",)"
        R"(<https://host/api/v1/accounts/1/courses?page=2&per_page=100>; rel="next",)"
        R"(<https://host/api/v1/accounts/1/courses?page=9&per_page=100>; rel="last")";

    EXPECT_EQ(nextPageLink(header), "https://host/api/v1/accounts/1/courses?page=2&per_page=100");
    EXPECT_EQ(nextPageLink(R"(<https://host/x?page=1>; rel="first")"), "");
    EXPECT_EQ(nextPageLink(""), "");
}

TEST(JsonCodecTest, CreateBodyNamesExportType) {
    auto body = nlohmann::json::parse(createExportBody("common_cartridge"));
    EXPECT_EQ(body.at("export_type").get<std::string>(), "common_cartridge");
    EXPECT_TRUE(body.at("skip_notifications").get<bool>());
}
