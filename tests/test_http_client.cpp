#include <gtest/gtest.h>
#include <curl/curl.h>
#include "net/HttpClient.h"
#include "api/RestExportApi.h"
#include "loopback_server.h"

#include <nlohmann/json.hpp>

#include <cstdlib>

class HttpClientTest : public ::testing::Test {
protected:
    LoopbackServer server;
    Logger logger;

    static void SetUpTestSuite() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    static void TearDownTestSuite() {
        curl_global_cleanup();
    }

    void SetUp() override {
        // Loopback traffic must not be sent to a proxy from the environment
        for (const char* name : { "http_proxy", "HTTP_PROXY", "all_proxy", "ALL_PROXY" })
            unsetenv(name);
    }

    struct Stream {
        std::vector<std::string> events;
        std::string body;
        bool accept = true;
    };

    StreamResult open(HttpClient& client, const std::string& target, std::uint64_t from, Stream& s) {
        return client.open(server.url(target), from,
            [&s](long status) {
                s.events.push_back("status " + std::to_string(status));
                return s.accept;
            },
            [&s](const char* data, std::size_t size) {
                if (s.events.empty() || s.events.back() != "data")
                    s.events.push_back("data");
                s.body.append(data, size);
                return true;
            });
    }
};

TEST_F(HttpClientTest, FreshStreamSendsNoRangeHeader) {
    server.reply(200, "whole archive");
    HttpClient client("secret");

    Stream s;
    auto res = open(client, "/files/1", 0, s);

    ASSERT_TRUE(res.transportOk) << res.error;
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(s.body, "whole archive");

    auto reqs = server.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "GET");
    EXPECT_EQ(reqs[0].target, "/files/1");
    EXPECT_FALSE(reqs[0].has("range"));
    EXPECT_EQ(reqs[0].header("authorization"), "Bearer secret");
}

TEST_F(HttpClientTest, ResumedStreamAsksForOpenEndedRange) {
    server.reply(206, "tail", "Content-Range: bytes 120-123/124\r\n");
    HttpClient client("secret");

    Stream s;
    auto res = open(client, "/files/1", 120, s);

    ASSERT_TRUE(res.transportOk) << res.error;
    EXPECT_EQ(res.status, 206);
    EXPECT_EQ(server.requests().at(0).header("range"), "bytes=120-");
    EXPECT_EQ(s.events, (std::vector<std::string>{ "status 206", "data" }));
    EXPECT_EQ(s.body, "tail");
}

TEST_F(HttpClientTest, StatusArrivesEvenWithoutBody) {
    server.reply(416, "");
    HttpClient client("secret");

    Stream s;
    auto res = open(client, "/files/1", 500, s);

    ASSERT_TRUE(res.transportOk) << res.error;
    EXPECT_EQ(res.status, 416);
    EXPECT_EQ(s.events, (std::vector<std::string>{ "status 416" }));
}

TEST_F(HttpClientTest, RefusedStatusKeepsBodyAway) {
    server.reply(503, "maintenance page");
    HttpClient client("secret");

    Stream s;
    s.accept = false;
    auto res = open(client, "/files/1", 0, s);

    ASSERT_TRUE(res.transportOk) << res.error;
    EXPECT_EQ(res.status, 503);
    EXPECT_EQ(s.events, (std::vector<std::string>{ "status 503" }));
    EXPECT_TRUE(s.body.empty());
}

TEST_F(HttpClientTest, GetCollectsLowerCasedHeaders) {
    server.reply(200, "[]", "Link: <https://host/next>; rel=\"next\"\r\n");
    HttpClient client("secret");

    HttpResponse res;
    ASSERT_TRUE(client.get(server.url("/list"), res)) << res.error;
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.body, "[]");
    EXPECT_EQ(res.header("Link"), "<https://host/next>; rel=\"next\"");
}

TEST_F(HttpClientTest, ExportApiListsWithGet) {
    server.reply(200, R"([{"workflow_state": "exported", "created_at": "2025-06-08T12:00:00Z",
        "attachment": {"url": "https://files.test/a", "filename": "a.imscc"}}])");
    HttpClient client("secret");
    RestExportApi api(client, server.url("/api/v1/"), "common_cartridge", logger);

    std::vector<ExportJob> jobs;
    auto result = api.listExports(7, jobs);

    ASSERT_TRUE(result.ok) << result.error;
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].entityId, 7);

    auto reqs = server.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "GET");
    EXPECT_EQ(reqs[0].target, "/api/v1/courses/7/content_exports?per_page=100");
}

TEST_F(HttpClientTest, ExportApiCreatesWithJsonPost) {
    server.reply(201, R"({"id": 99, "workflow_state": "created"})");
    HttpClient client("secret");
    RestExportApi api(client, server.url("/api/v1"), "common_cartridge", logger);

    auto result = api.createExport(7);
    ASSERT_TRUE(result.ok) << result.error;

    auto reqs = server.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "POST");
    EXPECT_EQ(reqs[0].target, "/api/v1/courses/7/content_exports");
    EXPECT_EQ(reqs[0].header("content-type"), "application/json");
    EXPECT_EQ(reqs[0].header("authorization"), "Bearer secret");

    auto body = nlohmann::json::parse(reqs[0].body);
    EXPECT_EQ(body.at("export_type").get<std::string>(), "common_cartridge");
}

TEST_F(HttpClientTest, ExportApiReportsRejectedCredentials) {
    server.reply(401, R"({"errors": [{"message": "Invalid access token."}]})");
    HttpClient client("expired");
    RestExportApi api(client, server.url("/api/v1"), "common_cartridge", logger);

    std::vector<ExportJob> jobs;
    auto result = api.listExports(7, jobs);

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.unauthorized());
    EXPECT_EQ(result.httpStatus, 401);
}
