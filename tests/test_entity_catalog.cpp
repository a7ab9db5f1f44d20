#include <gtest/gtest.h>
#include "api/EntityCatalog.h"

#include <filesystem>
#include <fstream>
#include <map>

namespace fs = std::filesystem;

class EntityCatalogTest : public ::testing::Test {
protected:
    fs::path test_root;
    Logger logger;
    ExportConfig cfg{};

    std::map<std::string, HttpResponse> pages;
    std::vector<std::string> requested;

    void SetUp() override {
        test_root = fs::absolute("tmp_catalog_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);

        cfg.apiBase = "https://host/api/v1/";
        cfg.apiToken = "token";
        cfg.accountId = "1";
        cfg.rootDir = test_root.string();
    }

    void TearDown() override {
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }

    EntityCatalog::PageFetcher fetcher() {
        return [this](const std::string& url, HttpResponse& out) {
            requested.push_back(url);
            auto it = pages.find(url);
            if (it == pages.end()) {
                out.error = "no route to " + url;
                return false;
            }
            out = it->second;
            return true;
        };
    }

    static HttpResponse page(const std::string& body, const std::string& next = "") {
        HttpResponse res;
        res.status = 200;
        res.body = body;
        if (!next.empty())
            res.headers["link"] = "<" + next + ">; rel=\"next\"";
        return res;
    }
};

TEST_F(EntityCatalogTest, FollowsNextLinksAndWritesSnapshot) {
    const std::string first = "https://host/api/v1/accounts/1/courses?per_page=100";
    const std::string second = "https://host/api/v1/accounts/1/courses?page=2&per_page=100";
    pages[first] = page(R"([{"id": 1, "name": "A", "start_at": "2023-01-01"}])", second);
    pages[second] = page(R"([{"id": 2, "name": "B", "created_at": "2024-01-01"}, {"bad": true}])");

    EntityCatalog catalog(cfg, fetcher(), logger);
    EXPECT_EQ(catalog.firstPageUrl(), first);

    std::vector<Entity> entities;
    ASSERT_TRUE(catalog.load(entities)) << catalog.lastError();

    ASSERT_EQ(entities.size(), 2u);
    EXPECT_EQ(entities[0].id, 1);
    EXPECT_EQ(entities[1].startAt, "2024-01-01");
    EXPECT_EQ(requested, (std::vector<std::string>{ first, second }));
    EXPECT_TRUE(fs::exists(test_root / "courses.json"));
}

TEST_F(EntityCatalogTest, SnapshotIsReusedWithoutFetching) {
    std::ofstream(test_root / "courses.json") << R"([{"id": 5, "name": "Cached"}])";

    EntityCatalog catalog(cfg, fetcher(), logger);
    std::vector<Entity> entities;
    ASSERT_TRUE(catalog.load(entities));

    EXPECT_TRUE(requested.empty());
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].name, "Cached");
}

TEST_F(EntityCatalogTest, RefreshIgnoresSnapshot) {
    std::ofstream(test_root / "courses.json") << R"([{"id": 5, "name": "Cached"}])";
    pages["https://host/api/v1/accounts/1/courses?per_page=100"] = page(R"([{"id": 6, "name": "Fresh"}])");

    cfg.refreshListing = true;
    EntityCatalog catalog(cfg, fetcher(), logger);
    std::vector<Entity> entities;
    ASSERT_TRUE(catalog.load(entities));

    EXPECT_EQ(requested.size(), 1u);
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].name, "Fresh");

    std::ifstream in(test_root / "courses.json");
    auto saved = nlohmann::json::parse(in);
    EXPECT_EQ(saved.at(0).at("name").get<std::string>(), "Fresh");
}

TEST_F(EntityCatalogTest, RejectedCredentialsAreFatal) {
    HttpResponse denied;
    denied.status = 401;
    denied.body = R"({"errors": [{"message": "Invalid access token."}]})";
    pages["https://host/api/v1/accounts/1/courses?per_page=100"] = denied;

    EntityCatalog catalog(cfg, fetcher(), logger);
    std::vector<Entity> entities;
    EXPECT_FALSE(catalog.load(entities));
    EXPECT_NE(catalog.lastError().find("401"), std::string::npos);
    EXPECT_FALSE(fs::exists(test_root / "courses.json"));
}

TEST_F(EntityCatalogTest, UnreachableEndpointIsFatal) {
    EntityCatalog catalog(cfg, fetcher(), logger);
    std::vector<Entity> entities;
    EXPECT_FALSE(catalog.load(entities));
    EXPECT_FALSE(catalog.lastError().empty());
}

TEST_F(EntityCatalogTest, FailedSecondPageLeavesNoSnapshot) {
    const std::string first = "https://host/api/v1/accounts/1/courses?per_page=100";
    pages[first] = page(R"([{"id": 1, "name": "A"}])", "https://host/api/v1/accounts/1/courses?page=2");

    EntityCatalog catalog(cfg, fetcher(), logger);
    std::vector<Entity> entities;
    EXPECT_FALSE(catalog.load(entities));
    EXPECT_FALSE(fs::exists(test_root / "courses.json"));
}
