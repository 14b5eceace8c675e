#include <gtest/gtest.h>
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define CPPHTTPLIB_THREAD_POOL_COUNT 4
#include "../test_server.hpp"
#include "api.hpp"
#include "storage.hpp"

#include <atomic>
#include <chrono>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <set>
#include <thread>
#include <vector>

using nlohmann::json;

static httplib::Result post_user(httplib::Client& cli, const json& body)
{
    return cli.Post("/users", body.dump(), "application/json");
}

struct ApiIntegration : public ::testing::Test
{
  protected:
    InMemoryUserStore store;
    TestServer        server{ store };
    httplib::Client   cli{ "127.0.0.1", server.port };
};

TEST_F(ApiIntegration, FullUserLifecycle)
{
    auto created = post_user(cli, { { "name", "Ann" }, { "email", "ann@x.com" } });
    ASSERT_TRUE(created != nullptr);
    ASSERT_EQ(created->status, 201) << created->body;
    auto c = json::parse(created->body);
    EXPECT_EQ(c["id"], 1);
    EXPECT_EQ(c["name"], "Ann");
    EXPECT_EQ(c["email"], "ann@x.com");

    auto got = cli.Get("/users/1");
    ASSERT_TRUE(got != nullptr);
    EXPECT_EQ(got->status, 200);
    EXPECT_EQ(json::parse(got->body), c);

    auto del = cli.Delete("/users/1");
    ASSERT_TRUE(del != nullptr);
    EXPECT_EQ(del->status, 200);
    EXPECT_EQ(json::parse(del->body)["deleted"], 1);

    auto gone = cli.Get("/users/1");
    ASSERT_TRUE(gone != nullptr);
    EXPECT_EQ(gone->status, 404);
    EXPECT_EQ(json::parse(gone->body)["error"], "NotFound");

    auto again = cli.Delete("/users/1");
    ASSERT_TRUE(again != nullptr);
    EXPECT_EQ(again->status, 404);

    auto health = cli.Get("/health");
    ASSERT_TRUE(health != nullptr);
    EXPECT_EQ(health->status, 200);
    EXPECT_EQ(json::parse(health->body)["status"], "ok");
}

TEST_F(ApiIntegration, ListReflectsCreatesAndDeletes)
{
    auto empty = cli.Get("/users");
    ASSERT_TRUE(empty != nullptr);
    EXPECT_EQ(empty->status, 200);
    EXPECT_EQ(json::parse(empty->body), json::array());

    for (const char* n : { "a", "b", "c" })
        ASSERT_EQ(post_user(cli, { { "name", n }, { "email", std::string(n) + "@x.com" } })->status, 201);
    ASSERT_EQ(cli.Delete("/users/2")->status, 200);

    auto res = cli.Get("/users");
    ASSERT_TRUE(res != nullptr);
    auto arr = json::parse(res->body);
    ASSERT_EQ(arr.size(), 2U);
    EXPECT_EQ(arr[0]["id"], 1);
    EXPECT_EQ(arr[0]["name"], "a");
    EXPECT_EQ(arr[1]["id"], 3);
    EXPECT_EQ(arr[1]["name"], "c");
}

TEST_F(ApiIntegration, ValidationErrors_DoNotConsumeIds)
{
    const std::vector<std::string> bad = {
        R"({"name":"","email":"bad"})",
        R"({"name":"Ann"})",
        R"({"email":"ann@x.com"})",
        R"({"name":"   ","email":"ann@x.com"})",
        R"({"name":"Ann","email":7})",
    };
    for (const auto& body : bad)
    {
        auto res = cli.Post("/users", body, "application/json");
        ASSERT_TRUE(res != nullptr) << body;
        EXPECT_EQ(res->status, 400) << body;
        EXPECT_EQ(json::parse(res->body)["error"], "ValidationError") << body;
    }

    auto malformed = cli.Post("/users", "{\"name\":", "application/json");
    ASSERT_TRUE(malformed != nullptr);
    EXPECT_EQ(malformed->status, 400);
    EXPECT_EQ(json::parse(malformed->body)["error"], "BadRequest");

    EXPECT_EQ(json::parse(cli.Get("/users")->body).size(), 0U);

    auto ok = post_user(cli, { { "name", "Ann" }, { "email", "ann@x.com" } });
    ASSERT_TRUE(ok != nullptr);
    EXPECT_EQ(json::parse(ok->body)["id"], 1);
}

TEST_F(ApiIntegration, IdsAreNotReusedAfterDelete)
{
    ASSERT_EQ(post_user(cli, { { "name", "A" }, { "email", "a@x.com" } })->status, 201);
    ASSERT_EQ(cli.Delete("/users/1")->status, 200);

    auto res = post_user(cli, { { "name", "A" }, { "email", "a@x.com" } });
    ASSERT_TRUE(res != nullptr);
    EXPECT_EQ(json::parse(res->body)["id"], 2);
}

TEST_F(ApiIntegration, NeverIssuedId_IsNotFound)
{
    EXPECT_EQ(cli.Get("/users/42")->status, 404);
    EXPECT_EQ(cli.Delete("/users/42")->status, 404);
    EXPECT_EQ(cli.Get("/users/0")->status, 404);
}

TEST_F(ApiIntegration, ConcurrentPosts_GetDistinctIds)
{
    constexpr int            kClients  = 4;
    constexpr int            kRequests = 25;
    std::vector<std::thread> workers;
    std::vector<std::vector<std::int64_t>> ids(kClients);
    std::atomic<int>         failures{ 0 };

    for (int t = 0; t < kClients; ++t)
    {
        workers.emplace_back(
            [this, t, &ids, &failures]
            {
                httplib::Client c("127.0.0.1", server.port);
                for (int i = 0; i < kRequests; ++i)
                {
                    auto res = post_user(c, { { "name", "n" }, { "email", "e@x.com" } });
                    if (!res || res->status != 201)
                    {
                        ++failures;
                        continue;
                    }
                    ids[t].push_back(json::parse(res->body)["id"].get<std::int64_t>());
                }
            });
    }
    for (auto& w : workers)
        w.join();

    EXPECT_EQ(failures.load(), 0);
    std::set<std::int64_t> unique;
    for (const auto& v : ids)
        unique.insert(v.begin(), v.end());
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kClients * kRequests));
    EXPECT_EQ(store.list().size(), static_cast<std::size_t>(kClients * kRequests));
}

TEST_F(ApiIntegration, LogsEndpointServesAccessLog)
{
    ASSERT_EQ(cli.Get("/users/9")->status, 404);
    ASSERT_EQ(post_user(cli, { { "name", "A" }, { "email", "a@x.com" } })->status, 201);

    // the logger runs after the response is written
    auto logged = [this](const std::string& method, const std::string& path)
    {
        for (const auto& l : store.get_logs())
            if (l.method == method && l.path == path)
                return true;
        return false;
    };
    for (int i = 0; i < 50 && !(logged("GET", "/users/9") && logged("POST", "/users")); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    auto res = cli.Get("/logs");
    ASSERT_TRUE(res != nullptr);
    EXPECT_EQ(res->status, 200);
    auto logs = json::parse(res->body);
    ASSERT_TRUE(logs.is_array());

    int miss = -1;
    int post = -1;
    for (int i = 0; i < static_cast<int>(logs.size()); ++i)
    {
        if (logs[i]["method"] == "GET" && logs[i]["path"] == "/users/9")
            miss = i;
        if (logs[i]["method"] == "POST" && logs[i]["path"] == "/users")
            post = i;
    }
    ASSERT_GE(miss, 0);
    ASSERT_GE(post, 0);
    EXPECT_LT(miss, post);
    EXPECT_EQ(logs[miss]["status"], 404);
    EXPECT_EQ(logs[miss]["client_ip"], "127.0.0.1");
    EXPECT_EQ(logs[post]["status"], 201);

    auto last = cli.Get("/logs?limit=1");
    ASSERT_TRUE(last != nullptr);
    EXPECT_EQ(json::parse(last->body).size(), 1U);
}

TEST_F(ApiIntegration, DeleteLogsEmptiesAccessLog)
{
    ASSERT_EQ(cli.Get("/users")->status, 200);

    // let earlier requests reach the log before clearing it
    auto seen = [this](const std::string& path)
    {
        for (const auto& l : store.get_logs())
            if (l.path == path)
                return true;
        return false;
    };
    for (int i = 0; i < 50 && !(seen("/health") && seen("/users")); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    auto cleared = cli.Delete("/logs");
    ASSERT_TRUE(cleared != nullptr);
    EXPECT_EQ(cleared->status, 200);
    EXPECT_EQ(json::parse(cleared->body)["status"], "ok");

    // only the DELETE itself can have been recorded since the clear
    auto res = cli.Get("/logs");
    ASSERT_TRUE(res != nullptr);
    for (const auto& l : json::parse(res->body))
        EXPECT_EQ(l["path"], "/logs") << l.dump();
}
