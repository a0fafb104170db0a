#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "api/ask_endpoints.h"
#include "api/http_server.h"
#include "api/node_endpoints.h"
#include "core/orchestrator.h"
#include "runtime/state.h"

using namespace cqr;

namespace {

class StaticBackend : public BackendClient {
public:
    ToolOutcome invoke(const Route& route, const std::string& question) override {
        ToolRequest request = buildToolRequest(route, question);
        return ToolOutcome::ok(ToolResult{request.backend, request.tool, request.arguments, "payload"});
    }
};

class StaticSummarizer : public Summarizer {
public:
    SummaryResult summarize(const ToolResult&) override { return SummaryResult{true, "- fine", ""}; }
};

class HttpServerTest : public ::testing::Test {
protected:
    StaticBackend backend;
    StaticSummarizer summarizer;
    Orchestrator orchestrator{RouteTable::defaults(), backend, summarizer};
    NodeEndpoints node;
    AskEndpoints ask{orchestrator, node.exporter()};
};

}  // namespace

TEST_F(HttpServerTest, ServesHealthAndMetrics) {
    HttpServer server(19001, ask, node);
    server.start();

    httplib::Client cli("127.0.0.1", 19001);
    auto res = cli.Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto health = nlohmann::json::parse(res->body);
    EXPECT_EQ(health["status"], "ok");
    EXPECT_TRUE(health.contains("version"));
    EXPECT_GE(health.value("uptime_seconds", -1), 0);

    auto metrics = cli.Get("/metrics");
    ASSERT_TRUE(metrics);
    EXPECT_EQ(metrics->status, 200);
    EXPECT_NE(metrics->body.find("cluster_query_router_uptime_seconds"), std::string::npos);
    EXPECT_NE(metrics->body.find("cluster_query_router_active_asks"), std::string::npos);

    server.stop();
}

TEST_F(HttpServerTest, StartupEndpointFollowsReadiness) {
    HttpServer server(19002, ask, node);
    server.start();
    httplib::Client cli("127.0.0.1", 19002);

    set_ready(false);
    auto starting = cli.Get("/startup");
    ASSERT_TRUE(starting);
    EXPECT_EQ(starting->status, 503);

    set_ready(true);
    auto ready = cli.Get("/startup");
    ASSERT_TRUE(ready);
    EXPECT_EQ(ready->status, 200);
    set_ready(false);

    server.stop();
}

TEST_F(HttpServerTest, HandlesCorsPreflightAndHeaders) {
    HttpServer server(19003, ask, node);
    server.setCorsOrigin("https://ops.example.com");
    server.start();

    httplib::Client cli("127.0.0.1", 19003);
    auto preflight = cli.Options("/ask");
    ASSERT_TRUE(preflight);
    EXPECT_EQ(preflight->status, 204);
    EXPECT_EQ(preflight->get_header_value("Access-Control-Allow-Origin"), "https://ops.example.com");
    EXPECT_NE(preflight->get_header_value("Access-Control-Allow-Methods").find("POST"), std::string::npos);
    EXPECT_NE(preflight->get_header_value("Access-Control-Allow-Headers").find("Content-Type"), std::string::npos);

    auto routes = cli.Get("/routes");
    ASSERT_TRUE(routes);
    EXPECT_EQ(routes->get_header_value("Access-Control-Allow-Origin"), "https://ops.example.com");
    EXPECT_FALSE(routes->get_header_value("X-Request-Id").empty());
    EXPECT_FALSE(routes->get_header_value("traceparent").empty());

    server.stop();
}

TEST_F(HttpServerTest, ReturnsJsonErrorsWithHandlers) {
    HttpServer server(19004, ask, node);
    server.getServer().Get("/boom", [](const httplib::Request&, httplib::Response&) {
        throw std::runtime_error("kaboom");
    });
    server.start();

    httplib::Client cli("127.0.0.1", 19004);

    auto notfound = cli.Get("/does-not-exist");
    ASSERT_TRUE(notfound);
    EXPECT_EQ(notfound->status, 404);
    auto body = nlohmann::json::parse(notfound->body);
    ASSERT_TRUE(body.contains("error"));
    EXPECT_EQ(body["error"].value("code", ""), "not_found");
    EXPECT_EQ(body["error"].value("path", ""), "/does-not-exist");

    auto internal = cli.Get("/boom");
    ASSERT_TRUE(internal);
    EXPECT_EQ(internal->status, 500);
    auto ebody = nlohmann::json::parse(internal->body);
    ASSERT_TRUE(ebody.contains("error"));
    EXPECT_EQ(ebody["error"].value("code", ""), "internal_error");
    EXPECT_EQ(ebody["error"].value("message", ""), "kaboom");

    server.stop();
}

TEST_F(HttpServerTest, MiddlewareCanShortCircuitRequests) {
    HttpServer server(19005, ask, node);
    server.addMiddleware([](const httplib::Request& req, httplib::Response& res) {
        if (req.has_header("X-Block")) {
            res.status = 403;
            res.set_content("blocked", "text/plain");
            return false;
        }
        return true;
    });
    server.start();

    httplib::Client cli("127.0.0.1", 19005);
    httplib::Headers h{{"X-Block", "1"}};
    auto blocked = cli.Get("/health", h);
    ASSERT_TRUE(blocked);
    EXPECT_EQ(blocked->status, 403);
    EXPECT_EQ(blocked->body, "blocked");

    auto allowed = cli.Get("/health");
    ASSERT_TRUE(allowed);
    EXPECT_EQ(allowed->status, 200);

    server.stop();
}

TEST_F(HttpServerTest, LoggerReceivesRequestsAndMetricsCountThem) {
    HttpServer server(19006, ask, node);
    std::atomic<bool> logged{false};
    server.setLogger([&logged](const httplib::Request&, const httplib::Response& res, double elapsed) {
        if (res.status == 200 && elapsed >= 0.0) logged = true;
    });
    server.start();

    httplib::Client cli("127.0.0.1", 19006);
    auto res = cli.Get("/health");
    ASSERT_TRUE(res);

    // The access log runs after the response is written.
    for (int i = 0; i < 100 && !logged.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(logged.load());
    EXPECT_DOUBLE_EQ(node.exporter().value("cluster_query_router_http_requests_total",
                                           {{"method", "GET"}, {"path", "/health"}, {"status", "200"}}),
                     1.0);

    server.stop();
}

TEST_F(HttpServerTest, CompressesWhenClientAcceptsGzip) {
    HttpServer server(19007, ask, node);
    server.start();

    httplib::Client cli("127.0.0.1", 19007);
    cli.set_decompress(false);
    httplib::Headers h{{"Accept-Encoding", "gzip"}};
    auto res = cli.Get("/routes", h);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->get_header_value("Content-Encoding"), "gzip");

    server.stop();
}

TEST_F(HttpServerTest, LogLevelCanBeChangedAtRuntime) {
    HttpServer server(19008, ask, node);
    server.start();
    httplib::Client cli("127.0.0.1", 19008);

    auto set = cli.Post("/log/level", R"({"level":"debug"})", "application/json");
    ASSERT_TRUE(set);
    EXPECT_EQ(set->status, 200);
    EXPECT_EQ(nlohmann::json::parse(set->body)["level"], "debug");

    auto bad = cli.Post("/log/level", R"({"lvl":"debug"})", "application/json");
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 400);

    cli.Post("/log/level", R"({"level":"info"})", "application/json");
    server.stop();
}

TEST(ListenerWaitTest, ReturnsOnceListening) {
    int polls = 0;
    EXPECT_TRUE(waitUntilListening([&polls]() { return ++polls >= 3; }, []() { return false; },
                                   std::chrono::milliseconds(2000)));
    EXPECT_EQ(polls, 3);
}

TEST(ListenerWaitTest, StopsWhenListenerExits) {
    const auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(waitUntilListening([]() { return false; }, []() { return true; },
                                    std::chrono::seconds(30)));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
}

TEST(ListenerWaitTest, GivesUpAfterTimeout) {
    const auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(waitUntilListening([]() { return false; }, []() { return false; },
                                    std::chrono::milliseconds(100)));
    const auto elapsed = std::chrono::steady_clock::now() - begin;
    EXPECT_GE(elapsed, std::chrono::milliseconds(100));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}
