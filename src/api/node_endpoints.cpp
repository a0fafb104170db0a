#include "api/node_endpoints.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "runtime/state.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace cqr {

namespace {

nlohmann::json levelBody() {
    return {{"level", std::string(spdlog::level::to_string_view(spdlog::get_level()).data())}};
}

}  // namespace

NodeEndpoints::NodeEndpoints() : started_at_(std::chrono::steady_clock::now()) {}

double NodeEndpoints::uptimeSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
}

void NodeEndpoints::recordHttpRequest(const httplib::Request& req,
                                      const httplib::Response& res,
                                      double elapsed_seconds) {
    // Unknown paths share one label value to keep cardinality bounded.
    const std::string path = res.status == 404 ? "unmatched" : req.path;
    exporter_.inc_counter("cluster_query_router_http_requests_total", 1.0,
                          "HTTP requests handled",
                          {{"method", req.method}, {"path", path}, {"status", std::to_string(res.status)}});
    exporter_.observe("cluster_query_router_http_request_duration_seconds", elapsed_seconds,
                      "HTTP request latency in seconds",
                      {{"method", req.method}, {"path", path}});
}

void NodeEndpoints::health(httplib::Response& res) const {
    nlohmann::json body = {
        {"status", "ok"},
        {"version", CQR_VERSION},
        {"uptime_seconds", static_cast<long long>(uptimeSeconds())},
    };
    res.set_content(body.dump(), "application/json");
}

void NodeEndpoints::startup(httplib::Response& res) const {
    const bool ready = is_ready();
    res.status = ready ? 200 : 503;
    nlohmann::json body = {{"status", ready ? "ready" : "starting"}};
    res.set_content(body.dump(), "application/json");
}

void NodeEndpoints::metrics(httplib::Response& res) {
    exporter_.set_gauge("cluster_query_router_uptime_seconds", uptimeSeconds(), "Router uptime in seconds");
    exporter_.set_gauge("cluster_query_router_active_asks", static_cast<double>(active_ask_count()),
                        "Questions currently being answered");
    res.set_content(exporter_.render(), "text/plain; version=0.0.4");
}

void NodeEndpoints::setLogLevel(const httplib::Request& req, httplib::Response& res) {
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    const bool valid = !body.is_discarded() && body.is_object() && body.contains("level") &&
                       body["level"].is_string();
    if (!valid) {
        nlohmann::json err = {{"error",
                               {{"code", "invalid_request"},
                                {"type", "invalid_request_error"},
                                {"message", "body must be {\"level\": \"<name>\"}"}}}};
        res.status = 400;
        res.set_content(err.dump(), "application/json");
        return;
    }
    spdlog::set_level(logger::parse_level(body["level"].get<std::string>()));
    spdlog::info("Log level set to {}", spdlog::level::to_string_view(spdlog::get_level()).data());
    res.set_content(levelBody().dump(), "application/json");
}

void NodeEndpoints::registerRoutes(httplib::Server& server) {
    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) { health(res); });
    server.Get("/startup", [this](const httplib::Request&, httplib::Response& res) { startup(res); });
    server.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) { metrics(res); });
    server.Get("/log/level", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(levelBody().dump(), "application/json");
    });
    server.Post("/log/level",
                [this](const httplib::Request& req, httplib::Response& res) { setLogLevel(req, res); });
}

}  // namespace cqr
