#pragma once

#include <httplib.h>
#include <string>
#include <nlohmann/json.hpp>
#include "core/orchestrator.h"
#include "metrics/prometheus_exporter.h"

namespace cqr {

/// Question answering API: POST /ask and GET /routes.
class AskEndpoints {
public:
    AskEndpoints(Orchestrator& orchestrator, metrics::PrometheusExporter& exporter);

    void registerRoutes(httplib::Server& server);

private:
    Orchestrator& orchestrator_;
    metrics::PrometheusExporter& exporter_;

    void handleAsk(const httplib::Request& req, httplib::Response& res);
    void countAsk(const char* outcome);

    static void setJson(httplib::Response& res, const nlohmann::json& body);
    static void respondError(httplib::Response& res, int status, const std::string& code,
                             const std::string& message, nlohmann::json extra = nlohmann::json::object());
};

}  // namespace cqr
