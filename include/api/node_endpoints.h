#pragma once

#include <httplib.h>
#include <chrono>
#include "metrics/prometheus_exporter.h"

namespace cqr {

/// Operational surface of the router process. /health reports liveness with
/// version and uptime, /startup flips to 200 once the process is ready,
/// /metrics renders the shared exporter and /log/level reads or sets the
/// spdlog level at runtime.
class NodeEndpoints {
public:
    NodeEndpoints();

    void registerRoutes(httplib::Server& server);

    /// Called by the HTTP server once per finished request.
    void recordHttpRequest(const httplib::Request& req, const httplib::Response& res, double elapsed_seconds);

    metrics::PrometheusExporter& exporter() { return exporter_; }

private:
    void health(httplib::Response& res) const;
    void startup(httplib::Response& res) const;
    void metrics(httplib::Response& res);
    void setLogLevel(const httplib::Request& req, httplib::Response& res);

    double uptimeSeconds() const;

    std::chrono::steady_clock::time_point started_at_;
    metrics::PrometheusExporter exporter_;
};

}  // namespace cqr
