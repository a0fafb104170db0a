#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace cqr {

struct RouterConfig {
    std::string loki_mcp_url{"http://loki-mcp.monitoring.svc.cluster.local:8000"};
    std::string prometheus_mcp_url{"http://prometheus-mcp.monitoring.svc.cluster.local:8080"};
    std::string ollama_url{"http://ollama-external.ai.svc.cluster.local:11434"};
    std::string ollama_model{"phi4-mini:latest"};
    std::chrono::milliseconds tool_timeout{30000};
    std::chrono::milliseconds model_timeout{60000};
    int port{8080};
    std::string bind_address{"0.0.0.0"};
    bool cors_enabled{true};
    std::string cors_allow_origin{"*"};
    bool gzip_enabled{true};
};

RouterConfig loadRouterConfig();

// Config plus a one-line description of where values came from.
// Order: defaults, JSON file (CQR_CONFIG or ~/.cqr/config.json), environment.
std::pair<RouterConfig, std::string> loadRouterConfigWithLog();

}  // namespace cqr
