#pragma once

#include <chrono>
#include <string>

#include "backends/mcp_client.h"
#include "core/ask_types.h"
#include "routing/route.h"

namespace cqr {

struct RouterConfig;

/// Build the tool call for a route. The argument shape depends only on the
/// route's backend and query template; the question only supplies values.
ToolRequest buildToolRequest(const Route& route, const std::string& question);

/// Invokes the monitoring backend selected by a route. Implementations make at
/// most one outbound attempt per call and never retry.
class BackendClient {
public:
    virtual ~BackendClient() = default;

    virtual ToolOutcome invoke(const Route& route, const std::string& question) = 0;
};

/// BackendClient that reaches Loki and Prometheus through their MCP servers.
class McpBackendClient : public BackendClient {
public:
    McpBackendClient(const std::string& loki_url,
                     const std::string& prometheus_url,
                     std::chrono::milliseconds timeout);
    explicit McpBackendClient(const RouterConfig& config);

    ToolOutcome invoke(const Route& route, const std::string& question) override;

private:
    const McpHttpClient& clientFor(Backend backend) const;

    McpHttpClient logs_;
    McpHttpClient metrics_;
};

}  // namespace cqr
