#include "backends/backend_client.h"

#include <spdlog/spdlog.h>

#include "routing/question_parser.h"
#include "utils/config.h"

namespace cqr {

namespace {

nlohmann::json timeWindow(const NormalizedQuestion& q) {
    return {{"namespace", extract_namespace(q.text)}, {"hours", extract_hours(q.text)}};
}

// Loki queries are bounded by namespace and a look-back window in hours.
nlohmann::json buildLogQuery(QueryTemplate query, const NormalizedQuestion& q) {
    switch (query) {
        case QueryTemplate::kNone:
            return nlohmann::json::object();
        case QueryTemplate::kTimeWindow:
            return timeWindow(q);
        case QueryTemplate::kTimeWindowWithPod: {
            auto args = timeWindow(q);
            args["pod_name"] = extract_pod_name(q.text);
            return args;
        }
        case QueryTemplate::kTimeWindowWithSearch: {
            auto args = timeWindow(q);
            args["query"] = extract_search_query(q.raw);
            return args;
        }
    }
    return nlohmann::json::object();
}

// Prometheus queries are instant unless the route asks for a range, in which
// case only the look-back window applies.
nlohmann::json buildMetricsQuery(QueryTemplate query, const NormalizedQuestion& q) {
    switch (query) {
        case QueryTemplate::kNone:
            return nlohmann::json::object();
        case QueryTemplate::kTimeWindow:
        case QueryTemplate::kTimeWindowWithPod:
        case QueryTemplate::kTimeWindowWithSearch:
            return {{"hours", extract_hours(q.text)}};
    }
    return nlohmann::json::object();
}

}  // namespace

ToolRequest buildToolRequest(const Route& route, const std::string& question) {
    const NormalizedQuestion q = make_normalized_question(question);
    ToolRequest request;
    request.backend = route.backend;
    request.tool = route.tool;
    switch (route.backend) {
        case Backend::kLogs:
            request.arguments = buildLogQuery(route.query, q);
            break;
        case Backend::kMetrics:
            request.arguments = buildMetricsQuery(route.query, q);
            break;
    }
    return request;
}

McpBackendClient::McpBackendClient(const std::string& loki_url,
                                   const std::string& prometheus_url,
                                   std::chrono::milliseconds timeout)
    : logs_(to_string(Backend::kLogs), loki_url, timeout),
      metrics_(to_string(Backend::kMetrics), prometheus_url, timeout) {}

McpBackendClient::McpBackendClient(const RouterConfig& config)
    : McpBackendClient(config.loki_mcp_url, config.prometheus_mcp_url, config.tool_timeout) {}

const McpHttpClient& McpBackendClient::clientFor(Backend backend) const {
    switch (backend) {
        case Backend::kLogs:
            return logs_;
        case Backend::kMetrics:
            return metrics_;
    }
    return logs_;
}

ToolOutcome McpBackendClient::invoke(const Route& route, const std::string& question) {
    ToolRequest request = buildToolRequest(route, question);
    const McpHttpClient& client = clientFor(request.backend);

    spdlog::debug("Calling {}.{} at {} with {}", client.name(), request.tool,
                  client.endpoint(), request.arguments.dump());

    McpCallResult call = client.callTool(request.tool, request.arguments);
    if (!call.success) {
        spdlog::warn("Tool call {}.{} failed: {}", client.name(), request.tool, call.error_message);
        return ToolOutcome::failure(ToolInvocationError{request.backend, request.tool, call.error_message});
    }

    ToolResult result;
    result.backend = request.backend;
    result.tool = std::move(request.tool);
    result.arguments = std::move(request.arguments);
    result.payload = std::move(call.text);
    return ToolOutcome::ok(std::move(result));
}

}  // namespace cqr
