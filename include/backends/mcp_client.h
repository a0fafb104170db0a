#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "utils/http_url.h"

namespace cqr {

inline constexpr const char* kMcpProtocolVersion = "2025-06-18";

/// Result of one MCP tools/call round trip.
struct McpCallResult {
    bool success{false};
    std::string text;           // tool output when success
    std::string error_message;  // raw failure detail otherwise
};

/// Minimal client for the MCP streamable HTTP transport. Every callTool()
/// opens a fresh session (initialize, notifications/initialized, tools/call)
/// and performs exactly one attempt.
class McpHttpClient {
public:
    McpHttpClient(std::string name, const std::string& base_url, std::chrono::milliseconds timeout);

    McpCallResult callTool(const std::string& tool_name, const nlohmann::json& arguments) const;

    const std::string& name() const { return name_; }

    /// Full endpoint URL (<base_url>/mcp).
    std::string endpoint() const;

    /// JSON-RPC message from a streamable HTTP body: the first "data: " line of
    /// an SSE stream, or the whole body when it is plain JSON.
    static std::optional<nlohmann::json> extractEventJson(const std::string& body,
                                                          std::string* error = nullptr);

    /// Tool output text from a tools/call JSON-RPC response.
    static McpCallResult extractToolOutput(const nlohmann::json& message);

private:
    std::string name_;
    HttpUrl base_;
    std::string path_;
    std::chrono::milliseconds timeout_;
};

}  // namespace cqr
