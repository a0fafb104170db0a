#include "backends/mcp_client.h"

#include <sstream>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "utils/version.h"

namespace cqr {

namespace {

constexpr const char* kSessionHeader = "mcp-session-id";
constexpr const char* kContentType = "application/json";

httplib::Headers mcpHeaders(const std::string& session_id = "") {
    httplib::Headers headers{{"Accept", "application/json, text/event-stream"}};
    if (!session_id.empty()) {
        headers.emplace(kSessionHeader, session_id);
    }
    return headers;
}

bool isSuccessStatus(int status) {
    return status >= 200 && status < 300;
}

std::string statusError(const std::string& endpoint, const httplib::Response& res) {
    std::ostringstream oss;
    oss << "HTTP " << res.status << " from " << endpoint;
    if (!res.body.empty()) {
        oss << ": " << res.body;
    }
    return oss.str();
}

std::string jsonRpcErrorMessage(const nlohmann::json& error) {
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        std::string msg = error["message"].get<std::string>();
        if (error.contains("code")) {
            msg = "JSON-RPC error " + error["code"].dump() + ": " + msg;
        }
        return msg;
    }
    return "JSON-RPC error: " + error.dump();
}

McpCallResult fail(std::string message) {
    return McpCallResult{false, "", std::move(message)};
}

}  // namespace

McpHttpClient::McpHttpClient(std::string name, const std::string& base_url, std::chrono::milliseconds timeout)
    : name_(std::move(name)), base_(parseUrl(base_url)), timeout_(timeout) {
    path_ = joinUrlPath(base_, "/mcp");
}

std::string McpHttpClient::endpoint() const {
    return base_.valid() ? base_.schemeHostPort() + path_ : path_;
}

std::optional<nlohmann::json> McpHttpClient::extractEventJson(const std::string& body, std::string* error) {
    std::istringstream stream(body);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.rfind("data: ", 0) != 0) continue;
        auto j = nlohmann::json::parse(line.substr(6), nullptr, false);
        if (j.is_discarded()) {
            if (error) *error = "Malformed MCP event payload: " + line.substr(6);
            return std::nullopt;
        }
        return j;
    }

    auto j = nlohmann::json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        return j;
    }
    if (error) *error = "No MCP event payload found in response";
    return std::nullopt;
}

McpCallResult McpHttpClient::extractToolOutput(const nlohmann::json& message) {
    if (!message.is_object()) {
        return fail("MCP response is not a JSON object");
    }
    if (message.contains("error") && !message["error"].is_null()) {
        return fail(jsonRpcErrorMessage(message["error"]));
    }

    const nlohmann::json result = message.contains("result") && message["result"].is_object()
                                      ? message["result"]
                                      : nlohmann::json::object();
    const nlohmann::json* structured =
        result.contains("structuredContent") ? &result["structuredContent"] : nullptr;

    const bool is_error = result.contains("isError") && result["isError"].is_boolean() &&
                          result["isError"].get<bool>();
    if (is_error) {
        if (structured && structured->is_object() && structured->contains("result")) {
            const auto& detail = (*structured)["result"];
            if (detail.is_string() && !detail.get<std::string>().empty()) {
                return fail(detail.get<std::string>());
            }
            if (!detail.is_string() && !detail.is_null()) {
                return fail(detail.dump());
            }
        }
        return fail("MCP tool call failed");
    }

    if (structured && structured->is_object() && structured->contains("result")) {
        const auto& value = (*structured)["result"];
        return McpCallResult{true, value.is_string() ? value.get<std::string>() : value.dump(), ""};
    }

    std::vector<std::string> chunks;
    if (result.contains("content") && result["content"].is_array()) {
        for (const auto& item : result["content"]) {
            if (!item.is_object()) continue;
            if (!item.contains("type") || item["type"] != "text") continue;
            if (!item.contains("text") || !item["text"].is_string()) continue;
            std::string text = item["text"].get<std::string>();
            if (!text.empty()) chunks.push_back(std::move(text));
        }
    }
    if (!chunks.empty()) {
        std::string joined;
        for (size_t i = 0; i < chunks.size(); ++i) {
            if (i > 0) joined.push_back('\n');
            joined += chunks[i];
        }
        return McpCallResult{true, joined, ""};
    }

    return McpCallResult{true, result.dump(), ""};
}

McpCallResult McpHttpClient::callTool(const std::string& tool_name, const nlohmann::json& arguments) const {
    const std::string url = endpoint();
    auto client = makeClient(base_, timeout_);
    if (!client) {
        return fail(name_ + ": invalid or unsupported MCP endpoint '" + url + "'");
    }

    // initialize
    const nlohmann::json init = {
        {"jsonrpc", "2.0"},
        {"id", "initialize"},
        {"method", "initialize"},
        {"params", {
            {"protocolVersion", kMcpProtocolVersion},
            {"capabilities", nlohmann::json::object()},
            {"clientInfo", {{"name", "cluster-query-router"}, {"version", CQR_VERSION}}}
        }}
    };
    auto init_res = client->Post(path_, mcpHeaders(), init.dump(), kContentType);
    if (!init_res) {
        return fail(name_ + ": initialize request to " + url + " failed: " +
                    describeHttpError(init_res.error()));
    }
    if (!isSuccessStatus(init_res->status)) {
        return fail(name_ + ": initialize: " + statusError(url, *init_res));
    }
    const std::string session_id = init_res->get_header_value(kSessionHeader);
    if (session_id.empty()) {
        return fail(name_ + " did not return an MCP session id");
    }
    std::string parse_error;
    auto init_msg = extractEventJson(init_res->body, &parse_error);
    if (!init_msg) {
        return fail(name_ + ": initialize: " + parse_error);
    }
    if (init_msg->contains("error") && !(*init_msg)["error"].is_null()) {
        return fail(name_ + ": initialize: " + jsonRpcErrorMessage((*init_msg)["error"]));
    }
    spdlog::debug("MCP session {} opened on {}", session_id, url);

    // notifications/initialized
    const nlohmann::json initialized = {
        {"jsonrpc", "2.0"},
        {"method", "notifications/initialized"},
        {"params", nlohmann::json::object()}
    };
    auto notify_res = client->Post(path_, mcpHeaders(session_id), initialized.dump(), kContentType);
    if (!notify_res) {
        return fail(name_ + ": initialized notification failed: " + describeHttpError(notify_res.error()));
    }
    if (notify_res->status != 200 && notify_res->status != 202) {
        return fail(name_ + ": initialized notification: " + statusError(url, *notify_res));
    }

    // tools/call
    const nlohmann::json call = {
        {"jsonrpc", "2.0"},
        {"id", "tool-call"},
        {"method", "tools/call"},
        {"params", {{"name", tool_name}, {"arguments", arguments}}}
    };
    auto call_res = client->Post(path_, mcpHeaders(session_id), call.dump(), kContentType);
    if (!call_res) {
        return fail(name_ + ": tools/call " + tool_name + " failed: " + describeHttpError(call_res.error()));
    }
    if (!isSuccessStatus(call_res->status)) {
        return fail(name_ + ": tools/call " + tool_name + ": " + statusError(url, *call_res));
    }
    auto call_msg = extractEventJson(call_res->body, &parse_error);
    if (!call_msg) {
        return fail(name_ + ": tools/call " + tool_name + ": " + parse_error);
    }
    McpCallResult output = extractToolOutput(*call_msg);
    if (!output.success) {
        output.error_message = name_ + ": tools/call " + tool_name + ": " + output.error_message;
    }
    return output;
}

}  // namespace cqr
