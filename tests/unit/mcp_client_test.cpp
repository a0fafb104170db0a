#include <gtest/gtest.h>
#include <chrono>

#include "backends/mcp_client.h"
#include "support/fake_servers.h"
#include "utils/version.h"

using namespace cqr;
using cqr::test::FakeMcpServer;
using json = nlohmann::json;

namespace {
constexpr std::chrono::milliseconds kTimeout{2000};
}

TEST(McpClientTest, ExtractsFirstDataLineOfEventStream) {
    const std::string body =
        "event: message\r\n"
        "data: {\"jsonrpc\":\"2.0\",\"id\":\"x\",\"result\":{}}\r\n"
        "\r\n"
        "data: {\"ignored\":true}\n";
    auto message = McpHttpClient::extractEventJson(body);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ((*message)["id"], "x");
}

TEST(McpClientTest, AcceptsPlainJsonBody) {
    auto message = McpHttpClient::extractEventJson(R"({"jsonrpc":"2.0","id":1,"result":{}})");
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ((*message)["id"], 1);
}

TEST(McpClientTest, RejectsBodyWithoutPayload) {
    std::string error;
    EXPECT_FALSE(McpHttpClient::extractEventJson("event: ping\n\n", &error).has_value());
    EXPECT_NE(error.find("No MCP event payload"), std::string::npos);

    EXPECT_FALSE(McpHttpClient::extractEventJson("data: {not json\n", &error).has_value());
    EXPECT_NE(error.find("Malformed"), std::string::npos);
}

TEST(McpClientTest, ToolOutputPrefersStructuredResult) {
    json message = {{"result", {{"structuredContent", {{"result", "3 errors in prod"}}},
                                {"content", json::array({{{"type", "text"}, {"text", "other"}}})}}}};
    auto out = McpHttpClient::extractToolOutput(message);
    ASSERT_TRUE(out.success);
    EXPECT_EQ(out.text, "3 errors in prod");

    json structured_object = {{"result", {{"structuredContent", {{"result", {{"count", 3}}}}}}}};
    out = McpHttpClient::extractToolOutput(structured_object);
    ASSERT_TRUE(out.success);
    EXPECT_EQ(json::parse(out.text)["count"], 3);
}

TEST(McpClientTest, ToolOutputJoinsTextContent) {
    json message = {{"result", {{"content", json::array({
        {{"type", "text"}, {"text", "line one"}},
        {{"type", "image"}, {"data", "..."}},
        {{"type", "text"}, {"text", "line two"}}
    })}}}};
    auto out = McpHttpClient::extractToolOutput(message);
    ASSERT_TRUE(out.success);
    EXPECT_EQ(out.text, "line one\nline two");
}

TEST(McpClientTest, ToolOutputFallsBackToRawResult) {
    json message = {{"result", {{"content", json::array()}}}};
    auto out = McpHttpClient::extractToolOutput(message);
    ASSERT_TRUE(out.success);
    EXPECT_EQ(json::parse(out.text), message["result"]);
}

TEST(McpClientTest, ToolErrorsAreFailures) {
    auto rpc = McpHttpClient::extractToolOutput({{"error", {{"code", -32602}, {"message", "unknown tool"}}}});
    EXPECT_FALSE(rpc.success);
    EXPECT_NE(rpc.error_message.find("unknown tool"), std::string::npos);

    auto flagged = McpHttpClient::extractToolOutput(
        {{"result", {{"isError", true}, {"structuredContent", {{"result", "loki query failed"}}}}}});
    EXPECT_FALSE(flagged.success);
    EXPECT_EQ(flagged.error_message, "loki query failed");

    auto bare = McpHttpClient::extractToolOutput({{"result", {{"isError", true}}}});
    EXPECT_FALSE(bare.success);
    EXPECT_EQ(bare.error_message, "MCP tool call failed");
}

TEST(McpClientTest, MalformedIsErrorFlagIsIgnored) {
    auto out = McpHttpClient::extractToolOutput(
        {{"result", {{"isError", "yes"}, {"content", json::array({{{"type", "text"}, {"text", "fine"}}})}}}});
    ASSERT_TRUE(out.success);
    EXPECT_EQ(out.text, "fine");
}

TEST(McpClientTest, EndpointAppendsMcpPath) {
    McpHttpClient plain("loki", "http://loki-mcp:8000", kTimeout);
    EXPECT_EQ(plain.endpoint(), "http://loki-mcp:8000/mcp");
    McpHttpClient prefixed("loki", "http://gateway:80/loki/", kTimeout);
    EXPECT_EQ(prefixed.endpoint(), "http://gateway:80/loki/mcp");
}

TEST(McpClientTest, CallToolPerformsHandshakeThenCall) {
    FakeMcpServer server(18201);
    server.setToolHandler([](const std::string& tool, const json& args) {
        return cqr::test::textToolResult(tool + " in " + args.value("namespace", "?"));
    });
    server.start();

    McpHttpClient client("loki", server.url(), kTimeout);
    auto out = client.callTool("get_error_summary", {{"namespace", "prod"}, {"hours", 1}});

    ASSERT_TRUE(out.success) << out.error_message;
    EXPECT_EQ(out.text, "get_error_summary in prod");

    auto methods = server.methods();
    ASSERT_EQ(methods.size(), 3u);
    EXPECT_EQ(methods[0], "initialize");
    EXPECT_EQ(methods[1], "notifications/initialized");
    EXPECT_EQ(methods[2], "tools/call");

    auto calls = server.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].session_id, "session-1");
    EXPECT_EQ(calls[0].arguments["hours"], 1);

    auto init = server.lastInitializeParams();
    EXPECT_EQ(init["protocolVersion"], kMcpProtocolVersion);
    EXPECT_EQ(init["clientInfo"]["name"], "cluster-query-router");
    EXPECT_EQ(init["clientInfo"]["version"], CQR_VERSION);
}

TEST(McpClientTest, CallToolAcceptsPlainJsonResponses) {
    FakeMcpServer server(18202);
    server.setPlainJson(true);
    server.start();

    McpHttpClient client("prometheus", server.url(), kTimeout);
    auto out = client.callTool("health_check", json::object());
    ASSERT_TRUE(out.success) << out.error_message;
    EXPECT_EQ(out.text, "ok");
}

TEST(McpClientTest, CallToolReportsHttpStatus) {
    FakeMcpServer server(18203);
    server.setToolStatus(500);
    server.start();

    McpHttpClient client("loki", server.url(), kTimeout);
    auto out = client.callTool("search_logs", {{"query", "oom"}});
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.error_message.rfind("loki:", 0), 0u);
    EXPECT_NE(out.error_message.find("HTTP 500"), std::string::npos);
    EXPECT_NE(out.error_message.find("backend exploded"), std::string::npos);
}

TEST(McpClientTest, CallToolReportsJsonRpcError) {
    FakeMcpServer server(18204);
    server.setToolError({{"code", -32602}, {"message", "Unknown tool"}});
    server.start();

    McpHttpClient client("loki", server.url(), kTimeout);
    auto out = client.callTool("nope", json::object());
    EXPECT_FALSE(out.success);
    EXPECT_NE(out.error_message.find("tools/call nope"), std::string::npos);
    EXPECT_NE(out.error_message.find("Unknown tool"), std::string::npos);
}

TEST(McpClientTest, CallToolReportsConnectionFailure) {
    // Nothing listens on this port.
    McpHttpClient client("prometheus", "http://127.0.0.1:18209", kTimeout);
    auto out = client.callTool("health_check", json::object());
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.error_message.rfind("prometheus:", 0), 0u);
    EXPECT_NE(out.error_message.find("initialize"), std::string::npos);
}

TEST(McpClientTest, CallToolRejectsUnsupportedUrl) {
    McpHttpClient client("loki", "not a url", kTimeout);
    auto out = client.callTool("list_namespaces", json::object());
    EXPECT_FALSE(out.success);
    EXPECT_NE(out.error_message.find("invalid or unsupported"), std::string::npos);
}
