// CLI client implementation
// HTTP client for communicating with a running router

#include "cli/cli_client.h"

#include <chrono>
#include <cstdlib>
#include <httplib.h>

#include "utils/http_url.h"

namespace cqr {
namespace cli {

namespace {
constexpr std::chrono::milliseconds kHealthCheckTimeout{2000};
// Covers one tool call plus one model call on the server side.
constexpr std::chrono::milliseconds kAskTimeout{120000};
}  // namespace

CliClient::CliClient(const std::string& server_url) {
    if (server_url.empty()) {
        const char* env_server = std::getenv("CQR_SERVER");
        server_url_ = (env_server && *env_server) ? env_server : "http://127.0.0.1:8080";
    } else {
        server_url_ = server_url;
    }
}

bool CliClient::isServerRunning() const {
    HttpUrl url = parseUrl(server_url_);
    auto client = makeClient(url, kHealthCheckTimeout);
    if (!client) return false;

    auto res = client->Get(joinUrlPath(url, "/health"));
    return res && res->status == 200;
}

CliResponse<nlohmann::json> CliClient::ask(const std::string& question) {
    HttpUrl url = parseUrl(server_url_);
    auto client = makeClient(url, kAskTimeout);
    if (!client) {
        return {CliError::GeneralError, "Invalid server URL: " + server_url_, std::nullopt};
    }

    nlohmann::json body;
    body["question"] = question;
    auto res = client->Post(joinUrlPath(url, "/ask"), body.dump(), "application/json");
    if (!res) {
        return {CliError::ConnectionError,
                "Failed to connect to server: " + describeHttpError(res.error()), std::nullopt};
    }
    return decode(res->status, res->body);
}

CliResponse<nlohmann::json> CliClient::listRoutes() {
    HttpUrl url = parseUrl(server_url_);
    auto client = makeClient(url, kHealthCheckTimeout);
    if (!client) {
        return {CliError::GeneralError, "Invalid server URL: " + server_url_, std::nullopt};
    }

    auto res = client->Get(joinUrlPath(url, "/routes"));
    if (!res) {
        return {CliError::ConnectionError,
                "Failed to connect to server: " + describeHttpError(res.error()), std::nullopt};
    }
    return decode(res->status, res->body);
}

CliResponse<nlohmann::json> CliClient::decode(int status, const std::string& body) const {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        if (status != 200) {
            return {CliError::GeneralError, "HTTP " + std::to_string(status) + ": " + body, std::nullopt};
        }
        return {CliError::GeneralError, "Invalid JSON response from server", std::nullopt};
    }

    if (status != 200) {
        std::string error_msg = "HTTP " + std::to_string(status);
        if (json.is_object() && json.contains("error") && json["error"].is_object()) {
            const auto& err = json["error"];
            if (err.contains("message") && err["message"].is_string()) {
                error_msg = err["message"].get<std::string>();
            }
        }
        return {CliError::GeneralError, error_msg, json};
    }
    return {CliError::Success, "", json};
}

}  // namespace cli
}  // namespace cqr
