#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cqr {
namespace cli {

/// Error codes for CLI operations
enum class CliError {
    Success = 0,
    GeneralError = 1,
    ConnectionError = 2,
};

/// Result of CLI operations
template<typename T>
struct CliResponse {
    CliError error{CliError::Success};
    std::string error_message;
    std::optional<T> data;

    bool ok() const { return error == CliError::Success; }
};

/// HTTP client for a running router
class CliClient {
public:
    /// @param server_url Router base URL (default from CQR_SERVER env, then
    ///        http://127.0.0.1:8080)
    explicit CliClient(const std::string& server_url = "");

    /// Check if server is running
    bool isServerRunning() const;

    /// POST /ask. Error responses still carry the decoded body in data.
    CliResponse<nlohmann::json> ask(const std::string& question);

    /// GET /routes
    CliResponse<nlohmann::json> listRoutes();

    const std::string& getServerUrl() const { return server_url_; }

private:
    std::string server_url_;

    CliResponse<nlohmann::json> decode(int status, const std::string& body) const;
};

}  // namespace cli
}  // namespace cqr
