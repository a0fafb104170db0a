#pragma once

#include <optional>
#include <utility>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/ask_error.h"
#include "routing/route.h"

namespace cqr {

/// Shown in place of the summary when the model could not produce one.
inline constexpr const char* kSummaryUnavailable = "Summary unavailable";

/// Concrete tool call derived from a route and a question.
struct ToolRequest {
    Backend backend{Backend::kLogs};
    std::string tool;
    nlohmann::json arguments = nlohmann::json::object();
};

/// Verbatim tool output. payload is never reinterpreted.
struct ToolResult {
    Backend backend{Backend::kLogs};
    std::string tool;
    nlohmann::json arguments = nlohmann::json::object();
    std::string payload;
};

struct ToolInvocationError {
    Backend backend{Backend::kLogs};
    std::string tool;
    std::string detail;  // raw transport / protocol error
};

/// Outcome of BackendClient::invoke: result on success, error otherwise.
struct ToolOutcome {
    bool success{false};
    ToolResult result;
    ToolInvocationError error;

    static ToolOutcome ok(ToolResult r) {
        ToolOutcome o;
        o.success = true;
        o.result = std::move(r);
        return o;
    }
    static ToolOutcome failure(ToolInvocationError e) {
        ToolOutcome o;
        o.error = std::move(e);
        return o;
    }
};

/// Summary text, or the reason summarization failed.
struct SummaryResult {
    bool success{false};
    std::string text;
    std::string error_message;
};

struct AskResponse {
    std::string question;
    std::string route_id;
    ToolResult tool_result;
    std::string summary;          // kSummaryUnavailable when summary_available is false
    bool summary_available{false};
    std::string summary_error;
};

struct AskResult {
    bool success{false};
    AskErrorCode error_code{AskErrorCode::kOk};
    std::string error_message;

    // kNoRouteMatch
    std::vector<std::string> recognized_questions;

    // kToolInvocation
    std::string route_id;
    std::optional<ToolInvocationError> tool_error;

    // success
    std::optional<AskResponse> response;
};

nlohmann::json to_json(const AskResponse& response);

}  // namespace cqr
