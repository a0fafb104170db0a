#include "core/orchestrator.h"

#include <spdlog/spdlog.h>
#include <utility>

namespace cqr {

nlohmann::json to_json(const AskResponse& response) {
    nlohmann::json body = {
        {"question", response.question},
        {"route", response.route_id},
        {"server", to_string(response.tool_result.backend)},
        {"tool", response.tool_result.tool},
        {"tool_args", response.tool_result.arguments},
        {"raw_result", response.tool_result.payload},
        {"summary", response.summary},
        {"summary_available", response.summary_available}
    };
    if (!response.summary_available) {
        body["summary_error"] = response.summary_error;
    }
    return body;
}

Orchestrator::Orchestrator(const RouteTable& routes, BackendClient& backend, Summarizer& summarizer)
    : routes_(routes), backend_(backend), summarizer_(summarizer) {}

AskResult Orchestrator::ask(const std::string& question) {
    AskResult result;

    const MatchOutcome match = routes_.match(question);
    if (!match.matched()) {
        spdlog::info("No route matched question: {}", question);
        result.error_code = AskErrorCode::kNoRouteMatch;
        result.error_message = "No deterministic route matched this question";
        result.recognized_questions = routes_.recognizedQuestions();
        return result;
    }
    const Route& route = *match.route;
    result.route_id = route.id;
    spdlog::info("Question routed to {}", route.id);

    ToolOutcome tool = backend_.invoke(route, question);
    if (!tool.success) {
        result.error_code = AskErrorCode::kToolInvocation;
        result.error_message = "Tool call failed: " + tool.error.detail;
        result.tool_error = std::move(tool.error);
        return result;
    }

    AskResponse response;
    response.question = question;
    response.route_id = route.id;
    response.tool_result = std::move(tool.result);

    SummaryResult summary = summarizer_.summarize(response.tool_result);
    if (summary.success) {
        response.summary = std::move(summary.text);
        response.summary_available = true;
    } else {
        spdlog::warn("Summary unavailable for {}: {}", route.id, summary.error_message);
        response.summary = kSummaryUnavailable;
        response.summary_available = false;
        response.summary_error = std::move(summary.error_message);
    }

    result.success = true;
    result.response = std::move(response);
    return result;
}

}  // namespace cqr
