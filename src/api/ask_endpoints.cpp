#include "api/ask_endpoints.h"

#include <spdlog/spdlog.h>
#include "routing/question_parser.h"
#include "runtime/state.h"

namespace cqr {

using json = nlohmann::json;

AskEndpoints::AskEndpoints(Orchestrator& orchestrator, metrics::PrometheusExporter& exporter)
    : orchestrator_(orchestrator), exporter_(exporter) {}

void AskEndpoints::registerRoutes(httplib::Server& server) {
    server.Post("/ask", [this](const httplib::Request& req, httplib::Response& res) {
        handleAsk(req, res);
    });

    server.Get("/routes", [this](const httplib::Request&, httplib::Response& res) {
        json body;
        body["routes"] = json::array();
        for (const auto& route : orchestrator_.routes().routes()) {
            body["routes"].push_back({
                {"id", route.id},
                {"server", to_string(route.backend)},
                {"tool", route.tool},
                {"example", route.example}
            });
        }
        setJson(res, body);
    });
}

void AskEndpoints::handleAsk(const httplib::Request& req, httplib::Response& res) {
    auto body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        respondError(res, 400, "invalid_request", "request body must be a JSON object");
        return;
    }
    if (!body.contains("question") || !body["question"].is_string()) {
        respondError(res, 400, "invalid_request", "question is required");
        return;
    }
    const std::string question = body["question"].get<std::string>();
    if (question.empty()) {
        respondError(res, 400, "invalid_request", "question must not be empty");
        return;
    }
    if (question.size() > kMaxQuestionLength) {
        respondError(res, 400, "invalid_request",
                     "question exceeds " + std::to_string(kMaxQuestionLength) + " bytes");
        return;
    }

    AskGuard guard;
    AskResult result = orchestrator_.ask(question);

    if (result.success) {
        const AskResponse& response = *result.response;
        countAsk("answered");
        if (!response.summary_available) {
            exporter_.inc_counter("cluster_query_router_summary_failures_total", 1.0,
                                  "Answers returned without a model summary");
        }
        setJson(res, to_json(response));
        return;
    }

    switch (result.error_code) {
        case AskErrorCode::kNoRouteMatch:
            countAsk("no_route_match");
            respondError(res, 400, "no_route_match", result.error_message,
                         {{"recognized_questions", result.recognized_questions}});
            return;
        case AskErrorCode::kToolInvocation: {
            countAsk("tool_invocation_failed");
            json extra = {{"route", result.route_id}};
            if (result.tool_error) {
                extra["backend"] = to_string(result.tool_error->backend);
                extra["tool"] = result.tool_error->tool;
                extra["detail"] = result.tool_error->detail;
            }
            respondError(res, 502, "tool_invocation_failed", result.error_message, extra);
            return;
        }
        case AskErrorCode::kOk:
            break;
    }
    spdlog::error("Ask failed without an error code for question: {}", question);
    respondError(res, 500, "internal_error", "ask failed without an error code");
}

void AskEndpoints::countAsk(const char* outcome) {
    exporter_.inc_counter("cluster_query_router_asks_total", 1.0,
                          "Questions handled by outcome", {{"outcome", outcome}});
}

void AskEndpoints::setJson(httplib::Response& res, const nlohmann::json& body) {
    res.set_content(body.dump(), "application/json");
}

void AskEndpoints::respondError(httplib::Response& res, int status, const std::string& code,
                                const std::string& message, nlohmann::json extra) {
    res.status = status;
    std::string type = "invalid_request_error";
    if (status == 502) {
        type = "backend_error";
    } else if (status >= 500) {
        type = "internal_error";
    }
    json error = {{"message", message}, {"type", type}, {"code", code}};
    for (auto it = extra.begin(); it != extra.end(); ++it) {
        error[it.key()] = it.value();
    }
    setJson(res, {{"error", error}});
}

}  // namespace cqr
