#include "routing/route_table.h"

#include <utility>

#include "routing/question_parser.h"

namespace cqr {

namespace {

bool asks_metrics_health(const NormalizedQuestion& q) {
    return mentions_any(q.text, {"prometheus", "metrics"}) &&
           mentions_any(q.text, {"health", "healthy", "up"});
}

bool asks_namespaces(const NormalizedQuestion& q) {
    return mentions_any(q.text, {"namespaces"});
}

bool asks_restarts(const NormalizedQuestion& q) {
    return mentions_any(q.text, {"restart", "restarts", "crash", "crashing", "crashloop", "oomkilled"});
}

bool names_pod(const NormalizedQuestion& q) {
    return !extract_pod_name(q.text).empty();
}

bool has_search_phrase(const NormalizedQuestion& q) {
    return !extract_search_query(q.raw).empty();
}

bool asks_errors(const NormalizedQuestion& q) {
    return mentions_any(q.text, {"error", "errors", "exception", "exceptions", "panic", "fatal"});
}

std::vector<Route> builtin_routes() {
    return {
        {"prometheus.health_check", Backend::kMetrics, "health_check",
         QueryTemplate::kNone, &asks_metrics_health,
         "Is Prometheus healthy?"},
        {"loki.list_namespaces", Backend::kLogs, "list_namespaces",
         QueryTemplate::kNone, &asks_namespaces,
         "Which namespaces have logs?"},
        {"loki.find_pod_restarts", Backend::kLogs, "find_pod_restarts",
         QueryTemplate::kTimeWindow, &asks_restarts,
         "Which pods restarted in the last 6 hours?"},
        {"loki.get_pod_logs", Backend::kLogs, "get_pod_logs",
         QueryTemplate::kTimeWindowWithPod, &names_pod,
         "Show logs from the api-gateway pod in the prod namespace"},
        {"loki.search_logs", Backend::kLogs, "search_logs",
         QueryTemplate::kTimeWindowWithSearch, &has_search_phrase,
         "Search for \"connection refused\" in the last 2 hours"},
        {"loki.get_error_summary", Backend::kLogs, "get_error_summary",
         QueryTemplate::kTimeWindow, &asks_errors,
         "What errors are happening in my cluster right now?"},
    };
}

}  // namespace

RouteTable::RouteTable(std::vector<Route> routes) : routes_(std::move(routes)) {}

const RouteTable& RouteTable::defaults() {
    static const RouteTable table(builtin_routes());
    return table;
}

MatchOutcome RouteTable::match(const std::string& question) const {
    if (question.size() > kMaxQuestionLength) {
        return MatchOutcome{};
    }
    const NormalizedQuestion normalized = make_normalized_question(question);
    for (const auto& route : routes_) {
        if (route.matches && route.matches(normalized)) {
            return MatchOutcome{&route};
        }
    }
    return MatchOutcome{};
}

const Route* RouteTable::find(const std::string& route_id) const {
    for (const auto& route : routes_) {
        if (route.id == route_id) return &route;
    }
    return nullptr;
}

std::vector<std::string> RouteTable::recognizedQuestions() const {
    std::vector<std::string> out;
    out.reserve(routes_.size());
    for (const auto& route : routes_) {
        out.push_back(route.example);
    }
    return out;
}

}  // namespace cqr
