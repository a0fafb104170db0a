#pragma once

#include <string>
#include <vector>

namespace cqr {

/// Monitoring backends a route can target. Closed set: every switch over it
/// is expected to be exhaustive.
enum class Backend {
    kLogs,     // Loki MCP server
    kMetrics,  // Prometheus MCP server
};

/// MCP server name used in route ids and responses ("loki" / "prometheus").
inline const char* to_string(Backend backend) {
    switch (backend) {
        case Backend::kLogs:
            return "loki";
        case Backend::kMetrics:
            return "prometheus";
    }
    return "unknown";
}

/// Which arguments are substituted from the question into the tool call.
enum class QueryTemplate {
    kNone,                  // {}
    kTimeWindow,            // {namespace, hours}
    kTimeWindowWithPod,     // {namespace, hours, pod_name}
    kTimeWindowWithSearch,  // {namespace, hours, query}
};

/// Question text prepared once for all route predicates.
struct NormalizedQuestion {
    std::string raw;   // as received
    std::string text;  // see normalize_question()
};

using MatchPredicate = bool (*)(const NormalizedQuestion& question);

struct Route {
    std::string id;        // "<server>.<tool>"
    Backend backend{Backend::kLogs};
    std::string tool;      // MCP tool name
    QueryTemplate query{QueryTemplate::kNone};
    MatchPredicate matches{nullptr};
    std::string example;   // recognized question form shown to callers
};

/// Result of RouteTable::match. route is null on NoMatch and otherwise points
/// into the table, which outlives every request.
struct MatchOutcome {
    const Route* route{nullptr};

    bool matched() const { return route != nullptr; }
};

}  // namespace cqr
