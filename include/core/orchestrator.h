#pragma once

#include <string>

#include "backends/backend_client.h"
#include "core/ask_types.h"
#include "routing/route_table.h"
#include "summarizer/summarizer.h"

namespace cqr {

/// Answers one question: match, invoke, summarize, assemble. Holds no
/// request state, so a single instance serves concurrent callers as long as
/// the collaborators do.
class Orchestrator {
public:
    Orchestrator(const RouteTable& routes, BackendClient& backend, Summarizer& summarizer);

    /// Routing and backend failures fail the request. Summarization failures
    /// do not: the response keeps the raw tool output and carries
    /// kSummaryUnavailable as its summary.
    AskResult ask(const std::string& question);

    const RouteTable& routes() const { return routes_; }

private:
    const RouteTable& routes_;
    BackendClient& backend_;
    Summarizer& summarizer_;
};

}  // namespace cqr
