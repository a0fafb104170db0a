#pragma once

namespace cqr {

/// Request-level outcome of Orchestrator::ask. Summarization failures are not
/// listed: they never fail a request.
enum class AskErrorCode : int {
    kOk = 0,
    kNoRouteMatch = 1,
    kToolInvocation = 2,
};

inline const char* to_string(AskErrorCode code) {
    switch (code) {
        case AskErrorCode::kOk:
            return "OK";
        case AskErrorCode::kNoRouteMatch:
            return "NO_ROUTE_MATCH";
        case AskErrorCode::kToolInvocation:
            return "TOOL_INVOCATION_FAILED";
    }
    return "UNKNOWN";
}

}  // namespace cqr
