#pragma once

#include <string>
#include <vector>

#include "routing/route.h"

namespace cqr {

/// Ordered, immutable set of routes. The first route whose predicate accepts
/// the normalized question wins, so the order of the vector is part of the
/// configuration.
class RouteTable {
public:
    explicit RouteTable(std::vector<Route> routes);

    /// Built-in cluster-ops routes, in evaluation order.
    static const RouteTable& defaults();

    /// Pure function of the question and the table. Never throws. Questions
    /// longer than kMaxQuestionLength are NoMatch.
    MatchOutcome match(const std::string& question) const;

    const Route* find(const std::string& route_id) const;

    const std::vector<Route>& routes() const { return routes_; }

    /// One example question per route, in evaluation order.
    std::vector<std::string> recognizedQuestions() const;

private:
    std::vector<Route> routes_;
};

}  // namespace cqr
