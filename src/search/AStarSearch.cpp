#include "AStarSearch.h"
#include "PathReconstruction.h"
#include "pathviz/common/Logger.h"
#include "pathviz/search/PathSearch.h"

#include <functional>
#include <queue>
#include <unordered_map>

namespace pathviz {

double AStarSearch::heuristic(const std::optional<Point>& node,
                              const std::optional<Point>& goal) {
    if (!node || !goal) {
        return 0.0;
    }
    return node->distanceTo(*goal);
}

SearchResult AStarSearch::search(const Graph& graph,
                                 const NodeKey& start,
                                 const NodeKey& goal) const {
    validateEndpoints(graph, start, goal);

    const std::optional<Point> goalPos = graph.position(goal);
    if (!goalPos) {
        LOG_TRACE("goal {} has no position, heuristic disabled", toString(goal));
    }

    std::priority_queue<OpenEntry, std::vector<OpenEntry>, std::greater<OpenEntry>> openSet;
    std::unordered_map<NodeKey, double, NodeKeyHash> gScore;
    detail::CameFromMap cameFrom;
    std::vector<NodeKey> visitedOrder;

    openSet.push({0.0, start});
    gScore[start] = 0.0;
    cameFrom.emplace(start, std::nullopt);

    while (!openSet.empty()) {
        NodeKey current = openSet.top().node;
        openSet.pop();
        visitedOrder.push_back(current);

        if (current == goal) {
            auto result = detail::makeResult(detail::reconstructPath(cameFrom, start, goal),
                                             std::move(visitedOrder));
            detail::logSearchSummary(algorithmName(), start, goal, result);
            return result;
        }

        const double currentG = gScore.at(current);
        LOG_TRACE("expand {} (g={})", toString(current), currentG);

        for (const auto& neighbor : graph.neighbors(current)) {
            double tentativeG = currentG + EDGE_COST;

            auto it = gScore.find(neighbor);
            if (it == gScore.end() || tentativeG < it->second) {
                cameFrom[neighbor] = current;
                gScore[neighbor] = tentativeG;
                double h = heuristic(graph.position(neighbor), goalPos);
                openSet.push({tentativeG + h, neighbor});
            }
        }
    }

    // Frontier exhausted without reaching goal
    auto result = detail::makeResult({}, std::move(visitedOrder));
    detail::logSearchSummary(algorithmName(), start, goal, result);
    return result;
}

}  // namespace pathviz
