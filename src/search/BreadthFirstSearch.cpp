#include "BreadthFirstSearch.h"
#include "PathReconstruction.h"
#include "pathviz/common/Logger.h"
#include "pathviz/search/PathSearch.h"

#include <queue>

namespace pathviz {

SearchResult BreadthFirstSearch::search(const Graph& graph,
                                        const NodeKey& start,
                                        const NodeKey& goal) const {
    validateEndpoints(graph, start, goal);

    std::queue<NodeKey> frontier;
    detail::CameFromMap cameFrom;
    std::vector<NodeKey> visitedOrder;

    frontier.push(start);
    cameFrom.emplace(start, std::nullopt);

    while (!frontier.empty()) {
        NodeKey current = frontier.front();
        frontier.pop();
        visitedOrder.push_back(current);

        // Stop on dequeue, not on discovery
        if (current == goal) {
            break;
        }

        LOG_TRACE("expand {}", toString(current));
        for (const auto& neighbor : graph.neighbors(current)) {
            if (cameFrom.find(neighbor) == cameFrom.end()) {
                cameFrom.emplace(neighbor, current);
                frontier.push(neighbor);
            }
        }
    }

    auto result = detail::makeResult(detail::reconstructPath(cameFrom, start, goal),
                                     std::move(visitedOrder));
    detail::logSearchSummary(algorithmName(), start, goal, result);
    return result;
}

}  // namespace pathviz
