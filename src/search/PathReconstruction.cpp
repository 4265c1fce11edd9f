#include "PathReconstruction.h"
#include "pathviz/common/Logger.h"

#include <algorithm>

namespace pathviz {
namespace detail {

std::vector<NodeKey> reconstructPath(const CameFromMap& cameFrom,
                                     const NodeKey& start,
                                     const NodeKey& goal) {
    std::vector<NodeKey> path;
    if (cameFrom.find(goal) == cameFrom.end()) {
        return path;
    }

    std::optional<NodeKey> current = goal;
    while (current) {
        // Each node appears once in a valid chain
        if (path.size() > cameFrom.size()) {
            return {};
        }
        path.push_back(*current);
        auto it = cameFrom.find(*current);
        if (it == cameFrom.end()) {
            return {};
        }
        current = it->second;
    }

    std::reverse(path.begin(), path.end());
    if (path.empty() || path.front() != start) {
        return {};
    }
    return path;
}

SearchResult makeResult(std::vector<NodeKey> path, std::vector<NodeKey> visitedOrder) {
    SearchResult result;
    result.distance = path.empty() ? 0 : static_cast<int>(path.size()) - 1;
    result.path = std::move(path);
    result.visitedCount = static_cast<int>(visitedOrder.size());
    result.visitedOrder = std::move(visitedOrder);
    return result;
}

void logSearchSummary(const char* algorithm, const NodeKey& start, const NodeKey& goal,
                      const SearchResult& result) {
    if (result.found()) {
        LOG_DEBUG("{} {} -> {}: distance {}, visited {}",
                  algorithm, toString(start), toString(goal),
                  result.distance, result.visitedCount);
    } else {
        LOG_DEBUG("{} {} -> {}: no path, visited {}",
                  algorithm, toString(start), toString(goal), result.visitedCount);
    }
}

}  // namespace detail
}  // namespace pathviz
