#pragma once

#include "../core/Types.h"

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pathviz {

/// Available search strategies
enum class SearchAlgorithm {
    BFS,
    DFS,
    AStar
};

constexpr std::array<SearchAlgorithm, 3> ALL_ALGORITHMS = {
    SearchAlgorithm::BFS, SearchAlgorithm::DFS, SearchAlgorithm::AStar
};

/// Lowercase identifier: "bfs", "dfs", "astar"
const char* algorithmName(SearchAlgorithm algorithm);

/// Case-insensitive inverse of algorithmName()
std::optional<SearchAlgorithm> parseAlgorithm(std::string_view name);

/// Outcome of a single search call
struct SearchResult {
    std::vector<NodeKey> path;          ///< start..goal, empty if no path
    int distance = 0;                   ///< Edges along path (0 if empty or trivial)
    int visitedCount = 0;               ///< Nodes dequeued/popped
    std::vector<NodeKey> visitedOrder;  ///< Nodes in dequeue/pop order

    bool found() const { return !path.empty(); }
};

/// Thrown when start or goal is not a node of the searched graph
class InvalidNodeError : public std::invalid_argument {
public:
    enum class Endpoint { Start, Goal };

    InvalidNodeError(Endpoint endpoint, const NodeKey& node);

    Endpoint endpoint() const { return endpoint_; }
    const NodeKey& node() const { return node_; }

private:
    Endpoint endpoint_;
    NodeKey node_;
};

}  // namespace pathviz
