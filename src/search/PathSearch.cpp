#include "pathviz/search/PathSearch.h"
#include "AStarSearch.h"
#include "BreadthFirstSearch.h"
#include "DepthFirstSearch.h"

namespace pathviz {

std::unique_ptr<ISearchStrategy> createSearchStrategy(SearchAlgorithm algorithm) {
    switch (algorithm) {
        case SearchAlgorithm::BFS: return std::make_unique<BreadthFirstSearch>();
        case SearchAlgorithm::DFS: return std::make_unique<DepthFirstSearch>();
        case SearchAlgorithm::AStar: return std::make_unique<AStarSearch>();
    }
    return std::make_unique<BreadthFirstSearch>();
}

void validateEndpoints(const Graph& graph, const NodeKey& start, const NodeKey& goal) {
    if (!graph.hasNode(start)) {
        throw InvalidNodeError(InvalidNodeError::Endpoint::Start, start);
    }
    if (!graph.hasNode(goal)) {
        throw InvalidNodeError(InvalidNodeError::Endpoint::Goal, goal);
    }
}

SearchResult search(SearchAlgorithm algorithm, const Graph& graph,
                    const NodeKey& start, const NodeKey& goal) {
    switch (algorithm) {
        case SearchAlgorithm::BFS: return BreadthFirstSearch{}.search(graph, start, goal);
        case SearchAlgorithm::DFS: return DepthFirstSearch{}.search(graph, start, goal);
        case SearchAlgorithm::AStar: return AStarSearch{}.search(graph, start, goal);
    }
    return BreadthFirstSearch{}.search(graph, start, goal);
}

SearchResult bfs(const Graph& graph, const NodeKey& start, const NodeKey& goal) {
    return BreadthFirstSearch{}.search(graph, start, goal);
}

SearchResult dfs(const Graph& graph, const NodeKey& start, const NodeKey& goal) {
    return DepthFirstSearch{}.search(graph, start, goal);
}

SearchResult astar(const Graph& graph, const NodeKey& start, const NodeKey& goal) {
    return AStarSearch{}.search(graph, start, goal);
}

}  // namespace pathviz
