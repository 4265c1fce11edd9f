#pragma once

#include "ISearchStrategy.h"
#include "SearchTypes.h"
#include "../core/Graph.h"

namespace pathviz {

/// Single entry point used by presentation code.
///
/// A* reads node positions from the graph; nodes without a position
/// contribute a zero heuristic.
///
/// @throws InvalidNodeError if start or goal is not in graph
SearchResult search(SearchAlgorithm algorithm, const Graph& graph,
                    const NodeKey& start, const NodeKey& goal);

/// Breadth-first search: minimum edge count
SearchResult bfs(const Graph& graph, const NodeKey& start, const NodeKey& goal);

/// Depth-first search: some valid path, not necessarily shortest
SearchResult dfs(const Graph& graph, const NodeKey& start, const NodeKey& goal);

/// A* with unit edge costs and Euclidean heuristic
SearchResult astar(const Graph& graph, const NodeKey& start, const NodeKey& goal);

/// Throw InvalidNodeError unless both endpoints are nodes of graph
void validateEndpoints(const Graph& graph, const NodeKey& start, const NodeKey& goal);

}  // namespace pathviz
