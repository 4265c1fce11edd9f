#pragma once

#include "SearchTypes.h"
#include "../core/Graph.h"

#include <memory>

namespace pathviz {

/// Abstract interface for search strategies
///
/// Implementations keep no state between calls: all frontier and
/// bookkeeping data lives inside search(), so one strategy object may be
/// shared by concurrent callers searching immutable graphs.
class ISearchStrategy {
public:
    virtual ~ISearchStrategy() = default;

    /// Find a path from start to goal
    /// @param graph Graph to search (borrowed for the duration of the call)
    /// @param start Start node, must be in graph
    /// @param goal Goal node, must be in graph
    /// @return Path, distance and visitation trace
    /// @throws InvalidNodeError if start or goal is not in graph
    virtual SearchResult search(const Graph& graph,
                                const NodeKey& start,
                                const NodeKey& goal) const = 0;

    virtual SearchAlgorithm algorithm() const = 0;

    /// Get algorithm name for logging
    virtual const char* algorithmName() const = 0;
};

/// Create the strategy implementing an algorithm
std::unique_ptr<ISearchStrategy> createSearchStrategy(SearchAlgorithm algorithm);

}  // namespace pathviz
