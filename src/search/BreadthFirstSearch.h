#pragma once

#include "pathviz/search/ISearchStrategy.h"

namespace pathviz {

/// FIFO frontier search. The first path found to the goal has the fewest
/// edges; ties between equal-length paths follow neighbor order.
class BreadthFirstSearch : public ISearchStrategy {
public:
    BreadthFirstSearch() = default;

    SearchResult search(const Graph& graph,
                        const NodeKey& start,
                        const NodeKey& goal) const override;

    SearchAlgorithm algorithm() const override { return SearchAlgorithm::BFS; }
    const char* algorithmName() const override { return "BFS"; }
};

}  // namespace pathviz
