#pragma once

#include "pathviz/search/ISearchStrategy.h"

namespace pathviz {

/// LIFO frontier search.
///
/// Nodes are marked when pushed, and neighbors are pushed in adjacency
/// order, so they are explored last-neighbor-first. The path returned is
/// the one the traversal reaches first, with no length guarantee.
class DepthFirstSearch : public ISearchStrategy {
public:
    DepthFirstSearch() = default;

    SearchResult search(const Graph& graph,
                        const NodeKey& start,
                        const NodeKey& goal) const override;

    SearchAlgorithm algorithm() const override { return SearchAlgorithm::DFS; }
    const char* algorithmName() const override { return "DFS"; }
};

}  // namespace pathviz
