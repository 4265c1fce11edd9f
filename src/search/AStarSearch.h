#pragma once

#include "pathviz/search/ISearchStrategy.h"

#include <optional>

namespace pathviz {

/// A* over unit-cost edges with a straight-line heuristic.
///
/// Entries are never removed from the open set when a better route is
/// found; the outdated entry is popped later, counted as a visit, and its
/// neighbors fail the g-score improvement test. The goal is returned as
/// soon as it is popped.
///
/// Optimal only while the Euclidean distance between positions never
/// exceeds the remaining edge count.
class AStarSearch : public ISearchStrategy {
public:
    /// Cost of traversing one edge
    static constexpr double EDGE_COST = 1.0;

    AStarSearch() = default;

    SearchResult search(const Graph& graph,
                        const NodeKey& start,
                        const NodeKey& goal) const override;

    SearchAlgorithm algorithm() const override { return SearchAlgorithm::AStar; }
    const char* algorithmName() const override { return "A*"; }

    /// Straight-line distance, 0 if either position is unknown
    static double heuristic(const std::optional<Point>& node,
                            const std::optional<Point>& goal);

private:
    /// Open-set entry
    struct OpenEntry {
        double f = 0.0;
        NodeKey node;

        // Min-heap on f, equal f resolved by the smaller key
        bool operator>(const OpenEntry& other) const {
            if (f != other.f) return f > other.f;
            return other.node < node;
        }
    };
};

}  // namespace pathviz
