#pragma once

#include "Types.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace pathviz {

/// Adjacency relation plus optional node positions.
///
/// Node insertion order is preserved by nodes(), and every neighbor list
/// keeps the order its edges were added in. Search strategies depend on
/// both orders for reproducible traces.
///
/// Graphs are built once and then shared read-only (see GraphCatalog);
/// nothing in the search layer mutates them.
class Graph {
public:
    using NeighborList = std::vector<NodeKey>;
    using AdjacencyMap = std::unordered_map<NodeKey, NeighborList, NodeKeyHash>;
    using PositionMap = std::unordered_map<NodeKey, Point, NodeKeyHash>;

    Graph() = default;

    // Node operations
    /// @return true if the node was not present before
    bool addNode(const NodeKey& node);
    bool addNode(const NodeKey& node, Point position);

    /// Set (or replace) the position of a node, adding the node if needed
    void setPosition(const NodeKey& node, Point position);

    bool hasNode(const NodeKey& node) const;

    // Edge operations
    // Missing endpoints are added as nodes.
    void addEdge(const NodeKey& from, const NodeKey& to);
    void addUndirectedEdge(const NodeKey& a, const NodeKey& b);

    /// Remove the first from->to entry
    /// @return true if an entry was removed
    bool removeEdge(const NodeKey& from, const NodeKey& to);

    /// Remove a->b and b->a (first occurrence each)
    /// @return true if either direction was removed
    bool removeUndirectedEdge(const NodeKey& a, const NodeKey& b);

    bool hasEdge(const NodeKey& from, const NodeKey& to) const;

    // Queries
    /// Ordered neighbor sequence of a node.
    /// Throws std::out_of_range if the node is not in the graph.
    const NeighborList& neighbors(const NodeKey& node) const;

    /// Position of a node, std::nullopt if the node has none
    std::optional<Point> position(const NodeKey& node) const;

    /// Nodes in insertion order
    const std::vector<NodeKey>& nodes() const { return order_; }

    const AdjacencyMap& adjacency() const { return adjacency_; }
    const PositionMap& positions() const { return positions_; }

    size_t nodeCount() const { return order_.size(); }

    /// Number of directed adjacency entries (an undirected edge counts twice)
    size_t edgeCount() const { return edgeCount_; }

private:
    std::vector<NodeKey> order_;
    AdjacencyMap adjacency_;
    PositionMap positions_;
    size_t edgeCount_ = 0;
};

}  // namespace pathviz
