#include "pathviz/core/Graph.h"

#include <algorithm>

namespace pathviz {

bool Graph::addNode(const NodeKey& node) {
    auto [it, inserted] = adjacency_.try_emplace(node);
    if (inserted) {
        order_.push_back(node);
    }
    return inserted;
}

bool Graph::addNode(const NodeKey& node, Point position) {
    bool inserted = addNode(node);
    positions_[node] = position;
    return inserted;
}

void Graph::setPosition(const NodeKey& node, Point position) {
    addNode(node);
    positions_[node] = position;
}

bool Graph::hasNode(const NodeKey& node) const {
    return adjacency_.find(node) != adjacency_.end();
}

void Graph::addEdge(const NodeKey& from, const NodeKey& to) {
    addNode(from);
    addNode(to);
    adjacency_[from].push_back(to);
    ++edgeCount_;
}

void Graph::addUndirectedEdge(const NodeKey& a, const NodeKey& b) {
    addEdge(a, b);
    addEdge(b, a);
}

bool Graph::removeEdge(const NodeKey& from, const NodeKey& to) {
    auto it = adjacency_.find(from);
    if (it == adjacency_.end()) return false;

    auto& list = it->second;
    auto pos = std::find(list.begin(), list.end(), to);
    if (pos == list.end()) return false;

    list.erase(pos);
    --edgeCount_;
    return true;
}

bool Graph::removeUndirectedEdge(const NodeKey& a, const NodeKey& b) {
    bool forward = removeEdge(a, b);
    bool backward = removeEdge(b, a);
    return forward || backward;
}

bool Graph::hasEdge(const NodeKey& from, const NodeKey& to) const {
    auto it = adjacency_.find(from);
    if (it == adjacency_.end()) return false;
    return std::find(it->second.begin(), it->second.end(), to) != it->second.end();
}

const Graph::NeighborList& Graph::neighbors(const NodeKey& node) const {
    auto it = adjacency_.find(node);
    if (it == adjacency_.end()) {
        throw std::out_of_range("Unknown node: " + toString(node));
    }
    return it->second;
}

std::optional<Point> Graph::position(const NodeKey& node) const {
    auto it = positions_.find(node);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace pathviz
