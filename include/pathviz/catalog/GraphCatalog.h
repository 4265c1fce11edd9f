#pragma once

#include "../core/Graph.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pathviz {

/// Named collection of immutable graphs
///
/// Built once at startup and passed to whatever presents the graphs; there
/// is no process-wide instance. Graphs are handed out as shared_ptr<const>
/// so any number of searches may read them concurrently.
///
/// Usage:
/// @code
/// auto catalog = GraphCatalog::withBuiltinGraphs();
/// const Graph& grid = catalog.get("UrbanGrid-6x6");
/// auto result = pathviz::bfs(grid, nodeKey(0, 0), nodeKey(5, 5));
/// @endcode
class GraphCatalog {
public:
    GraphCatalog() = default;

    /// Catalog holding UrbanGrid-6x6, Ladder-10, BinaryTree-15, HexRing-12
    /// and CampusMap, in that order
    static GraphCatalog withBuiltinGraphs();

    /// Register a graph under a name
    /// @throws std::invalid_argument if the name is empty or already taken
    void add(const std::string& name, Graph graph);

    bool contains(const std::string& name) const;

    /// @return The graph, or nullptr if no graph has that name
    std::shared_ptr<const Graph> find(const std::string& name) const;

    /// @throws std::out_of_range if no graph has that name
    const Graph& get(const std::string& name) const;

    /// Names in registration order
    const std::vector<std::string>& names() const { return names_; }

    size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, std::shared_ptr<const Graph>> graphs_;
};

}  // namespace pathviz
