#include "pathviz/catalog/GraphCatalog.h"
#include "pathviz/catalog/BuiltinGraphs.h"
#include "pathviz/common/Logger.h"

#include <stdexcept>

namespace pathviz {

GraphCatalog GraphCatalog::withBuiltinGraphs() {
    GraphCatalog catalog;
    catalog.add("UrbanGrid-6x6", builtin::urbanGrid6x6());
    catalog.add("Ladder-10", builtin::ladder10());
    catalog.add("BinaryTree-15", builtin::binaryTree15());
    catalog.add("HexRing-12", builtin::hexRing12());
    catalog.add("CampusMap", builtin::campusMap());
    return catalog;
}

void GraphCatalog::add(const std::string& name, Graph graph) {
    if (name.empty()) {
        throw std::invalid_argument("Graph name must not be empty");
    }
    if (graphs_.find(name) != graphs_.end()) {
        throw std::invalid_argument("Graph '" + name + "' already registered");
    }

    LOG_DEBUG("registered '{}' ({} nodes, {} adjacency entries)",
              name, graph.nodeCount(), graph.edgeCount());

    graphs_.emplace(name, std::make_shared<const Graph>(std::move(graph)));
    names_.push_back(name);
}

bool GraphCatalog::contains(const std::string& name) const {
    return graphs_.find(name) != graphs_.end();
}

std::shared_ptr<const Graph> GraphCatalog::find(const std::string& name) const {
    auto it = graphs_.find(name);
    if (it == graphs_.end()) {
        return nullptr;
    }
    return it->second;
}

const Graph& GraphCatalog::get(const std::string& name) const {
    auto it = graphs_.find(name);
    if (it == graphs_.end()) {
        throw std::out_of_range("Unknown graph: " + name);
    }
    return *it->second;
}

}  // namespace pathviz
