#pragma once

/// @file pathviz.h
/// @brief Main header for the PathViz graph search library
///
/// PathViz runs breadth-first, depth-first and A* searches over small
/// graphs and records the full visitation trace so it can be replayed,
/// rendered or serialized.
///
/// Example usage:
/// @code
/// #include <pathviz/pathviz.h>
///
/// auto catalog = pathviz::GraphCatalog::withBuiltinGraphs();
/// const auto& graph = catalog.get("CampusMap");
/// auto result = pathviz::search(pathviz::SearchAlgorithm::AStar, graph,
///                               pathviz::nodeKey("Gate"), pathviz::nodeKey("Hostel"));
///
/// pathviz::SearchPlayback playback(result);
/// while (playback.stepPath()) {}
///
/// pathviz::SvgExport svg;
/// svg.exportToFile(graph, playback.frame(), "campus.svg");
/// @endcode

// Core module - Graph data structures
#include "core/Types.h"
#include "core/Graph.h"
#include "core/NodeParser.h"
#include "core/CanvasTransform.h"

// Search module - BFS, DFS, A*
#include "search/SearchTypes.h"
#include "search/ISearchStrategy.h"
#include "search/PathSearch.h"

// Catalog module - Named builtin graphs
#include "catalog/BuiltinGraphs.h"
#include "catalog/GraphCatalog.h"

// Playback module - Step and timer pacing of results
#include "playback/PlaybackOptions.h"
#include "playback/SearchPlayback.h"

// Export module - Output formats
#include "export/IExporter.h"
#include "export/SvgExport.h"
#include "export/ResultSerializer.h"

#include <string>

namespace pathviz {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace pathviz
