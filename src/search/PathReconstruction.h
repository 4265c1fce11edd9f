#pragma once

#include "pathviz/core/Types.h"
#include "pathviz/search/SearchTypes.h"

#include <optional>
#include <unordered_map>
#include <vector>

namespace pathviz {
namespace detail {

/// Discovering predecessor of each reached node; start maps to nullopt
using CameFromMap = std::unordered_map<NodeKey, std::optional<NodeKey>, NodeKeyHash>;

/// Walk came-from links back from goal and reverse.
/// Returns an empty path if goal was never reached or the chain does not
/// lead back to start.
std::vector<NodeKey> reconstructPath(const CameFromMap& cameFrom,
                                     const NodeKey& start,
                                     const NodeKey& goal);

/// Assemble a SearchResult from a reconstructed path and a trace
SearchResult makeResult(std::vector<NodeKey> path, std::vector<NodeKey> visitedOrder);

/// Emit the per-search debug summary
void logSearchSummary(const char* algorithm, const NodeKey& start, const NodeKey& goal,
                      const SearchResult& result);

}  // namespace detail
}  // namespace pathviz
