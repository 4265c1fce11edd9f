#include "pathviz/search/SearchTypes.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace pathviz {

const char* algorithmName(SearchAlgorithm algorithm) {
    switch (algorithm) {
        case SearchAlgorithm::BFS: return "bfs";
        case SearchAlgorithm::DFS: return "dfs";
        case SearchAlgorithm::AStar: return "astar";
    }
    return "bfs";
}

std::optional<SearchAlgorithm> parseAlgorithm(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (SearchAlgorithm algorithm : ALL_ALGORITHMS) {
        if (lower == algorithmName(algorithm)) {
            return algorithm;
        }
    }
    return std::nullopt;
}

InvalidNodeError::InvalidNodeError(Endpoint endpoint, const NodeKey& node)
    : std::invalid_argument(std::string(endpoint == Endpoint::Start ? "Start" : "Goal") +
                            " node " + toString(node) + " not in graph")
    , endpoint_(endpoint)
    , node_(node) {}

}  // namespace pathviz
