#pragma once

#include <pathviz/search/SearchTypes.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace pathviz {

/// Status line shown under the panel buttons after a search
inline std::string searchInfoLine(SearchAlgorithm algorithm, const SearchResult& result) {
    if (!result.found()) {
        return "No path found";
    }

    std::string name = algorithmName(algorithm);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return "Algorithm: " + name + "  |  Length: " + std::to_string(result.distance) +
           "  |  Visited: " + std::to_string(result.visitedCount);
}

}  // namespace pathviz
