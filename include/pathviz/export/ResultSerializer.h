#pragma once

#include "../search/SearchTypes.h"

#include <optional>
#include <string>

namespace pathviz {

/// Context stored next to a search result
struct ResultMeta {
    std::string graphName;
    std::optional<SearchAlgorithm> algorithm;
    std::optional<NodeKey> start;
    std::optional<NodeKey> goal;
};

/// Handles JSON serialization and file output for search results
///
/// NodeKeys are written as JSON integers, strings, or [row, col] arrays.
class ResultSerializer {
public:
    /// Serialize a result (and optional context) to a JSON string
    static std::string toJson(const SearchResult& result, const ResultMeta& meta = {});

    /// Parse a JSON string produced by toJson()
    /// @param meta If non-null, receives the stored context
    /// @throws std::runtime_error if parsing fails
    static SearchResult resultFromJson(const std::string& json, ResultMeta* meta = nullptr);

    /// Save a result to file
    /// @return true if save succeeded
    static bool saveToFile(const SearchResult& result, const ResultMeta& meta, const std::string& path);

    /// Load a result from file
    /// @throws std::runtime_error if the file cannot be read or parsed
    static SearchResult loadFromFile(const std::string& path, ResultMeta* meta = nullptr);
};

}  // namespace pathviz
