#include "pathviz/export/ResultSerializer.h"
#include "pathviz/common/Logger.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace pathviz {

using json = nlohmann::json;

namespace {

json nodeToJson(const NodeKey& node) {
    if (const auto* value = std::get_if<std::int64_t>(&node)) {
        return *value;
    }
    if (const auto* name = std::get_if<std::string>(&node)) {
        return *name;
    }
    const auto& cell = std::get<GridCell>(node);
    return json::array({cell.row, cell.col});
}

// Cell coordinates must fit GridCell's int fields
int cellCoordinate(const json& j) {
    constexpr auto lo = std::numeric_limits<int>::min();
    constexpr auto hi = std::numeric_limits<int>::max();

    if (j.is_number_unsigned()) {
        auto value = j.get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(hi)) {
            throw std::runtime_error("Cell coordinate out of range in result JSON: " + j.dump());
        }
        return static_cast<int>(value);
    }
    auto value = j.get<std::int64_t>();
    if (value < lo || value > hi) {
        throw std::runtime_error("Cell coordinate out of range in result JSON: " + j.dump());
    }
    return static_cast<int>(value);
}

NodeKey nodeFromJson(const json& j) {
    if (j.is_number_integer()) {
        return NodeKey{j.get<std::int64_t>()};
    }
    if (j.is_string()) {
        return NodeKey{j.get<std::string>()};
    }
    if (j.is_array() && j.size() == 2 && j[0].is_number_integer() && j[1].is_number_integer()) {
        return NodeKey{GridCell{cellCoordinate(j[0]), cellCoordinate(j[1])}};
    }
    throw std::runtime_error("Invalid node key in result JSON: " + j.dump());
}

json nodesToJson(const std::vector<NodeKey>& nodes) {
    json arr = json::array();
    for (const auto& node : nodes) {
        arr.push_back(nodeToJson(node));
    }
    return arr;
}

std::vector<NodeKey> nodesFromJson(const json& j) {
    std::vector<NodeKey> nodes;
    for (const auto& item : j) {
        nodes.push_back(nodeFromJson(item));
    }
    return nodes;
}

}  // namespace

std::string ResultSerializer::toJson(const SearchResult& result, const ResultMeta& meta) {
    json j;
    if (!meta.graphName.empty()) {
        j["graph"] = meta.graphName;
    }
    if (meta.algorithm) {
        j["algorithm"] = algorithmName(*meta.algorithm);
    }
    if (meta.start) {
        j["start"] = nodeToJson(*meta.start);
    }
    if (meta.goal) {
        j["goal"] = nodeToJson(*meta.goal);
    }

    j["found"] = result.found();
    j["distance"] = result.distance;
    j["visitedCount"] = result.visitedCount;
    j["path"] = nodesToJson(result.path);
    j["visitedOrder"] = nodesToJson(result.visitedOrder);

    return j.dump(2);
}

SearchResult ResultSerializer::resultFromJson(const std::string& jsonStr, ResultMeta* meta) {
    SearchResult result;

    try {
        json j = json::parse(jsonStr);

        if (j.contains("path")) {
            result.path = nodesFromJson(j["path"]);
        }
        if (j.contains("visitedOrder")) {
            result.visitedOrder = nodesFromJson(j["visitedOrder"]);
        }
        result.distance = j.value("distance", result.path.empty() ? 0
                                              : static_cast<int>(result.path.size()) - 1);
        result.visitedCount = j.value("visitedCount", static_cast<int>(result.visitedOrder.size()));

        if (meta) {
            *meta = ResultMeta{};
            meta->graphName = j.value("graph", std::string{});
            if (j.contains("algorithm")) {
                meta->algorithm = parseAlgorithm(j["algorithm"].get<std::string>());
                if (!meta->algorithm) {
                    throw std::runtime_error("Unknown algorithm in result JSON: " +
                                             j["algorithm"].get<std::string>());
                }
            }
            if (j.contains("start")) {
                meta->start = nodeFromJson(j["start"]);
            }
            if (j.contains("goal")) {
                meta->goal = nodeFromJson(j["goal"]);
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse SearchResult JSON: ") + e.what());
    }

    return result;
}

bool ResultSerializer::saveToFile(const SearchResult& result, const ResultMeta& meta,
                                  const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("cannot open {} for writing", path);
        return false;
    }
    file << toJson(result, meta);
    return file.good();
}

SearchResult ResultSerializer::loadFromFile(const std::string& path, ResultMeta* meta) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open result file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return resultFromJson(buffer.str(), meta);
}

}  // namespace pathviz
