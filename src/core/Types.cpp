#include "pathviz/core/Types.h"

#include <type_traits>

namespace pathviz {

namespace {

inline std::size_t combine(std::size_t seed, std::size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

}  // namespace

std::size_t NodeKeyHash::operator()(const NodeKey& key) const {
    std::size_t seed = key.index();
    return std::visit([seed](const auto& value) -> std::size_t {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, GridCell>) {
            std::size_t h = combine(seed, std::hash<int>()(value.row));
            return combine(h, std::hash<int>()(value.col));
        } else {
            return combine(seed, std::hash<T>()(value));
        }
    }, key);
}

std::string toString(const NodeKey& key) {
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(value);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return value;
        } else {
            return "(" + std::to_string(value.row) + ", " + std::to_string(value.col) + ")";
        }
    }, key);
}

}  // namespace pathviz
