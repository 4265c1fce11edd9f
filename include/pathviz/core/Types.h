#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace pathviz {

/// 2D position of a node in graph space
struct Point {
    double x = 0.0;
    double y = 0.0;

    constexpr Point() = default;
    constexpr Point(double x_, double y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(double s) const { return {x * s, y * s}; }

    double length() const { return std::sqrt(x * x + y * y); }
    double distanceTo(const Point& o) const { return (*this - o).length(); }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Integer (row, col) identifier used by grid graphs
struct GridCell {
    int row = 0;
    int col = 0;

    constexpr GridCell() = default;
    constexpr GridCell(int r, int c) : row(r), col(c) {}

    constexpr bool operator==(const GridCell& o) const { return row == o.row && col == o.col; }
    constexpr bool operator!=(const GridCell& o) const { return !(*this == o); }
    constexpr bool operator<(const GridCell& o) const {
        return row < o.row || (row == o.row && col < o.col);
    }
};

/// Opaque node identifier: integer, name, or grid cell.
///
/// Keys of different alternatives never compare equal; ordering sorts by
/// alternative first, then by value.
using NodeKey = std::variant<std::int64_t, std::string, GridCell>;

struct NodeKeyHash {
    std::size_t operator()(const NodeKey& key) const;
};

/// Human-readable form: 7, Gate, (2, 3)
std::string toString(const NodeKey& key);

/// Convenience constructors
inline NodeKey nodeKey(int value) { return NodeKey{static_cast<std::int64_t>(value)}; }
inline NodeKey nodeKey(std::int64_t value) { return NodeKey{value}; }
inline NodeKey nodeKey(const char* name) { return NodeKey{std::string(name)}; }
inline NodeKey nodeKey(std::string name) { return NodeKey{std::move(name)}; }
inline NodeKey nodeKey(int row, int col) { return NodeKey{GridCell{row, col}}; }

}  // namespace pathviz
