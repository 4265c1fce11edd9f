#include "pathviz/catalog/BuiltinGraphs.h"

#include <array>
#include <cmath>
#include <numbers>
#include <string>
#include <utility>

namespace pathviz {
namespace builtin {

// Node order of each graph follows the order edges are inserted, so edges
// are added before positions throughout this file.

Graph urbanGrid6x6() {
    constexpr int SIZE = 6;
    Graph graph;

    for (int r = 0; r < SIZE; ++r) {
        for (int c = 0; c < SIZE; ++c) {
            if (r + 1 < SIZE) {
                graph.addUndirectedEdge(nodeKey(r, c), nodeKey(r + 1, c));
            }
            if (c + 1 < SIZE) {
                graph.addUndirectedEdge(nodeKey(r, c), nodeKey(r, c + 1));
            }
        }
    }

    // Blocked streets
    graph.removeUndirectedEdge(nodeKey(1, 1), nodeKey(1, 2));
    graph.removeUndirectedEdge(nodeKey(2, 3), nodeKey(3, 3));

    // Diagonal shortcut
    graph.addUndirectedEdge(nodeKey(0, 0), nodeKey(2, 2));

    for (int r = 0; r < SIZE; ++r) {
        for (int c = 0; c < SIZE; ++c) {
            graph.setPosition(nodeKey(r, c), {static_cast<double>(c), static_cast<double>(r)});
        }
    }
    return graph;
}

Graph ladder10() {
    constexpr int RUNGS = 5;
    Graph graph;

    for (int i = 0; i < RUNGS; ++i) {
        std::string left = "L" + std::to_string(i);
        std::string right = "R" + std::to_string(i);
        if (i > 0) {
            graph.addUndirectedEdge(nodeKey("L" + std::to_string(i - 1)), nodeKey(left));
            graph.addUndirectedEdge(nodeKey("R" + std::to_string(i - 1)), nodeKey(right));
        }
        graph.addUndirectedEdge(nodeKey(left), nodeKey(right));
    }

    for (int i = 0; i < RUNGS; ++i) {
        graph.setPosition(nodeKey("L" + std::to_string(i)), {0.0, static_cast<double>(i)});
        graph.setPosition(nodeKey("R" + std::to_string(i)), {2.0, static_cast<double>(i)});
    }
    return graph;
}

Graph binaryTree15() {
    constexpr int COUNT = 15;
    Graph graph;

    for (int i = 1; i <= COUNT; ++i) {
        if (2 * i <= COUNT) {
            graph.addUndirectedEdge(nodeKey(i), nodeKey(2 * i));
        }
        if (2 * i + 1 <= COUNT) {
            graph.addUndirectedEdge(nodeKey(i), nodeKey(2 * i + 1));
        }
    }

    for (int i = 1; i <= COUNT; ++i) {
        int level = 0;
        while ((2 << level) <= i) {
            ++level;
        }
        int nodesInLevel = 1 << level;
        int indexInLevel = i - nodesInLevel;
        double x = static_cast<double>(indexInLevel + 1) / (nodesInLevel + 1) * 10.0;
        double y = level * 2.0;
        graph.setPosition(nodeKey(i), {x, -y});
    }
    return graph;
}

Graph hexRing12() {
    constexpr int SIDES = 6;
    constexpr double OUTER_RADIUS = 6.0;
    constexpr double INNER_RADIUS = 3.5;
    Graph graph;

    auto outer = [](int i) { return nodeKey("O" + std::to_string(i)); };
    auto inner = [](int i) { return nodeKey("I" + std::to_string(i)); };

    for (int i = 0; i < SIDES; ++i) {
        graph.addUndirectedEdge(outer(i), outer((i + 1) % SIDES));
        graph.addUndirectedEdge(inner(i), inner((i + 1) % SIDES));
    }
    // Spokes
    for (int i = 0; i < SIDES; ++i) {
        graph.addUndirectedEdge(outer(i), inner(i));
    }
    // Chords O0-I3 and O4-I1
    for (int i = 0; i < SIDES; i += 4) {
        graph.addUndirectedEdge(outer(i), inner((i + 3) % SIDES));
    }

    for (int i = 0; i < SIDES; ++i) {
        double outerAngle = 2.0 * std::numbers::pi * i / SIDES;
        double innerAngle = 2.0 * std::numbers::pi * (i + 0.5) / SIDES;
        graph.setPosition(outer(i), {std::cos(outerAngle) * OUTER_RADIUS,
                                     std::sin(outerAngle) * OUTER_RADIUS});
        graph.setPosition(inner(i), {std::cos(innerAngle) * INNER_RADIUS,
                                     std::sin(innerAngle) * INNER_RADIUS});
    }
    return graph;
}

Graph campusMap() {
    static const std::array<std::pair<const char*, const char*>, 11> PATHS = {{
        {"Gate", "Admin"}, {"Gate", "Parking"}, {"Admin", "Library"}, {"Admin", "Cafeteria"},
        {"Library", "Auditorium"}, {"Library", "LabA"}, {"Cafeteria", "LabB"}, {"LabA", "LabB"},
        {"LabB", "Sports"}, {"Auditorium", "Hostel"}, {"LabA", "Hostel"},
    }};
    static const std::array<std::pair<const char*, Point>, 10> PLACES = {{
        {"Gate", {-5.0, -1.0}},
        {"Parking", {-6.0, -3.0}},
        {"Admin", {-2.0, 0.0}},
        {"Library", {0.0, 2.5}},
        {"Cafeteria", {1.0, -1.5}},
        {"LabA", {3.0, 1.5}},
        {"LabB", {4.5, -0.5}},
        {"Sports", {6.0, -2.5}},
        {"Auditorium", {2.0, 3.5}},
        {"Hostel", {5.5, 2.5}},
    }};

    Graph graph;
    for (const auto& [a, b] : PATHS) {
        graph.addUndirectedEdge(nodeKey(a), nodeKey(b));
    }
    for (const auto& [name, pos] : PLACES) {
        graph.setPosition(nodeKey(name), pos);
    }
    return graph;
}

}  // namespace builtin
}  // namespace pathviz
