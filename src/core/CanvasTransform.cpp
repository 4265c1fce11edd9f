#include "pathviz/core/CanvasTransform.h"

#include <algorithm>

namespace pathviz {

std::optional<CanvasTransform> CanvasTransform::fit(const Graph& graph, double width,
                                                    double height, double padding) {
    const auto& positions = graph.positions();
    if (positions.empty()) {
        return std::nullopt;
    }

    auto it = positions.begin();
    double minX = it->second.x, maxX = it->second.x;
    double minY = it->second.y, maxY = it->second.y;
    for (const auto& [node, pos] : positions) {
        minX = std::min(minX, pos.x);
        maxX = std::max(maxX, pos.x);
        minY = std::min(minY, pos.y);
        maxY = std::max(maxY, pos.y);
    }

    // Degenerate spans (single node, collinear nodes) must not divide by zero
    constexpr double MIN_SPAN = 1e-6;
    double innerW = std::max(1.0, width - padding * 2.0);
    double innerH = std::max(1.0, height - padding * 2.0);
    double spanX = std::max(MIN_SPAN, maxX - minX);
    double spanY = std::max(MIN_SPAN, maxY - minY);

    CanvasTransform t;
    t.minX = minX;
    t.minY = minY;
    t.padding = padding;
    t.width = width;
    t.height = height;
    t.scale = std::min(innerW / spanX, innerH / spanY);
    return t;
}

}  // namespace pathviz
