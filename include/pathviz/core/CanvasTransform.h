#pragma once

#include "Graph.h"

#include <optional>

namespace pathviz {

/// Maps graph-space positions onto a canvas of fixed size.
///
/// The bounding box of all node positions is scaled uniformly into the
/// canvas minus padding, and y is flipped so larger graph y is drawn higher.
/// Shared by the SVG exporter and the interactive viewer.
struct CanvasTransform {
    double minX = 0.0;
    double minY = 0.0;
    double padding = 40.0;
    double width = 600.0;
    double height = 600.0;
    double scale = 1.0;

    /// Fit graph positions into a width x height canvas
    /// @return std::nullopt if the graph has no positions
    static std::optional<CanvasTransform> fit(const Graph& graph, double width, double height,
                                              double padding);

    Point toCanvas(const Point& world) const {
        double x = padding + (world.x - minX) * scale;
        double y = padding + (world.y - minY) * scale;
        return {x, height - y};
    }
};

}  // namespace pathviz
