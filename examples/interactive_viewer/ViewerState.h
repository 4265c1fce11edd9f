#pragma once

#include <pathviz/pathviz.h>

#include <imgui.h>
#include <string>

namespace pathviz {

/// View transformation state (pan/zoom) on top of the fitted canvas
struct ViewTransform {
    ImVec2 screenOffset = {0, 0};  // Canvas origin in screen coordinates
    ImVec2 pan = {0, 0};
    float zoom = 1.0f;

    ImVec2 canvasToScreen(const Point& canvas) const {
        return {
            screenOffset.x + static_cast<float>(canvas.x) * zoom + pan.x,
            screenOffset.y + static_cast<float>(canvas.y) * zoom + pan.y
        };
    }

    /// Scale by factor keeping the screen point under the cursor fixed
    void zoomAt(const ImVec2& screen, float factor) {
        float localX = screen.x - screenOffset.x;
        float localY = screen.y - screenOffset.y;
        pan.x = localX - (localX - pan.x) * factor;
        pan.y = localY - (localY - pan.y) * factor;
        zoom *= factor;
    }

    void reset() {
        pan = {0, 0};
        zoom = 1.0f;
    }
};

/// Everything the viewer panel edits and the renderer reads
struct ViewerState {
    const GraphCatalog* catalog = nullptr;

    int graphIndex = 0;
    SearchAlgorithm algorithm = SearchAlgorithm::BFS;
    int startIndex = 0;
    int goalIndex = 0;

    int speedMs = PlaybackOptions::DEFAULT_INTERVAL_MS;
    bool darkMode = false;
    bool autoStepping = false;

    SearchPlayback playback;
    bool hasResult = false;
    std::string infoLine;
    std::string errorMessage;

    ViewTransform view;

    const std::string& graphName() const { return catalog->names().at(graphIndex); }
    const Graph& graph() const { return catalog->get(graphName()); }
};

}  // namespace pathviz
