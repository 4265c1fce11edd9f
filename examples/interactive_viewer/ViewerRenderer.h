#pragma once

#include "ViewerColors.h"
#include "ViewerState.h"

#include <imgui.h>

namespace pathviz {

/// Draws a graph and the current playback frame into an ImGui draw list
///
/// All methods are static and take necessary state as parameters.
class ViewerRenderer {
public:
    /// Draw background, edges, path overlay and nodes
    static void drawScene(ImDrawList* drawList, const ImVec2& canvasSize,
                          const Graph& graph, const PlaybackFrame& frame,
                          const ViewTransform& view, const ViewerTheme& theme);

private:
    static void drawEdges(ImDrawList* drawList, const Graph& graph,
                          const CanvasTransform& fit, const ViewTransform& view,
                          const ViewerTheme& theme);

    static void drawPath(ImDrawList* drawList, const Graph& graph, const PlaybackFrame& frame,
                         const CanvasTransform& fit, const ViewTransform& view);

    static void drawNode(ImDrawList* drawList, const NodeKey& node, const ImVec2& center,
                         ImU32 fill, const ViewerTheme& theme);

    static ImU32 nodeColor(const NodeKey& node, const PlaybackFrame& frame);
};

}  // namespace pathviz
