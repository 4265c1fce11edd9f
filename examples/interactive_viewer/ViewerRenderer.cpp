#include "ViewerRenderer.h"

#include <algorithm>
#include <numbers>
#include <string>

namespace pathviz {

void ViewerRenderer::drawScene(ImDrawList* drawList, const ImVec2& canvasSize,
                               const Graph& graph, const PlaybackFrame& frame,
                               const ViewTransform& view, const ViewerTheme& theme) {
    const ImVec2 origin = view.screenOffset;
    drawList->AddRectFilled(origin, {origin.x + canvasSize.x, origin.y + canvasSize.y},
                            theme.background);

    auto fit = CanvasTransform::fit(graph, canvasSize.x, canvasSize.y,
                                    ViewerVisuals::CANVAS_PADDING);
    if (!fit) return;

    drawList->PushClipRect(origin, {origin.x + canvasSize.x, origin.y + canvasSize.y}, true);

    drawEdges(drawList, graph, *fit, view, theme);
    drawPath(drawList, graph, frame, *fit, view);

    for (const auto& node : graph.nodes()) {
        auto pos = graph.position(node);
        if (!pos) continue;
        drawNode(drawList, node, view.canvasToScreen(fit->toCanvas(*pos)),
                 nodeColor(node, frame), theme);
    }

    drawList->PopClipRect();
}

void ViewerRenderer::drawEdges(ImDrawList* drawList, const Graph& graph,
                               const CanvasTransform& fit, const ViewTransform& view,
                               const ViewerTheme& theme) {
    for (const auto& node : graph.nodes()) {
        auto from = graph.position(node);
        if (!from) continue;
        for (const auto& neighbor : graph.neighbors(node)) {
            auto to = graph.position(neighbor);
            if (!to) continue;
            drawList->AddLine(view.canvasToScreen(fit.toCanvas(*from)),
                              view.canvasToScreen(fit.toCanvas(*to)), theme.edge, 1.0f);
        }
    }
}

void ViewerRenderer::drawPath(ImDrawList* drawList, const Graph& graph, const PlaybackFrame& frame,
                              const CanvasTransform& fit, const ViewTransform& view) {
    for (const auto& [a, b] : frame.pathSegments) {
        auto p1 = graph.position(a);
        auto p2 = graph.position(b);
        if (!p1 || !p2) continue;

        ImVec2 s1 = view.canvasToScreen(fit.toCanvas(*p1));
        ImVec2 s2 = view.canvasToScreen(fit.toCanvas(*p2));
        drawList->AddLine(s1, s2, ViewerColors::PATH_GLOW, ViewerVisuals::PATH_GLOW_WIDTH);
        drawList->AddLine(s1, s2, ViewerColors::PATH, ViewerVisuals::PATH_WIDTH);
    }
}

void ViewerRenderer::drawNode(ImDrawList* drawList, const NodeKey& node, const ImVec2& center,
                              ImU32 fill, const ViewerTheme& theme) {
    // Radius and labels stay constant under zoom; only positions scale
    const float r = ViewerVisuals::NODE_RADIUS;

    drawList->AddCircle(center, r + ViewerVisuals::RING_OFFSET, ViewerColors::NODE_RING, 0, 1.0f);
    drawList->AddCircleFilled(center, r, fill);

    // Glossy reflection on the upper arc
    constexpr float PI = std::numbers::pi_v<float>;
    drawList->PathArcTo(center, r, -0.75f * PI, -0.25f * PI);
    drawList->PathStroke(ViewerColors::NODE_GLOSS, 0, 2.0f);

    std::string label = toString(node);
    ImVec2 textSize = ImGui::CalcTextSize(label.c_str());
    ImVec2 textPos = {center.x - textSize.x * 0.5f,
                      center.y - ViewerVisuals::LABEL_OFFSET - textSize.y * 0.5f};
    drawList->AddText(textPos, theme.text, label.c_str());
}

ImU32 ViewerRenderer::nodeColor(const NodeKey& node, const PlaybackFrame& frame) {
    if (frame.start && *frame.start == node) return ViewerColors::START;
    if (frame.goal && *frame.goal == node) return ViewerColors::GOAL;

    auto contains = [&node](const std::vector<NodeKey>& nodes) {
        return std::find(nodes.begin(), nodes.end(), node) != nodes.end();
    };
    if (contains(frame.pathNodes)) return ViewerColors::PATH_NODE;
    if (contains(frame.visited)) return ViewerColors::VISITED;
    return ViewerColors::NODE;
}

}  // namespace pathviz
