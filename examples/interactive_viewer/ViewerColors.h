#pragma once

#include <imgui.h>

namespace pathviz {

/// Centralized color constants for viewer rendering
namespace ViewerColors {
    // Nodes
    constexpr ImU32 NODE = IM_COL32(25, 118, 210, 255);         // #1976d2
    constexpr ImU32 NODE_RING = IM_COL32(93, 173, 226, 255);    // #5dade2
    constexpr ImU32 NODE_GLOSS = IM_COL32(187, 222, 251, 255);  // #bbdefb

    // Search overlays
    constexpr ImU32 VISITED = IM_COL32(142, 36, 170, 255);      // #8e24aa
    constexpr ImU32 PATH_NODE = IM_COL32(100, 181, 246, 255);   // #64b5f6
    constexpr ImU32 PATH = IM_COL32(255, 143, 0, 255);          // #ff8f00
    constexpr ImU32 PATH_GLOW = IM_COL32(255, 209, 128, 255);   // #ffd180
    constexpr ImU32 START = IM_COL32(67, 160, 71, 255);         // #43a047
    constexpr ImU32 GOAL = IM_COL32(229, 57, 53, 255);          // #e53935
}

/// Theme-dependent canvas colors
struct ViewerTheme {
    ImU32 background;
    ImU32 text;
    ImU32 edge;

    static constexpr ViewerTheme light() {
        return {IM_COL32(247, 249, 252, 255), IM_COL32(17, 17, 17, 255), IM_COL32(192, 192, 192, 255)};
    }
    static constexpr ViewerTheme dark() {
        return {IM_COL32(15, 18, 22, 255), IM_COL32(232, 238, 246, 255), IM_COL32(42, 47, 54, 255)};
    }
};

/// Visual constants
namespace ViewerVisuals {
    constexpr float NODE_RADIUS = 10.0f;
    constexpr float RING_OFFSET = 3.0f;
    constexpr float LABEL_OFFSET = 16.0f;
    constexpr float PATH_WIDTH = 4.0f;
    constexpr float PATH_GLOW_WIDTH = 8.0f;
    constexpr float CANVAS_PADDING = 40.0f;
    constexpr float PANEL_WIDTH = 300.0f;
    constexpr float ZOOM_STEP = 1.1f;
}

}  // namespace pathviz
