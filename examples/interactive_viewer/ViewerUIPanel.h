#pragma once

#include "ViewerState.h"

namespace pathviz {

/// Actions requested by UI panel
enum class UIAction {
    None,
    GraphChanged,
    Run,
    Clear,
    Step,
    Auto,
    Reset
};

/// Renders the ImGui control panel for the viewer
class ViewerUIPanel {
public:
    /// Render the panel
    /// @param state Viewer state (combos, slider and toggle write into it)
    /// @return The button or selection the user triggered this frame
    UIAction render(ViewerState& state);

private:
    bool renderGraphCombo(ViewerState& state);
    void renderAlgorithmCombo(ViewerState& state);
    void renderNodeCombo(const char* label, const Graph& graph, int& index);
    UIAction renderButtons();
    void renderLegend();
};

}  // namespace pathviz
