#include "ViewerUIPanel.h"
#include "ViewerColors.h"

#include <imgui.h>
#include <string>

namespace pathviz {

UIAction ViewerUIPanel::render(ViewerState& state) {
    UIAction action = UIAction::None;

    ImGui::SetNextWindowPos({0, 0}, ImGuiCond_Always);
    ImGui::SetNextWindowSize({ViewerVisuals::PANEL_WIDTH, ImGui::GetIO().DisplaySize.y},
                             ImGuiCond_Always);
    ImGui::Begin("Search", nullptr,
                 ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse);

    if (renderGraphCombo(state)) {
        action = UIAction::GraphChanged;
    }
    renderAlgorithmCombo(state);

    const Graph& graph = state.graph();
    renderNodeCombo("Start", graph, state.startIndex);
    renderNodeCombo("Goal", graph, state.goalIndex);

    ImGui::Separator();
    ImGui::SliderInt("Speed (ms)", &state.speedMs,
                     PlaybackOptions::MIN_INTERVAL_MS, PlaybackOptions::MAX_INTERVAL_MS);
    ImGui::Checkbox("Dark mode", &state.darkMode);

    ImGui::Separator();
    UIAction button = renderButtons();
    if (button != UIAction::None) {
        action = button;
    }

    ImGui::Separator();
    if (!state.infoLine.empty()) {
        ImGui::TextWrapped("%s", state.infoLine.c_str());
    }
    if (!state.errorMessage.empty()) {
        ImGui::TextColored({0.9f, 0.22f, 0.21f, 1.0f}, "%s", state.errorMessage.c_str());
    }
    if (state.hasResult) {
        const auto& playback = state.playback;
        ImGui::Text("Step: %zu / %zu", playback.visitCursor(),
                    playback.result().visitedOrder.size());
    }

    ImGui::Separator();
    renderLegend();
    ImGui::TextDisabled("Wheel: zoom  |  Right drag: pan");

    ImGui::End();
    return action;
}

bool ViewerUIPanel::renderGraphCombo(ViewerState& state) {
    bool changed = false;
    const auto& names = state.catalog->names();
    if (ImGui::BeginCombo("Graph", names[state.graphIndex].c_str())) {
        for (int i = 0; i < static_cast<int>(names.size()); ++i) {
            bool selected = i == state.graphIndex;
            if (ImGui::Selectable(names[i].c_str(), selected) && !selected) {
                state.graphIndex = i;
                changed = true;
            }
        }
        ImGui::EndCombo();
    }
    return changed;
}

void ViewerUIPanel::renderAlgorithmCombo(ViewerState& state) {
    if (ImGui::BeginCombo("Algorithm", algorithmName(state.algorithm))) {
        for (SearchAlgorithm algo : ALL_ALGORITHMS) {
            if (ImGui::Selectable(algorithmName(algo), algo == state.algorithm)) {
                state.algorithm = algo;
            }
        }
        ImGui::EndCombo();
    }
}

void ViewerUIPanel::renderNodeCombo(const char* label, const Graph& graph, int& index) {
    const auto& nodes = graph.nodes();
    if (nodes.empty()) return;

    std::string current = toString(nodes.at(index));
    if (ImGui::BeginCombo(label, current.c_str())) {
        for (int i = 0; i < static_cast<int>(nodes.size()); ++i) {
            std::string text = toString(nodes[i]);
            if (ImGui::Selectable(text.c_str(), i == index)) {
                index = i;
            }
        }
        ImGui::EndCombo();
    }
}

UIAction ViewerUIPanel::renderButtons() {
    UIAction action = UIAction::None;

    if (ImGui::Button("Run")) action = UIAction::Run;
    ImGui::SameLine();
    if (ImGui::Button("Clear")) action = UIAction::Clear;

    if (ImGui::Button("Step")) action = UIAction::Step;
    ImGui::SameLine();
    if (ImGui::Button("Auto")) action = UIAction::Auto;
    ImGui::SameLine();
    if (ImGui::Button("Reset")) action = UIAction::Reset;

    return action;
}

void ViewerUIPanel::renderLegend() {
    ImDrawList* drawList = ImGui::GetWindowDrawList();
    auto entry = [drawList](ImU32 color, const char* text) {
        ImVec2 p = ImGui::GetCursorScreenPos();
        float h = ImGui::GetTextLineHeight();
        drawList->AddCircleFilled({p.x + h * 0.5f, p.y + h * 0.5f}, h * 0.4f, color);
        ImGui::Dummy({h, h});
        ImGui::SameLine();
        ImGui::TextUnformatted(text);
    };

    entry(ViewerColors::NODE, "Node");
    entry(ViewerColors::VISITED, "Visited");
    entry(ViewerColors::PATH, "Path");
    entry(ViewerColors::START, "Start");
    entry(ViewerColors::GOAL, "Goal");
}

}  // namespace pathviz
