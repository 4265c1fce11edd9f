#include <SDL3/SDL.h>
#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>

#include "ViewerColors.h"
#include "ViewerRenderer.h"
#include "ViewerState.h"
#include "ViewerText.h"
#include "ViewerUIPanel.h"

#include <pathviz/pathviz.h>
#include <pathviz/common/Logger.h>

#include <algorithm>
#include <string>

using namespace pathviz;

namespace {

void selectDefaultEndpoints(ViewerState& state) {
    int count = static_cast<int>(state.graph().nodeCount());
    state.startIndex = 0;
    state.goalIndex = std::max(0, count - 1);
}

void clearResult(ViewerState& state) {
    state.playback = SearchPlayback{};
    state.hasResult = false;
    state.autoStepping = false;
    state.infoLine.clear();
    state.errorMessage.clear();
}

void runSearch(ViewerState& state) {
    clearResult(state);

    const Graph& graph = state.graph();
    const auto& nodes = graph.nodes();
    if (nodes.empty()) return;

    try {
        SearchResult result = search(state.algorithm, graph,
                                     nodes.at(state.startIndex), nodes.at(state.goalIndex));

        state.infoLine = searchInfoLine(state.algorithm, result);

        state.playback = SearchPlayback(std::move(result),
                                        PlaybackOptions{}.withInterval(state.speedMs));
        state.playback.setMode(PlaybackMode::Path);
        // First segment appears immediately, the rest on the timer
        state.playback.stepPath();
        state.hasResult = true;
    } catch (const InvalidNodeError& e) {
        state.errorMessage = e.what();
        LOG_WARN("search rejected: {}", e.what());
    }
}

void handleAction(ViewerState& state, UIAction action) {
    switch (action) {
        case UIAction::GraphChanged:
            selectDefaultEndpoints(state);
            state.view.reset();
            clearResult(state);
            break;
        case UIAction::Run:
            runSearch(state);
            break;
        case UIAction::Clear:
            clearResult(state);
            break;
        case UIAction::Step:
            if (state.hasResult) {
                state.autoStepping = false;
                state.playback.stepVisit();
            }
            break;
        case UIAction::Auto:
            if (state.hasResult) {
                state.autoStepping = true;
                state.playback.setMode(PlaybackMode::Visits);
            }
            break;
        case UIAction::Reset:
            if (state.hasResult) {
                state.autoStepping = false;
                state.playback.reset();
                state.playback.setMode(PlaybackMode::Visits);
            }
            break;
        case UIAction::None:
            break;
    }
}

void handleCanvasInput(ViewerState& state) {
    ImGuiIO& io = ImGui::GetIO();
    if (io.WantCaptureMouse) return;

    if (io.MouseWheel != 0.0f) {
        float factor = io.MouseWheel > 0 ? ViewerVisuals::ZOOM_STEP : 1.0f / ViewerVisuals::ZOOM_STEP;
        state.view.zoomAt(io.MousePos, factor);
    }
    if (ImGui::IsMouseDragging(ImGuiMouseButton_Right)) {
        state.view.pan.x += io.MouseDelta.x;
        state.view.pan.y += io.MouseDelta.y;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    std::string initialGraph;
    bool darkMode = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--graph=") == 0) {
            initialGraph = arg.substr(8);
        } else if (arg == "--dark") {
            darkMode = true;
        }
    }

    Logger::initialize();

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        SDL_Log("SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow("PathViz Viewer", 1100, 720, SDL_WINDOW_RESIZABLE);
    if (!window) {
        SDL_Log("SDL_CreateWindow failed: %s", SDL_GetError());
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, nullptr);
    if (!renderer) {
        SDL_Log("SDL_CreateRenderer failed: %s", SDL_GetError());
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();

    ImGui_ImplSDL3_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer3_Init(renderer);

    auto catalog = GraphCatalog::withBuiltinGraphs();
    ViewerState state;
    state.catalog = &catalog;
    state.darkMode = darkMode;
    const auto& names = catalog.names();
    auto it = std::find(names.begin(), names.end(), initialGraph);
    if (it != names.end()) {
        state.graphIndex = static_cast<int>(it - names.begin());
    } else if (!initialGraph.empty()) {
        LOG_WARN("unknown graph '{}', showing {}", initialGraph, names.front());
    }
    selectDefaultEndpoints(state);

    ViewerUIPanel panel;
    Uint64 lastTicks = SDL_GetTicks();

    bool running = true;
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT) {
                running = false;
            }
            if (event.type == SDL_EVENT_KEY_DOWN &&
                event.key.key == SDLK_ESCAPE) {
                running = false;
            }
        }

        Uint64 now = SDL_GetTicks();
        int elapsedMs = static_cast<int>(now - lastTicks);
        lastTicks = now;

        ImGui_ImplSDLRenderer3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        handleAction(state, panel.render(state));
        handleCanvasInput(state);

        if (state.hasResult) {
            state.playback.setOptions(PlaybackOptions{}.withInterval(state.speedMs));
            if (state.playback.mode() == PlaybackMode::Path || state.autoStepping) {
                state.playback.advance(elapsedMs);
            }
            if (state.autoStepping && state.playback.visitsFinished()) {
                state.autoStepping = false;
            }
        }

        // Canvas to the right of the panel
        ImVec2 display = io.DisplaySize;
        state.view.screenOffset = {ViewerVisuals::PANEL_WIDTH, 0};
        ImVec2 canvasSize = {std::max(1.0f, display.x - ViewerVisuals::PANEL_WIDTH), display.y};
        ViewerTheme theme = state.darkMode ? ViewerTheme::dark() : ViewerTheme::light();

        PlaybackFrame frame = state.hasResult ? state.playback.frame() : PlaybackFrame{};
        ViewerRenderer::drawScene(ImGui::GetBackgroundDrawList(), canvasSize,
                                  state.graph(), frame, state.view, theme);

        ImGui::Render();

        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_RenderClear(renderer);

        ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
    }

    ImGui_ImplSDLRenderer3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();

    Logger::flush();
    return 0;
}
