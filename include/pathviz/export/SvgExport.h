#pragma once

#include "../core/CanvasTransform.h"
#include "../core/Graph.h"
#include "../playback/SearchPlayback.h"
#include "IExporter.h"

#include <ostream>
#include <string>

namespace pathviz {

/// Options for SVG export
struct SvgExportOptions {
    // Canvas settings
    double width = 600.0;
    double height = 600.0;
    double padding = 40.0;
    std::string backgroundColor = "#f7f9fc";

    // Node styling
    double nodeRadius = 10.0;
    std::string nodeFill = "#1976d2";
    std::string nodeRing = "#5dade2";

    // Overlay colors
    std::string visitedFill = "#8e24aa";
    std::string pathNodeFill = "#64b5f6";
    std::string pathStroke = "#ff8f00";
    std::string pathGlow = "#ffd180";
    std::string startFill = "#43a047";
    std::string goalFill = "#e53935";
    double pathStrokeWidth = 4.0;
    double pathGlowWidth = 8.0;

    // Edge styling
    std::string edgeStroke = "#c0c0c0";
    double edgeStrokeWidth = 1.0;

    // Text styling
    std::string textFill = "#111111";
    std::string fontFamily = "Segoe UI, Arial, sans-serif";
    double fontSize = 10.0;
    double labelOffset = 16.0;

    bool showNodeLabels = true;
    bool embedStyles = true;

    /// Light canvas (default)
    static SvgExportOptions light() { return SvgExportOptions{}; }

    /// Dark canvas
    static SvgExportOptions dark() {
        SvgExportOptions options;
        options.backgroundColor = "#0f1216";
        options.textFill = "#e8eef6";
        options.edgeStroke = "#2a2f36";
        return options;
    }
};

/// Exports a graph and a playback frame to SVG
///
/// Nodes without a position are skipped, along with their edges. A graph
/// without any positions produces an empty canvas.
class SvgExport : public IExporter {
public:
    SvgExport() = default;
    explicit SvgExport(const SvgExportOptions& options);
    ~SvgExport() override = default;

    std::string exportToString(const Graph& graph, const PlaybackFrame& frame) override;
    void exportToStream(const Graph& graph, const PlaybackFrame& frame, std::ostream& out) override;
    bool exportToFile(const Graph& graph, const PlaybackFrame& frame, const std::string& filename) override;

    std::string fileExtension() const override { return "svg"; }
    std::string mimeType() const override { return "image/svg+xml"; }

    void setOptions(const SvgExportOptions& options) { options_ = options; }
    const SvgExportOptions& options() const { return options_; }

private:
    SvgExportOptions options_;

    void writeHeader(std::ostream& out);
    void writeStyles(std::ostream& out);
    void writeFooter(std::ostream& out);

    void writeEdges(std::ostream& out, const Graph& graph, const CanvasTransform& transform);
    void writePath(std::ostream& out, const Graph& graph, const PlaybackFrame& frame,
                   const CanvasTransform& transform);
    void writeNode(std::ostream& out, const NodeKey& node, const Point& center,
                   const std::string& fill);

    static std::string nodeFill(const NodeKey& node, const PlaybackFrame& frame,
                                const SvgExportOptions& options);
    static std::string escapeXml(const std::string& text);
};

}  // namespace pathviz
