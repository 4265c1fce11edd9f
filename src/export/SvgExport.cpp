#include "pathviz/export/SvgExport.h"
#include "pathviz/common/Logger.h"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace pathviz {

SvgExport::SvgExport(const SvgExportOptions& options)
    : options_(options) {}

std::string SvgExport::exportToString(const Graph& graph, const PlaybackFrame& frame) {
    std::ostringstream out;
    exportToStream(graph, frame, out);
    return out.str();
}

void SvgExport::exportToStream(const Graph& graph, const PlaybackFrame& frame, std::ostream& out) {
    writeHeader(out);
    writeStyles(out);

    auto transform = CanvasTransform::fit(graph, options_.width, options_.height, options_.padding);
    if (transform) {
        // Edges first so nodes are drawn on top
        writeEdges(out, graph, *transform);
        writePath(out, graph, frame, *transform);

        for (const auto& node : graph.nodes()) {
            auto pos = graph.position(node);
            if (!pos) continue;
            writeNode(out, node, transform->toCanvas(*pos), nodeFill(node, frame, options_));
        }
    }

    writeFooter(out);
}

bool SvgExport::exportToFile(const Graph& graph, const PlaybackFrame& frame, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("cannot open {} for writing", filename);
        return false;
    }
    exportToStream(graph, frame, file);
    return file.good();
}

void SvgExport::writeHeader(std::ostream& out) {
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
        << "width=\"" << options_.width << "\" "
        << "height=\"" << options_.height << "\" "
        << "viewBox=\"0 0 " << options_.width << " " << options_.height << "\">\n";

    // Background
    out << "  <rect x=\"0\" y=\"0\" "
        << "width=\"" << options_.width << "\" height=\"" << options_.height << "\" "
        << "fill=\"" << options_.backgroundColor << "\"/>\n";
}

void SvgExport::writeStyles(std::ostream& out) {
    if (!options_.embedStyles) return;

    out << "  <style>\n";
    out << "    .edge { fill: none; "
        << "stroke: " << options_.edgeStroke << "; "
        << "stroke-width: " << options_.edgeStrokeWidth << "; }\n";
    out << "    .ring { fill: none; stroke: " << options_.nodeRing << "; stroke-width: 1; }\n";
    out << "    .path-glow { stroke: " << options_.pathGlow << "; "
        << "stroke-width: " << options_.pathGlowWidth << "; stroke-linecap: round; }\n";
    out << "    .path { stroke: " << options_.pathStroke << "; "
        << "stroke-width: " << options_.pathStrokeWidth << "; stroke-linecap: round; }\n";
    out << "    .label { fill: " << options_.textFill << "; "
        << "font-family: " << options_.fontFamily << "; "
        << "font-size: " << options_.fontSize << "px; "
        << "text-anchor: middle; dominant-baseline: central; }\n";
    out << "  </style>\n";
}

void SvgExport::writeFooter(std::ostream& out) {
    out << "</svg>\n";
}

void SvgExport::writeEdges(std::ostream& out, const Graph& graph, const CanvasTransform& transform) {
    for (const auto& node : graph.nodes()) {
        auto from = graph.position(node);
        if (!from) continue;

        for (const auto& neighbor : graph.neighbors(node)) {
            // An undirected edge is stored twice; draw it once
            if (graph.hasEdge(neighbor, node) && neighbor < node) continue;

            auto to = graph.position(neighbor);
            if (!to) continue;

            Point a = transform.toCanvas(*from);
            Point b = transform.toCanvas(*to);
            out << "  <line class=\"edge\" "
                << "x1=\"" << a.x << "\" y1=\"" << a.y << "\" "
                << "x2=\"" << b.x << "\" y2=\"" << b.y << "\"/>\n";
        }
    }
}

void SvgExport::writePath(std::ostream& out, const Graph& graph, const PlaybackFrame& frame,
                          const CanvasTransform& transform) {
    for (const auto& [from, to] : frame.pathSegments) {
        auto p1 = graph.position(from);
        auto p2 = graph.position(to);
        if (!p1 || !p2) continue;

        Point a = transform.toCanvas(*p1);
        Point b = transform.toCanvas(*p2);
        // Wide glow underneath, bright core on top
        for (const char* cls : {"path-glow", "path"}) {
            out << "  <line class=\"" << cls << "\" "
                << "x1=\"" << a.x << "\" y1=\"" << a.y << "\" "
                << "x2=\"" << b.x << "\" y2=\"" << b.y << "\"/>\n";
        }
    }
}

void SvgExport::writeNode(std::ostream& out, const NodeKey& node, const Point& center,
                          const std::string& fill) {
    const double r = options_.nodeRadius;
    out << "  <circle class=\"ring\" cx=\"" << center.x << "\" cy=\"" << center.y
        << "\" r=\"" << r + 3.0 << "\"/>\n";
    out << "  <circle class=\"node\" cx=\"" << center.x << "\" cy=\"" << center.y
        << "\" r=\"" << r << "\" fill=\"" << fill << "\"/>\n";

    if (options_.showNodeLabels) {
        out << "  <text class=\"label\" "
            << "x=\"" << center.x << "\" "
            << "y=\"" << center.y - options_.labelOffset << "\">"
            << escapeXml(toString(node)) << "</text>\n";
    }
}

std::string SvgExport::nodeFill(const NodeKey& node, const PlaybackFrame& frame,
                                const SvgExportOptions& options) {
    // Endpoints win over path nodes, path nodes over visited nodes
    if (frame.start && *frame.start == node) return options.startFill;
    if (frame.goal && *frame.goal == node) return options.goalFill;

    auto contains = [&node](const std::vector<NodeKey>& nodes) {
        return std::find(nodes.begin(), nodes.end(), node) != nodes.end();
    };
    if (contains(frame.pathNodes)) return options.pathNodeFill;
    if (contains(frame.visited)) return options.visitedFill;
    return options.nodeFill;
}

std::string SvgExport::escapeXml(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }

    return result;
}

}  // namespace pathviz
