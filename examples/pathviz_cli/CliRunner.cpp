#include "CliRunner.h"

#include <pathviz/backends/SpdlogBackend.h>
#include <pathviz/common/Logger.h>
#include <pathviz/core/NodeParser.h>
#include <pathviz/export/ResultSerializer.h>
#include <pathviz/export/SvgExport.h>
#include <pathviz/playback/SearchPlayback.h>
#include <pathviz/search/PathSearch.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>

namespace pathviz {
namespace cli {

namespace {

std::string joinNodes(const std::vector<NodeKey>& nodes) {
    std::string text;
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (i > 0) text += ", ";
        text += toString(nodes[i]);
    }
    return text;
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

}  // namespace

void listGraphs(const GraphCatalog& catalog, std::ostream& out) {
    out << "Available graphs:\n";
    for (const auto& name : catalog.names()) {
        out << "- " << name << ": " << catalog.get(name).nodeCount() << " nodes\n";
    }
}

void listNodes(const Graph& graph, std::ostream& out) {
    out << "Nodes:\n";
    out << joinNodes(graph.nodes()) << "\n";
}

int setupLogging(const CliOptions& options, std::ostream& err) {
    if (options.logDir.empty()) {
        Logger::initialize();
    } else {
        try {
            Logger::setBackend(std::make_unique<SpdlogBackend>(options.logDir, true));
        } catch (const std::exception& e) {
            err << "error: cannot log to " << options.logDir << ": " << e.what() << "\n";
            return EXIT_USAGE;
        }
    }

    if (options.logLevel) {
        Logger::setLevel(*options.logLevel);
    }
    return EXIT_OK;
}

int runCli(const CliOptions& options, const GraphCatalog& catalog,
           std::ostream& out, std::ostream& err) {
    auto graph = catalog.find(options.graph);
    if (!graph) {
        err << "Unknown graph: " << options.graph << "\n";
        listGraphs(catalog, err);
        return EXIT_USAGE;
    }

    if (options.list) {
        listGraphs(catalog, out);
        listNodes(*graph, out);
        return EXIT_OK;
    }

    if (!options.algorithm) {
        err << "Missing algorithm\n";
        return EXIT_USAGE;
    }

    // Validate here so the search layer never sees a foreign node
    NodeKey start = parseNodeKey(options.start);
    NodeKey goal = parseNodeKey(options.goal);
    if (!graph->hasNode(start)) {
        err << "Start node " << toString(start) << " not in selected graph\n";
        return EXIT_INVALID_NODE;
    }
    if (!graph->hasNode(goal)) {
        err << "Goal node " << toString(goal) << " not in selected graph\n";
        return EXIT_INVALID_NODE;
    }

    SearchResult result = search(*options.algorithm, *graph, start, goal);

    out << "Algorithm: " << upper(algorithmName(*options.algorithm)) << "\n";
    out << "Graph: " << options.graph << "\n";
    out << "Visited nodes: " << result.visitedCount << "\n";
    if (result.found()) {
        out << "Path length (edges): " << result.distance << "\n";
        out << "Path: [" << joinNodes(result.path) << "]\n";
    } else {
        out << "No path found\n";
    }

    if (!options.svgFile.empty()) {
        SearchPlayback playback(result);
        while (playback.stepVisit()) {}
        while (playback.stepPath()) {}

        SvgExport svg;
        if (svg.exportToFile(*graph, playback.frame(), options.svgFile)) {
            LOG_INFO("SVG written to {}", options.svgFile);
        } else {
            err << "Failed to write " << options.svgFile << "\n";
        }
    }

    if (!options.jsonFile.empty()) {
        ResultMeta meta{options.graph, options.algorithm, start, goal};
        if (ResultSerializer::saveToFile(result, meta, options.jsonFile)) {
            LOG_INFO("JSON written to {}", options.jsonFile);
        } else {
            err << "Failed to write " << options.jsonFile << "\n";
        }
    }

    return EXIT_OK;
}

}  // namespace cli
}  // namespace pathviz
