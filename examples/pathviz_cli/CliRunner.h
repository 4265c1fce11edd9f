#pragma once

#include "CliOptions.h"

#include <pathviz/catalog/GraphCatalog.h>

#include <ostream>

namespace pathviz {
namespace cli {

/// Print "Available graphs:" with node counts for every catalog entry
void listGraphs(const GraphCatalog& catalog, std::ostream& out);

/// Print "Nodes:" followed by the graph's nodes, comma-separated
void listNodes(const Graph& graph, std::ostream& out);

/// Install the logging backend requested by --log-dir and --log-level.
/// A log directory that cannot be created is reported on err.
/// @return EXIT_OK, or EXIT_USAGE when the log file cannot be opened
int setupLogging(const CliOptions& options, std::ostream& err);

/// Execute a parsed command line against a catalog.
/// Results go to out; diagnostics go to err.
/// @return EXIT_OK, EXIT_INVALID_NODE, or EXIT_USAGE
int runCli(const CliOptions& options, const GraphCatalog& catalog,
           std::ostream& out, std::ostream& err);

}  // namespace cli
}  // namespace pathviz
