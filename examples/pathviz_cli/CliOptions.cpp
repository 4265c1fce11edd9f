#include "CliOptions.h"

#include <sstream>
#include <vector>

namespace pathviz {
namespace cli {

namespace {

std::string requireValue(int argc, const char* const argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw UsageError("Option " + flag + " requires a value");
    }
    return argv[++i];
}

}  // namespace

CliOptions parseCliOptions(int argc, const char* const argv[]) {
    CliOptions options;
    std::vector<std::string> positionals;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--list") {
            options.list = true;
        } else if (arg == "--svg") {
            options.svgFile = requireValue(argc, argv, i, arg);
        } else if (arg.find("--svg=") == 0) {
            options.svgFile = arg.substr(6);
        } else if (arg == "--json") {
            options.jsonFile = requireValue(argc, argv, i, arg);
        } else if (arg.find("--json=") == 0) {
            options.jsonFile = arg.substr(7);
        } else if (arg == "--log-dir") {
            options.logDir = requireValue(argc, argv, i, arg);
        } else if (arg == "--log-level" || arg.find("--log-level=") == 0) {
            std::string value = arg == "--log-level" ? requireValue(argc, argv, i, arg)
                                                     : arg.substr(12);
            LogLevel level;
            if (!parseLogLevel(value, level)) {
                throw UsageError("Unknown log level: " + value);
            }
            options.logLevel = level;
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            throw UsageError("Unknown option: " + arg);
        } else {
            // Anything else, including "-1" or "(0, 0)", is a positional
            positionals.push_back(arg);
        }
    }

    if (options.help) {
        return options;
    }

    if (positionals.size() > 4) {
        throw UsageError("Too many arguments");
    }

    size_t required = options.list ? 1 : 4;
    if (positionals.size() < required) {
        throw UsageError(options.list ? "Missing argument: graph"
                                      : "Expected <graph> <start> <goal> <algorithm>");
    }

    options.graph = positionals[0];
    if (positionals.size() > 1) options.start = positionals[1];
    if (positionals.size() > 2) options.goal = positionals[2];
    if (positionals.size() > 3) {
        options.algorithm = parseAlgorithm(positionals[3]);
        if (!options.algorithm) {
            throw UsageError("Unknown algorithm: " + positionals[3] + " (choose bfs, dfs or astar)");
        }
    }

    return options;
}

std::string usageText(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " <graph> <start> <goal> <bfs|dfs|astar> [options]\n"
        << "       " << program << " <graph> --list\n"
        << "\n"
        << "Shortest path search on predefined graphs (BFS, DFS, A*).\n"
        << "Nodes are written as integers (7), names (Gate) or cells ('(0, 0)').\n"
        << "\n"
        << "Options:\n"
        << "  --list               List graphs and the nodes of <graph>\n"
        << "  --svg FILE           Write the final search frame as SVG\n"
        << "  --json FILE          Write the search result as JSON\n"
        << "  --log-level LEVEL    trace, debug, info, warn, error, off\n"
        << "  --log-dir DIR        Also log to DIR/pathviz.log\n"
        << "  -h, --help           Show this help\n";
    return out.str();
}

}  // namespace cli
}  // namespace pathviz
