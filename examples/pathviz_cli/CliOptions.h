#pragma once

#include <pathviz/common/ILoggerBackend.h>
#include <pathviz/search/SearchTypes.h>

#include <optional>
#include <stdexcept>
#include <string>

namespace pathviz {
namespace cli {

/// Exit codes returned by runCli()
constexpr int EXIT_OK = 0;
constexpr int EXIT_INVALID_NODE = 1;
constexpr int EXIT_USAGE = 2;

/// Thrown for malformed command lines (maps to EXIT_USAGE)
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Parsed command line
///
/// Positionals: <graph> <start> <goal> <algorithm>. With --list only
/// <graph> is required.
struct CliOptions {
    std::string graph;
    std::string start;
    std::string goal;
    std::optional<SearchAlgorithm> algorithm;

    bool list = false;
    bool help = false;

    std::string svgFile;   ///< Empty = no SVG output
    std::string jsonFile;  ///< Empty = no JSON output

    std::optional<LogLevel> logLevel;
    std::string logDir;    ///< Empty = console logging only
};

/// Parse argv into CliOptions
/// @throws UsageError on unknown flags, missing values or positionals,
///         or an unknown algorithm or log level
CliOptions parseCliOptions(int argc, const char* const argv[]);

/// Usage text printed by --help and after usage errors
std::string usageText(const std::string& program);

}  // namespace cli
}  // namespace pathviz
