#include <gtest/gtest.h>

#include "CliOptions.h"
#include "CliRunner.h"

#include <pathviz/backends/SpdlogBackend.h>
#include <pathviz/common/Logger.h>
#include <pathviz/export/ResultSerializer.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace pathviz;
using namespace pathviz::cli;

namespace {

template <size_t N>
CliOptions parse(const char* (&argv)[N]) {
    return parseCliOptions(static_cast<int>(N), argv);
}

}  // namespace

// ============================================================================
// Argument parsing
// ============================================================================

TEST(CliOptionsTest, Positionals) {
    const char* argv[] = {"pathviz", "UrbanGrid-6x6", "(0, 0)", "(5, 5)", "bfs"};
    CliOptions options = parse(argv);

    EXPECT_EQ(options.graph, "UrbanGrid-6x6");
    EXPECT_EQ(options.start, "(0, 0)");
    EXPECT_EQ(options.goal, "(5, 5)");
    EXPECT_EQ(options.algorithm, SearchAlgorithm::BFS);
    EXPECT_FALSE(options.list);
}

TEST(CliOptionsTest, AlgorithmIsCaseInsensitive) {
    const char* argv[] = {"pathviz", "CampusMap", "Gate", "Hostel", "AStar"};
    EXPECT_EQ(parse(argv).algorithm, SearchAlgorithm::AStar);
}

TEST(CliOptionsTest, OutputFlags) {
    const char* argv[] = {"pathviz", "Ladder-10", "L0", "R9", "dfs",
                          "--svg", "out.svg", "--json=out.json", "--log-level=debug"};
    CliOptions options = parse(argv);

    EXPECT_EQ(options.svgFile, "out.svg");
    EXPECT_EQ(options.jsonFile, "out.json");
    EXPECT_EQ(options.logLevel, LogLevel::Debug);
}

TEST(CliOptionsTest, NegativeIntegerIsPositional) {
    const char* argv[] = {"pathviz", "Custom", "-1", "3", "bfs"};
    EXPECT_EQ(parse(argv).start, "-1");
}

TEST(CliOptionsTest, ListNeedsOnlyGraph) {
    const char* argv[] = {"pathviz", "HexRing-12", "--list"};
    CliOptions options = parse(argv);

    EXPECT_TRUE(options.list);
    EXPECT_EQ(options.graph, "HexRing-12");
    EXPECT_FALSE(options.algorithm.has_value());
}

TEST(CliOptionsTest, HelpSkipsValidation) {
    const char* argv[] = {"pathviz", "--help"};
    EXPECT_TRUE(parse(argv).help);
}

TEST(CliOptionsTest, UsageErrors) {
    const char* missing[] = {"pathviz", "CampusMap", "Gate"};
    EXPECT_THROW(parse(missing), UsageError);

    const char* tooMany[] = {"pathviz", "CampusMap", "Gate", "Hostel", "bfs", "extra"};
    EXPECT_THROW(parse(tooMany), UsageError);

    const char* badAlgorithm[] = {"pathviz", "CampusMap", "Gate", "Hostel", "dijkstra"};
    EXPECT_THROW(parse(badAlgorithm), UsageError);

    const char* badFlag[] = {"pathviz", "CampusMap", "Gate", "Hostel", "bfs", "--fast"};
    EXPECT_THROW(parse(badFlag), UsageError);

    const char* missingValue[] = {"pathviz", "CampusMap", "Gate", "Hostel", "bfs", "--svg"};
    EXPECT_THROW(parse(missingValue), UsageError);

    const char* badLevel[] = {"pathviz", "CampusMap", "--list", "--log-level", "loud"};
    EXPECT_THROW(parse(badLevel), UsageError);
}

TEST(CliOptionsTest, UsageTextMentionsProgram) {
    std::string text = usageText("pathviz");
    EXPECT_NE(text.find("Usage: pathviz"), std::string::npos);
    EXPECT_NE(text.find("--list"), std::string::npos);
}

// ============================================================================
// Running searches
// ============================================================================

class CliRunTest : public ::testing::Test {
protected:
    GraphCatalog catalog_ = GraphCatalog::withBuiltinGraphs();
    std::ostringstream out_;
    std::ostringstream err_;

    int run(const std::string& graph, const std::string& start, const std::string& goal,
            SearchAlgorithm algorithm) {
        CliOptions options;
        options.graph = graph;
        options.start = start;
        options.goal = goal;
        options.algorithm = algorithm;
        return runCli(options, catalog_, out_, err_);
    }
};

TEST_F(CliRunTest, UrbanGridBfs) {
    EXPECT_EQ(run("UrbanGrid-6x6", "(0, 0)", "(5, 5)", SearchAlgorithm::BFS), EXIT_OK);

    std::string text = out_.str();
    EXPECT_NE(text.find("Algorithm: BFS\n"), std::string::npos);
    EXPECT_NE(text.find("Graph: UrbanGrid-6x6\n"), std::string::npos);
    EXPECT_NE(text.find("Visited nodes: "), std::string::npos);
    EXPECT_NE(text.find("Path length (edges): 7\n"), std::string::npos);
    EXPECT_NE(text.find("Path: [(0, 0), (2, 2), "), std::string::npos);
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(CliRunTest, BinaryTreeIntegerNodes) {
    EXPECT_EQ(run("BinaryTree-15", "1", "15", SearchAlgorithm::DFS), EXIT_OK);

    EXPECT_NE(out_.str().find("Algorithm: DFS\n"), std::string::npos);
    EXPECT_NE(out_.str().find("Path: [1, 3, 7, 15]\n"), std::string::npos);
}

TEST_F(CliRunTest, CampusAStar) {
    EXPECT_EQ(run("CampusMap", "Gate", "Hostel", SearchAlgorithm::AStar), EXIT_OK);

    EXPECT_NE(out_.str().find("Algorithm: ASTAR\n"), std::string::npos);
    EXPECT_NE(out_.str().find("Path: [Gate, Admin, "), std::string::npos);
}

TEST_F(CliRunTest, TrivialPath) {
    EXPECT_EQ(run("HexRing-12", "O0", "O0", SearchAlgorithm::BFS), EXIT_OK);

    EXPECT_NE(out_.str().find("Visited nodes: 1\n"), std::string::npos);
    EXPECT_NE(out_.str().find("Path length (edges): 0\n"), std::string::npos);
    EXPECT_NE(out_.str().find("Path: [O0]\n"), std::string::npos);
}

TEST_F(CliRunTest, InvalidStart) {
    EXPECT_EQ(run("CampusMap", "Moon", "Hostel", SearchAlgorithm::BFS), EXIT_INVALID_NODE);

    EXPECT_NE(err_.str().find("Start node Moon not in selected graph"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliRunTest, InvalidGoal) {
    EXPECT_EQ(run("UrbanGrid-6x6", "(0, 0)", "(9, 9)", SearchAlgorithm::DFS), EXIT_INVALID_NODE);

    EXPECT_NE(err_.str().find("Goal node (9, 9) not in selected graph"), std::string::npos);
}

TEST_F(CliRunTest, UnknownGraph) {
    EXPECT_EQ(run("Mars", "1", "2", SearchAlgorithm::BFS), EXIT_USAGE);

    EXPECT_NE(err_.str().find("Unknown graph: Mars"), std::string::npos);
    EXPECT_NE(err_.str().find("Available graphs:"), std::string::npos);
}

TEST_F(CliRunTest, ListNodes) {
    CliOptions options;
    options.graph = "Ladder-10";
    options.list = true;

    EXPECT_EQ(runCli(options, catalog_, out_, err_), EXIT_OK);

    std::string text = out_.str();
    EXPECT_NE(text.find("- CampusMap: 10 nodes\n"), std::string::npos);
    EXPECT_NE(text.find("Nodes:\nL0, R0, "), std::string::npos);
}

TEST_F(CliRunTest, WritesJsonResult) {
    auto path = std::filesystem::temp_directory_path() / "pathviz_cli_test.json";

    CliOptions options;
    options.graph = "BinaryTree-15";
    options.start = "4";
    options.goal = "5";
    options.algorithm = SearchAlgorithm::BFS;
    options.jsonFile = path.string();

    ASSERT_EQ(runCli(options, catalog_, out_, err_), EXIT_OK);

    ResultMeta meta;
    SearchResult result = ResultSerializer::loadFromFile(path.string(), &meta);
    EXPECT_EQ(meta.graphName, "BinaryTree-15");
    EXPECT_EQ(result.distance, 2);
    EXPECT_EQ(result.path.front(), nodeKey(4));

    std::filesystem::remove(path);
}

// ============================================================================
// Logging setup
// ============================================================================

class CliLoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::setBackend(std::make_unique<SpdlogBackend>());
        std::filesystem::remove_all(root_);
    }

    std::filesystem::path root_ = std::filesystem::temp_directory_path() / "pathviz_cli_logging";
    std::ostringstream err_;
};

TEST_F(CliLoggingTest, LogDirectoryIsCreated) {
    CliOptions options;
    options.logDir = (root_ / "logs").string();
    options.logLevel = LogLevel::Warn;

    EXPECT_EQ(setupLogging(options, err_), EXIT_OK);
    EXPECT_TRUE(std::filesystem::exists(root_ / "logs" / "pathviz.log"));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(CliLoggingTest, UnusableLogDirectory_IsUsageError) {
    // A regular file where a directory is expected
    std::filesystem::create_directories(root_);
    std::ofstream(root_ / "blocker") << "x";

    CliOptions options;
    options.logDir = (root_ / "blocker" / "logs").string();

    EXPECT_EQ(setupLogging(options, err_), EXIT_USAGE);
    EXPECT_NE(err_.str().find("error: cannot log to"), std::string::npos);

    // Logging still works through the previous backend
    EXPECT_NO_THROW(LOG_INFO("still logging"));
}
