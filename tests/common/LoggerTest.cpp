#include <gtest/gtest.h>
#include <pathviz/common/Logger.h>
#include <pathviz/backends/SpdlogBackend.h>
#include <pathviz/search/PathSearch.h>

#include <memory>
#include <thread>
#include <utility>
#include <vector>

using namespace pathviz;

namespace {

struct RecordedLine {
    LogLevel level;
    std::string message;
};

/// Backend that keeps everything it receives
class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::shared_ptr<std::vector<RecordedLine>> sink)
        : sink_(std::move(sink)) {}

    void log(LogLevel level, const std::string& message,
             const std::source_location&) override {
        if (level >= minLevel_) {
            sink_->push_back({level, message});
        }
    }
    void setLevel(LogLevel level) override { minLevel_ = level; }
    void flush() override { ++flushes; }

    int flushes = 0;

private:
    std::shared_ptr<std::vector<RecordedLine>> sink_;
    LogLevel minLevel_ = LogLevel::Trace;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        lines_ = std::make_shared<std::vector<RecordedLine>>();
        Logger::setBackend(std::make_unique<RecordingBackend>(lines_));
        Logger::clearCapturedLogs();
        Logger::enableCapture(true);
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
        Logger::setBackend(std::make_unique<SpdlogBackend>());
    }

    std::shared_ptr<std::vector<RecordedLine>> lines_;
};

}  // namespace

TEST_F(LoggerTest, InjectedBackendReceivesMessages) {
    LOG_INFO("expanded {} nodes", 12);
    LOG_WARN("heuristic disabled");

    ASSERT_EQ(lines_->size(), 2u);
    EXPECT_EQ((*lines_)[0].level, LogLevel::Info);
    EXPECT_NE((*lines_)[0].message.find("expanded 12 nodes"), std::string::npos);
    EXPECT_EQ((*lines_)[1].level, LogLevel::Warn);
}

TEST_F(LoggerTest, MessagesArePrefixedWithFunctionName) {
    LOG_ERROR("boom");

    ASSERT_EQ(lines_->size(), 1u);
    EXPECT_NE((*lines_)[0].message.find("() - boom"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelForwardsToBackend) {
    Logger::setLevel(LogLevel::Error);
    LOG_DEBUG("hidden");
    LOG_ERROR("shown");

    ASSERT_EQ(lines_->size(), 1u);
    EXPECT_NE((*lines_)[0].message.find("shown"), std::string::npos);
}

TEST_F(LoggerTest, CaptureKeepsEveryLevel) {
    Logger::setLevel(LogLevel::Off);
    LOG_TRACE("first");
    LOG_DEBUG("second");

    EXPECT_TRUE(lines_->empty());
    auto logs = Logger::getCapturedLogs();
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_NE(logs[0].find("[trace]"), std::string::npos);
    EXPECT_NE(logs[1].find("[debug]"), std::string::npos);
}

TEST_F(LoggerTest, CapturedLogsFilterAndLimit) {
    LOG_INFO("alpha 1");
    LOG_INFO("beta");
    LOG_INFO("alpha 2");
    LOG_INFO("alpha 3");

    EXPECT_EQ(Logger::getCapturedLogs("alpha").size(), 3u);

    auto last = Logger::getCapturedLogs("alpha", 2);
    ASSERT_EQ(last.size(), 2u);
    EXPECT_NE(last[0].find("alpha 2"), std::string::npos);
    EXPECT_NE(last[1].find("alpha 3"), std::string::npos);

    Logger::clearCapturedLogs();
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

TEST_F(LoggerTest, CaptureDisabled_StoresNothing) {
    Logger::enableCapture(false);
    EXPECT_FALSE(Logger::isCaptureEnabled());

    LOG_INFO("not kept");

    EXPECT_TRUE(Logger::getCapturedLogs().empty());
    EXPECT_EQ(lines_->size(), 1u);
}

TEST_F(LoggerTest, SearchLogsSummary) {
    Graph graph;
    graph.addUndirectedEdge(nodeKey("A"), nodeKey("B"));

    bfs(graph, nodeKey("A"), nodeKey("B"));

    auto logs = Logger::getCapturedLogs("BFS");
    ASSERT_FALSE(logs.empty());
    EXPECT_NE(logs.back().find("distance 1"), std::string::npos);
}

TEST_F(LoggerTest, ConcurrentSearchesCreateBackendOnce) {
    // No backend yet: the first log call from either thread creates it
    Logger::setBackend(nullptr);

    Graph graph;
    graph.addUndirectedEdge(nodeKey("A"), nodeKey("B"));
    graph.addUndirectedEdge(nodeKey("B"), nodeKey("C"));

    constexpr int RUNS = 50;
    int bfsDistanceSum = 0;
    int astarDistanceSum = 0;

    std::thread first([&] {
        for (int i = 0; i < RUNS; ++i) {
            bfsDistanceSum += bfs(graph, nodeKey("A"), nodeKey("C")).distance;
        }
    });
    std::thread second([&] {
        for (int i = 0; i < RUNS; ++i) {
            astarDistanceSum += astar(graph, nodeKey("A"), nodeKey("C")).distance;
        }
    });
    first.join();
    second.join();

    EXPECT_EQ(bfsDistanceSum, 2 * RUNS);
    EXPECT_EQ(astarDistanceSum, 2 * RUNS);
    EXPECT_EQ(Logger::getCapturedLogs("A -> C: distance 2").size(), 2u * RUNS);
}

TEST(LogLevelTest, ParseLogLevel) {
    LogLevel level = LogLevel::Info;

    EXPECT_TRUE(parseLogLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(parseLogLevel("warning", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_TRUE(parseLogLevel("off", level));
    EXPECT_EQ(level, LogLevel::Off);

    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::Off);
}
