#include <gtest/gtest.h>
#include <pathviz/playback/SearchPlayback.h>

#include <limits>

using namespace pathviz;

// =============================================================================
// Test Fixture
// =============================================================================

class SearchPlaybackTest : public ::testing::Test {
protected:
    void SetUp() override {
        // A - B - C found after visiting A, X, B, C
        result_.path = {nodeKey("A"), nodeKey("B"), nodeKey("C")};
        result_.distance = 2;
        result_.visitedOrder = {nodeKey("A"), nodeKey("X"), nodeKey("B"), nodeKey("C")};
        result_.visitedCount = 4;
    }

    SearchResult result_;
};

// =============================================================================
// Options
// =============================================================================

TEST(PlaybackOptionsTest, DefaultsAndPresets) {
    EXPECT_EQ(PlaybackOptions{}.intervalMs, 200);
    EXPECT_EQ(PlaybackOptions::normal().intervalMs, 200);
    EXPECT_EQ(PlaybackOptions::slow().intervalMs, 800);
    EXPECT_EQ(PlaybackOptions::fast().intervalMs, 50);
}

TEST(PlaybackOptionsTest, IntervalIsClamped) {
    EXPECT_EQ(PlaybackOptions{}.withInterval(10).intervalMs, 50);
    EXPECT_EQ(PlaybackOptions{}.withInterval(5000).intervalMs, 800);

    PlaybackOptions raw;
    raw.intervalMs = 1;
    EXPECT_EQ(raw.pathIntervalMs(), 50);
}

TEST(PlaybackOptionsTest, VisitIntervalIsHalfWithFloor) {
    EXPECT_EQ(PlaybackOptions{}.withInterval(200).visitIntervalMs(), 100);
    EXPECT_EQ(PlaybackOptions{}.withInterval(800).visitIntervalMs(), 400);
    EXPECT_EQ(PlaybackOptions{}.withInterval(60).visitIntervalMs(), 50);
}

// =============================================================================
// Visitation stepping
// =============================================================================

TEST_F(SearchPlaybackTest, StepVisit_WalksVisitedOrder) {
    SearchPlayback playback(result_);

    EXPECT_TRUE(playback.stepVisit());
    EXPECT_TRUE(playback.stepVisit());

    std::vector<NodeKey> expected = {nodeKey("A"), nodeKey("X")};
    EXPECT_EQ(playback.visitedSoFar(), expected);
    EXPECT_EQ(playback.visitCursor(), 2);
    EXPECT_FALSE(playback.visitsFinished());

    EXPECT_TRUE(playback.stepVisit());
    EXPECT_TRUE(playback.stepVisit());
    EXPECT_TRUE(playback.visitsFinished());
    EXPECT_FALSE(playback.stepVisit());
    EXPECT_EQ(playback.visitCursor(), 4);
}

TEST_F(SearchPlaybackTest, ResetVisits_StartsOver) {
    SearchPlayback playback(result_);
    playback.stepVisit();
    playback.stepVisit();

    playback.resetVisits();

    EXPECT_EQ(playback.visitCursor(), 0);
    EXPECT_TRUE(playback.visitedSoFar().empty());
}

// =============================================================================
// Path reveal
// =============================================================================

TEST_F(SearchPlaybackTest, StepPath_RevealsSegmentsThenEndpoints) {
    SearchPlayback playback(result_);
    EXPECT_EQ(playback.totalSegments(), 2);

    EXPECT_TRUE(playback.stepPath());
    EXPECT_EQ(playback.revealedSegments(), 1);
    EXPECT_FALSE(playback.endpointsMarked());

    EXPECT_TRUE(playback.stepPath());
    EXPECT_EQ(playback.revealedSegments(), 2);
    EXPECT_FALSE(playback.pathFinished());

    EXPECT_TRUE(playback.stepPath());
    EXPECT_TRUE(playback.endpointsMarked());
    EXPECT_TRUE(playback.pathFinished());

    EXPECT_FALSE(playback.stepPath());
}

TEST_F(SearchPlaybackTest, TrivialPath_OnlyMarksEndpoints) {
    SearchResult trivial;
    trivial.path = {nodeKey("A")};
    trivial.visitedOrder = {nodeKey("A")};
    trivial.visitedCount = 1;
    SearchPlayback playback(trivial);

    EXPECT_EQ(playback.totalSegments(), 0);
    EXPECT_TRUE(playback.stepPath());

    auto frame = playback.frame();
    ASSERT_TRUE(frame.start.has_value());
    ASSERT_TRUE(frame.goal.has_value());
    EXPECT_EQ(*frame.start, nodeKey("A"));
    EXPECT_EQ(*frame.goal, nodeKey("A"));
}

TEST_F(SearchPlaybackTest, EmptyPath_IsAlreadyFinished) {
    SearchResult none;
    none.visitedOrder = {nodeKey("A"), nodeKey("B")};
    none.visitedCount = 2;
    SearchPlayback playback(none);

    EXPECT_TRUE(playback.pathFinished());
    EXPECT_FALSE(playback.stepPath());
    EXPECT_FALSE(playback.frame().start.has_value());
}

// =============================================================================
// Timer pacing
// =============================================================================

TEST_F(SearchPlaybackTest, Advance_PathModeUsesFullInterval) {
    SearchPlayback playback(result_, PlaybackOptions::normal());
    playback.setMode(PlaybackMode::Path);

    EXPECT_EQ(playback.advance(199), 0);
    EXPECT_EQ(playback.revealedSegments(), 0);

    EXPECT_EQ(playback.advance(1), 1);
    EXPECT_EQ(playback.revealedSegments(), 1);

    // Second segment and endpoints are both due
    EXPECT_EQ(playback.advance(450), 2);
    EXPECT_TRUE(playback.pathFinished());

    EXPECT_EQ(playback.advance(1000), 0);
}

TEST_F(SearchPlaybackTest, Advance_VisitModeUsesHalfInterval) {
    SearchPlayback playback(result_, PlaybackOptions::normal());
    playback.setMode(PlaybackMode::Visits);

    EXPECT_EQ(playback.advance(250), 2);
    EXPECT_EQ(playback.visitCursor(), 2);
    EXPECT_EQ(playback.revealedSegments(), 0);

    // Leftover 50 ms carries into the next call
    EXPECT_EQ(playback.advance(50), 1);
    EXPECT_EQ(playback.visitCursor(), 3);
}

TEST_F(SearchPlaybackTest, SetMode_DropsPartialInterval) {
    SearchPlayback playback(result_, PlaybackOptions::normal());
    playback.setMode(PlaybackMode::Visits);
    playback.advance(90);

    playback.setMode(PlaybackMode::Visits);
    EXPECT_EQ(playback.advance(90), 0);
}

TEST_F(SearchPlaybackTest, Advance_HugeElapsedTimeFinishesOnce) {
    constexpr int LONG_PAUSE = std::numeric_limits<int>::max();

    SearchPlayback playback(result_, PlaybackOptions::normal());
    playback.setMode(PlaybackMode::Path);
    playback.stepPath();

    EXPECT_EQ(playback.advance(LONG_PAUSE), 2);
    EXPECT_TRUE(playback.pathFinished());

    playback.setMode(PlaybackMode::Visits);
    playback.stepVisit();
    EXPECT_EQ(playback.advance(LONG_PAUSE - 1), 3);
    EXPECT_TRUE(playback.visitsFinished());
    EXPECT_EQ(playback.advance(LONG_PAUSE), 0);
}

TEST_F(SearchPlaybackTest, Advance_IgnoresNonPositiveTime) {
    SearchPlayback playback(result_);
    EXPECT_EQ(playback.advance(0), 0);
    EXPECT_EQ(playback.advance(-500), 0);
}

TEST_F(SearchPlaybackTest, Reset_RewindsEverything) {
    SearchPlayback playback(result_);
    playback.stepVisit();
    while (playback.stepPath()) {}

    playback.reset();

    EXPECT_EQ(playback.visitCursor(), 0);
    EXPECT_EQ(playback.revealedSegments(), 0);
    EXPECT_FALSE(playback.endpointsMarked());
}

TEST_F(SearchPlaybackTest, Load_ReplacesResult) {
    SearchPlayback playback(result_);
    playback.stepVisit();

    SearchResult other;
    other.path = {nodeKey(1), nodeKey(2)};
    other.visitedOrder = {nodeKey(1), nodeKey(2)};
    other.visitedCount = 2;
    other.distance = 1;
    playback.load(other);

    EXPECT_EQ(playback.visitCursor(), 0);
    EXPECT_EQ(playback.totalSegments(), 1);
}

// =============================================================================
// Frames
// =============================================================================

TEST_F(SearchPlaybackTest, Frame_ReflectsCursors) {
    SearchPlayback playback(result_);
    playback.stepVisit();
    playback.stepPath();

    auto frame = playback.frame();

    ASSERT_EQ(frame.visited.size(), 1);
    EXPECT_EQ(frame.visited[0], nodeKey("A"));

    ASSERT_EQ(frame.pathSegments.size(), 1);
    EXPECT_EQ(frame.pathSegments[0].first, nodeKey("A"));
    EXPECT_EQ(frame.pathSegments[0].second, nodeKey("B"));
    ASSERT_EQ(frame.pathNodes.size(), 1);
    EXPECT_EQ(frame.pathNodes[0], nodeKey("A"));

    EXPECT_FALSE(frame.start.has_value());
    EXPECT_FALSE(frame.goal.has_value());
}

TEST_F(SearchPlaybackTest, Frame_FinishedPathMarksEndpoints) {
    SearchPlayback playback(result_);
    while (playback.stepPath()) {}

    auto frame = playback.frame();

    EXPECT_EQ(frame.pathSegments.size(), 2);
    ASSERT_TRUE(frame.start.has_value());
    ASSERT_TRUE(frame.goal.has_value());
    EXPECT_EQ(*frame.start, nodeKey("A"));
    EXPECT_EQ(*frame.goal, nodeKey("C"));
}
