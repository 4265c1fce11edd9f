#include <gtest/gtest.h>
#include <pathviz/core/CanvasTransform.h>

using namespace pathviz;

TEST(CanvasTransformTest, EmptyPositions_NoTransform) {
    Graph graph;
    graph.addUndirectedEdge(nodeKey("A"), nodeKey("B"));

    EXPECT_FALSE(CanvasTransform::fit(graph, 600, 600, 40).has_value());
}

TEST(CanvasTransformTest, HorizontalSpan_FitsWidth) {
    Graph graph;
    graph.setPosition(nodeKey("A"), {0.0, 0.0});
    graph.setPosition(nodeKey("B"), {10.0, 0.0});

    auto t = CanvasTransform::fit(graph, 600, 600, 40);
    ASSERT_TRUE(t.has_value());
    EXPECT_DOUBLE_EQ(t->scale, 52.0);

    Point a = t->toCanvas({0.0, 0.0});
    Point b = t->toCanvas({10.0, 0.0});
    EXPECT_DOUBLE_EQ(a.x, 40.0);
    EXPECT_DOUBLE_EQ(a.y, 560.0);
    EXPECT_DOUBLE_EQ(b.x, 560.0);
    EXPECT_DOUBLE_EQ(b.y, 560.0);
}

TEST(CanvasTransformTest, YAxisIsFlipped) {
    Graph graph;
    graph.setPosition(nodeKey("low"), {0.0, 0.0});
    graph.setPosition(nodeKey("high"), {0.0, 10.0});

    auto t = CanvasTransform::fit(graph, 600, 600, 40);
    ASSERT_TRUE(t.has_value());

    EXPECT_GT(t->toCanvas({0.0, 0.0}).y, t->toCanvas({0.0, 10.0}).y);
    EXPECT_DOUBLE_EQ(t->toCanvas({0.0, 10.0}).y, 40.0);
}

TEST(CanvasTransformTest, SingleNode_DoesNotDivideByZero) {
    Graph graph;
    graph.setPosition(nodeKey("only"), {3.0, 4.0});

    auto t = CanvasTransform::fit(graph, 600, 400, 40);
    ASSERT_TRUE(t.has_value());

    Point p = t->toCanvas({3.0, 4.0});
    EXPECT_DOUBLE_EQ(p.x, 40.0);
    EXPECT_DOUBLE_EQ(p.y, 360.0);
}
