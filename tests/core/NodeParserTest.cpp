#include <gtest/gtest.h>
#include <pathviz/core/NodeParser.h>

using namespace pathviz;

TEST(NodeParserTest, Integer) {
    EXPECT_EQ(parseNodeKey("7"), nodeKey(7));
    EXPECT_EQ(parseNodeKey("  -3 "), nodeKey(-3));
    EXPECT_EQ(parseNodeKey("+15"), nodeKey(15));
}

TEST(NodeParserTest, IntegerOverflow_FallsBackToString) {
    EXPECT_EQ(parseNodeKey("99999999999999999999"), nodeKey("99999999999999999999"));
}

TEST(NodeParserTest, GridCell) {
    EXPECT_EQ(parseNodeKey("(0, 0)"), nodeKey(0, 0));
    EXPECT_EQ(parseNodeKey("(2,3)"), nodeKey(2, 3));
    EXPECT_EQ(parseNodeKey("  ( 5 ,  4 )  "), nodeKey(5, 4));
    EXPECT_EQ(parseNodeKey("(-1, 2)"), nodeKey(-1, 2));
}

TEST(NodeParserTest, MalformedCell_IsRawString) {
    EXPECT_EQ(parseNodeKey("(1, 2, 3)"), nodeKey("(1, 2, 3)"));
    EXPECT_EQ(parseNodeKey("(1, 2,)"), nodeKey("(1, 2,)"));
    EXPECT_EQ(parseNodeKey("(1.5, 2)"), nodeKey("(1.5, 2)"));
    EXPECT_EQ(parseNodeKey("(1 2)"), nodeKey("(1 2)"));
}

TEST(NodeParserTest, QuotedString) {
    EXPECT_EQ(parseNodeKey("'Gate'"), nodeKey("Gate"));
    EXPECT_EQ(parseNodeKey("\"L0\""), nodeKey("L0"));
    // Quoted digits stay a name
    EXPECT_EQ(parseNodeKey("'12'"), nodeKey("12"));
}

TEST(NodeParserTest, BareName) {
    EXPECT_EQ(parseNodeKey("Library"), nodeKey("Library"));
    EXPECT_EQ(parseNodeKey("  Hostel\t"), nodeKey("Hostel"));
    EXPECT_EQ(parseNodeKey("1.5"), nodeKey("1.5"));
    EXPECT_EQ(parseNodeKey(""), nodeKey(""));
}

TEST(NodeParserTest, ExpressionsAreNeverEvaluated) {
    EXPECT_EQ(parseNodeKey("1+1"), nodeKey("1+1"));
    EXPECT_EQ(parseNodeKey("__import__('os')"), nodeKey("__import__('os')"));
}
