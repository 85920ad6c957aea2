#include <gtest/gtest.h>
#include <bpmn_layout/coordinate_normalizer.hpp>

using namespace bpmn_layout;

TEST(CoordinateNormalizerTest, EmptyInputGivesEmptyOutput) {
    EXPECT_TRUE(normalize_positions({}, true, true).empty());
}

TEST(CoordinateNormalizerTest, TranslatesMinimumToMargin) {
    const PositionMap raw{ { "a", { 10, 20 } }, { "b", { 30, 60 } } };
    const PositionMap p = normalize_positions(raw, false, false);

    EXPECT_DOUBLE_EQ(p.at("a").x, 50);
    EXPECT_DOUBLE_EQ(p.at("a").y, 50);
    EXPECT_DOUBLE_EQ(p.at("b").x, 70);
    EXPECT_DOUBLE_EQ(p.at("b").y, 90);
}

TEST(CoordinateNormalizerTest, FlipsAndScalesToolOutput) {
    const PositionMap raw{ { "a", { 1, 2 } }, { "b", { 3, 0 } } };
    const PositionMap p = normalize_positions(raw, true, true);

    EXPECT_DOUBLE_EQ(p.at("a").x, 50);
    EXPECT_DOUBLE_EQ(p.at("a").y, 50);
    EXPECT_DOUBLE_EQ(p.at("b").x, 250);
    EXPECT_DOUBLE_EQ(p.at("b").y, 250);
}

TEST(CoordinateNormalizerTest, FlipKeepsHigherRawYAbove) {
    const PositionMap raw{ { "top", { 0, 5 } }, { "bottom", { 0, 1 } } };
    const PositionMap p = normalize_positions(raw, true, false);

    EXPECT_LT(p.at("top").y, p.at("bottom").y);
}
