#include <gtest/gtest.h>
#include <bpmn_layout/swimlane_sizer.hpp>
#include "TestModels.hpp"

using namespace bpmn_layout;
using namespace bpmn_layout::testing;

namespace {

bpmn_model::Pool pool_of(std::optional<double> w = std::nullopt, std::optional<double> h = std::nullopt) {
    bpmn_model::Pool p;
    p.id = "pool";
    p.width = w;
    p.height = h;
    return p;
}

bpmn_model::Lane lane(const std::string& id) {
    bpmn_model::Lane l;
    l.id = id;
    l.pool_id = "pool";
    return l;
}

} // namespace

TEST(SwimlaneSizerTest, ExplicitPoolSizeWins) {
    const SwimlaneSizer sizer;
    const Size s = sizer.calculate_pool_size(pool_of(900, 250), { placed("a", 0, 0, 2000, 2000) });
    EXPECT_DOUBLE_EQ(s.width, 900);
    EXPECT_DOUBLE_EQ(s.height, 250);
}

TEST(SwimlaneSizerTest, PoolWrapsShapeBoundingBox) {
    const SwimlaneSizer sizer;
    const Size s = sizer.calculate_pool_size(pool_of(),
        { placed("a", 100, 100, 120, 80), placed("b", 400, 300, 120, 80), shape("unplaced") });
    EXPECT_DOUBLE_EQ(s.width, 500);
    EXPECT_DOUBLE_EQ(s.height, 320);
}

TEST(SwimlaneSizerTest, DefaultSizeWithoutPositionedShapes) {
    const SwimlaneSizer sizer;
    const Size s = sizer.calculate_pool_size(pool_of(), { shape("a") });
    EXPECT_DOUBLE_EQ(s.width, 600);
    EXPECT_DOUBLE_EQ(s.height, 200);
}

TEST(SwimlaneSizerTest, SmallContentIsFlooredAtMinimum) {
    const SwimlaneSizer sizer;
    const Size s = sizer.calculate_pool_size(pool_of(), { positioned("e", 10, 10, "startEvent") });
    EXPECT_DOUBLE_EQ(s.width, 400);
    EXPECT_DOUBLE_EQ(s.height, 150);
}

TEST(SwimlaneSizerTest, PaddingIsConfigurable) {
    const SwimlaneSizer sizer(100);
    const Size s = sizer.calculate_pool_size(pool_of(), { placed("a", 0, 0, 300, 100) });
    EXPECT_DOUBLE_EQ(s.width, 540);
    EXPECT_DOUBLE_EQ(s.height, 300);
}

TEST(SwimlaneSizerTest, LanesSplitPoolHeightEvenly) {
    const SwimlaneSizer sizer;
    const auto rects = sizer.calculate_lane_sizes(pool_of(640, 300), { lane("l1"), lane("l2"), lane("l3") });

    ASSERT_EQ(rects.size(), 3u);
    EXPECT_EQ(rects.at("l1"), (Rect{ 40, 0, 600, 100 }));
    EXPECT_EQ(rects.at("l2"), (Rect{ 40, 100, 600, 100 }));
    EXPECT_EQ(rects.at("l3"), (Rect{ 40, 200, 600, 100 }));
}

TEST(SwimlaneSizerTest, LaneWithOwnSizeKeepsIt) {
    const SwimlaneSizer sizer;
    bpmn_model::Lane sized = lane("l1");
    sized.width = 500;
    sized.height = 90;
    const auto rects = sizer.calculate_lane_sizes(pool_of(640, 300), { sized, lane("l2") });

    EXPECT_EQ(rects.at("l1"), (Rect{ 40, 0, 500, 90 }));
    EXPECT_EQ(rects.at("l2"), (Rect{ 40, 150, 600, 150 }));
}

TEST(SwimlaneSizerTest, NoLanesNoRects) {
    const SwimlaneSizer sizer;
    EXPECT_TRUE(sizer.calculate_lane_sizes(pool_of(640, 300), {}).empty());
}
