#include <gtest/gtest.h>
#include <bpmn_layout/position_resolver.hpp>
#include "TestModels.hpp"
#include <set>
#include <system_error>
#include <tuple>
#include <utility>

using namespace bpmn_layout;
using namespace bpmn_layout::testing;

namespace {

class ThrowingEngine : public ExternalLayoutEngine {
public:
    explicit ThrowingEngine(bool system) : system_(system) {}

    RawLayout compute(const FlowGraph&, const SizeMap&, Direction) const override {
        ++calls;
        if (system_) throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory), "spawn");
        throw ExternalLayoutError("dot exited with status 1");
    }

    mutable int calls = 0;

private:
    bool system_;
};

// Returns a fixed raw layout (inches, Y up).
class FixedEngine : public ExternalLayoutEngine {
public:
    explicit FixedEngine(PositionMap positions) : positions_(std::move(positions)) {}

    RawLayout compute(const FlowGraph&, const SizeMap&, Direction) const override {
        ++calls;
        RawLayout raw;
        raw.positions = positions_;
        return raw;
    }

    mutable int calls = 0;

private:
    PositionMap positions_;
};

void expect_complete(const bpmn_model::Model& m) {
    for (const auto& s : m.shapes) {
        EXPECT_TRUE(s.has_position()) << s.id;
        EXPECT_TRUE(s.has_size()) << s.id;
    }
    for (const auto& p : m.pools) {
        EXPECT_TRUE(p.has_position()) << p.id;
        EXPECT_TRUE(p.has_size()) << p.id;
    }
}

} // namespace

class PositionResolverTest : public ::testing::Test {
protected:
    bpmn_model::Model model;

    void chain(const std::vector<std::string>& ids) {
        for (const auto& id : ids)
            model.shapes.push_back(shape(id));
        for (std::size_t i = 1; i < ids.size(); ++i)
            model.connectors.push_back(flow(ids[i - 1], ids[i]));
    }

    bpmn_model::Pool& add_pool(const std::string& id) {
        bpmn_model::Pool p;
        p.id = id;
        model.pools.push_back(p);
        return model.pools.back();
    }

    static const bpmn_model::Shape& get(const bpmn_model::Model& m, const std::string& id) { return *m.find_shape(id); }
};

TEST_F(PositionResolverTest, EmptyModelResolvesToEmptyModel) {
    const auto out = resolve_positions(model);
    EXPECT_TRUE(out.shapes.empty());
    EXPECT_TRUE(out.pools.empty());
}

TEST_F(PositionResolverTest, ChainWithoutEngineFlowsLeftToRight) {
    chain({ "start", "task", "end" });
    model.shapes[0].type = "startEvent";
    model.shapes[2].type = "endEvent";
    const auto out = resolve_positions(model);

    expect_complete(out);
    EXPECT_LT(*get(out, "start").x, *get(out, "task").x);
    EXPECT_LT(*get(out, "task").x, *get(out, "end").x);
    for (const auto& s : out.shapes)
        EXPECT_GE(*s.y, 0);
    EXPECT_DOUBLE_EQ(*get(out, "start").width, 36);
    EXPECT_DOUBLE_EQ(*get(out, "task").width, 120);
}

TEST_F(PositionResolverTest, TopToBottomDirection) {
    chain({ "a", "b" });
    LayoutOptions options;
    options.direction = Direction::TopToBottom;
    const auto out = resolve_positions(model, options);

    EXPECT_LT(*get(out, "a").y, *get(out, "b").y);
}

TEST_F(PositionResolverTest, FanOutGivesDistinctPositions) {
    model.shapes.push_back(shape("start", "startEvent"));
    for (int i = 0; i < 10; ++i) {
        const std::string id = "branch" + std::to_string(i);
        model.shapes.push_back(shape(id));
        model.connectors.push_back(flow("start", id));
    }
    const auto out = resolve_positions(model);

    std::set<std::pair<double, double>> seen;
    for (const auto& s : out.shapes)
        seen.insert({ *s.x, *s.y });
    EXPECT_EQ(seen.size(), out.shapes.size());
}

TEST_F(PositionResolverTest, InputIsNotModifiedAndResultIsStable) {
    chain({ "a", "b", "c" });
    model.shapes.push_back(shape("loose"));
    add_pool("P");
    const auto first = resolve_positions(model);
    const auto second = resolve_positions(model);

    for (const auto& s : model.shapes) {
        EXPECT_FALSE(s.x.has_value());
        EXPECT_FALSE(s.width.has_value());
    }
    EXPECT_FALSE(model.pools[0].has_position());
    ASSERT_EQ(first.shapes.size(), second.shapes.size());
    for (std::size_t i = 0; i < first.shapes.size(); ++i) {
        EXPECT_EQ(first.shapes[i].x, second.shapes[i].x);
        EXPECT_EQ(first.shapes[i].y, second.shapes[i].y);
        EXPECT_EQ(first.shapes[i].parent_id, second.shapes[i].parent_id);
    }
}

TEST_F(PositionResolverTest, FailingEngineFallsBack) {
    chain({ "a", "b" });
    for (bool system : { false, true }) {
        const ThrowingEngine engine(system);
        const auto out = resolve_positions(model, {}, &engine);

        EXPECT_EQ(engine.calls, 1);
        expect_complete(out);
        EXPECT_LT(*get(out, "a").x, *get(out, "b").x);
    }
}

TEST_F(PositionResolverTest, EngineOutputIsFlippedAndScaled) {
    chain({ "a", "b" });
    const FixedEngine engine({ { "a", { 0, 1 } }, { "b", { 2, 1 } } });
    const auto out = resolve_positions(model, {}, &engine);

    EXPECT_DOUBLE_EQ(*get(out, "a").x, 50);
    EXPECT_DOUBLE_EQ(*get(out, "a").y, 50);
    EXPECT_DOUBLE_EQ(*get(out, "b").x, 250);
    EXPECT_DOUBLE_EQ(*get(out, "b").y, 50);
}

TEST_F(PositionResolverTest, PartialEngineOutputIsCompleted) {
    chain({ "a", "b", "c" });
    const FixedEngine engine({ { "a", { 0, 1 } }, { "ghost", { 9, 9 } } });
    const auto out = resolve_positions(model, {}, &engine);

    expect_complete(out);
    EXPECT_LT(*get(out, "a").x, *get(out, "b").x);
    EXPECT_DOUBLE_EQ(*get(out, "b").x, *get(out, "c").x);
    EXPECT_NE(*get(out, "b").y, *get(out, "c").y);
}

TEST_F(PositionResolverTest, EngineSkippedWhenCoordinatesExist) {
    chain({ "a", "b" });
    model.shapes[0].x = 100;
    model.shapes[0].y = 100;
    const ThrowingEngine engine(false);
    const auto out = resolve_positions(model, {}, &engine);

    EXPECT_EQ(engine.calls, 0);
    EXPECT_DOUBLE_EQ(*get(out, "a").x, 100);
    // Right of "a" would leave the diagram bounds, so "b" wraps below it.
    EXPECT_DOUBLE_EQ(*get(out, "b").x, 100);
    EXPECT_DOUBLE_EQ(*get(out, "b").y, 260);
}

TEST_F(PositionResolverTest, EngineSkippedInPreserveMode) {
    chain({ "a", "b" });
    LayoutOptions options;
    options.mode = LayoutMode::Preserve;
    const ThrowingEngine engine(false);
    const auto out = resolve_positions(model, options, &engine);

    EXPECT_EQ(engine.calls, 0);
    expect_complete(out);
}

TEST_F(PositionResolverTest, ExplicitFlagSkipsWholeModelLayout) {
    chain({ "a", "b" });
    model.has_explicit_coordinates = true;
    const ThrowingEngine engine(false);
    const auto out = resolve_positions(model, {}, &engine);

    EXPECT_EQ(engine.calls, 0);
    expect_complete(out);
}

TEST_F(PositionResolverTest, MixedModelGetsEveryPosition) {
    chain({ "a", "b", "c" });
    model.shapes[1].x = 400;
    model.shapes[1].y = 200;
    model.shapes.push_back(shape("doc", "dataObject"));
    model.shapes.push_back(shape("orphan"));
    model.connectors.push_back(flow("a", "ghost"));
    const auto out = resolve_positions(model);

    expect_complete(out);
    EXPECT_DOUBLE_EQ(*get(out, "b").x, 400);
    EXPECT_DOUBLE_EQ(*get(out, "b").y, 200);
    const auto box = [&out](const std::string& id) {
        const auto& s = get(out, id);
        return Rect{ *s.x, *s.y, *s.width, *s.height };
    };
    EXPECT_FALSE(intersects(box("a"), box("b")));
    EXPECT_FALSE(intersects(box("c"), box("b")));
    EXPECT_LT(*get(out, "a").y, *get(out, "b").y);
    EXPECT_GT(*get(out, "c").y, *get(out, "b").y);
    EXPECT_DOUBLE_EQ(*get(out, "doc").x, 320);
}

TEST_F(PositionResolverTest, UnpositionedPoolsAreStacked) {
    model.shapes = { shape("a") };
    add_pool("p1");
    add_pool("p2");
    const auto out = resolve_positions(model);

    expect_complete(out);
    EXPECT_DOUBLE_EQ(*out.pools[0].x, 50);
    EXPECT_DOUBLE_EQ(*out.pools[0].y, 50);
    EXPECT_DOUBLE_EQ(*out.pools[1].y, 300);
}

TEST_F(PositionResolverTest, NewPoolGoesBelowPositionedPool) {
    auto& p1 = add_pool("p1");
    p1.x = 100;
    p1.y = 100;
    p1.width = 600;
    p1.height = 300;
    add_pool("p2");
    const auto out = resolve_positions(model);

    EXPECT_DOUBLE_EQ(*out.pools[1].x, 100);
    EXPECT_DOUBLE_EQ(*out.pools[1].y, 450);
    EXPECT_DOUBLE_EQ(*out.pools[0].height, 300);
}

TEST_F(PositionResolverTest, PoolHeightIsSumOfLaneHeights) {
    chain({ "a", "b", "c" });
    add_pool("P").lane_ids = { "l1", "l2" };
    for (const char* id : { "l1", "l2" }) {
        bpmn_model::Lane l;
        l.id = id;
        l.pool_id = "P";
        model.lanes.push_back(l);
    }
    model.lanes[0].member_ids = { "a", "b", "c" };
    const auto out = resolve_positions(model);

    const auto* l1 = out.find_lane("l1");
    const auto* l2 = out.find_lane("l2");
    EXPECT_DOUBLE_EQ(*l1->height, 140);
    EXPECT_DOUBLE_EQ(*l2->height, 120);
    EXPECT_DOUBLE_EQ(*l2->y, 140);
    EXPECT_DOUBLE_EQ(*out.find_pool("P")->height, 260);
    for (const auto& s : out.shapes) {
        EXPECT_EQ(s.parent_id, std::optional<std::string>("l1"));
        EXPECT_GE(*s.y, 0);
        EXPECT_LE(*s.y + *s.height, *l1->height);
    }
}

TEST_F(PositionResolverTest, CyclesAndSelfLoopsTerminate) {
    chain({ "a", "b", "c" });
    model.connectors.push_back(flow("c", "a"));
    model.shapes.push_back(shape("d"));
    model.connectors.push_back(flow("d", "d"));
    const auto out = resolve_positions(model);

    expect_complete(out);
}

TEST_F(PositionResolverTest, IdenticalBoxesAreSeparated) {
    model.shapes = { positioned("a", 100, 100), positioned("b", 100, 100), positioned("c", 100, 100) };
    const auto out = resolve_positions(model);

    std::set<std::pair<double, double>> seen;
    for (const auto& s : out.shapes)
        seen.insert({ *s.x, *s.y });
    EXPECT_EQ(seen.size(), 3u);
}

TEST_F(PositionResolverTest, SubContainerChildrenStayInside) {
    model.shapes = { placed("sub", 100, 100, 200, 150, "subProcess"), shape("child") };
    model.shapes[1].sub_container_id = "sub";
    const auto out = resolve_positions(model);

    const auto& child = get(out, "child");
    EXPECT_EQ(child.parent_id, std::optional<std::string>("sub"));
    EXPECT_GE(*child.x, 0);
    EXPECT_GE(*child.y, 0);
    EXPECT_LE(*child.x + *child.width, 200);
    EXPECT_LE(*child.y + *child.height, 150 - 26);
}

TEST_F(PositionResolverTest, ManyChainedSubContainerChildrenNeverShareABox) {
    model.shapes = { shape("start", "startEvent"), shape("sub", "subProcess") };
    model.connectors = { flow("start", "sub") };
    for (int i = 0; i < 16; ++i) {
        const std::string id = "c" + std::to_string(i);
        model.shapes.push_back(shape(id));
        model.shapes.back().sub_container_id = "sub";
        if (i > 0) model.connectors.push_back(flow("c" + std::to_string(i - 1), id));
    }
    const auto out = resolve_positions(model);

    std::set<std::tuple<std::string, double, double, double, double>> boxes;
    for (const auto& s : out.shapes)
        boxes.insert({ s.parent_id.value_or(""), *s.x, *s.y, *s.width, *s.height });
    EXPECT_EQ(boxes.size(), out.shapes.size());
    for (const auto& s : out.shapes) {
        if (s.parent_id != std::optional<std::string>("sub")) continue;
        EXPECT_GE(*s.x, 0) << s.id;
        EXPECT_GE(*s.y, 0) << s.id;
        EXPECT_LE(*s.x + *s.width, 200) << s.id;
        EXPECT_LE(*s.y + *s.height, 150 - 26) << s.id;
    }
}

TEST_F(PositionResolverTest, PreserveModeIsRepeatable) {
    model.has_explicit_coordinates = true;
    model.shapes = { placed("a", 210, 120, 120, 80) };
    auto& pool = add_pool("P");
    pool.x = 100;
    pool.y = 100;
    pool.width = 600;
    pool.height = 300;
    pool.lane_ids = { "L" };
    bpmn_model::Lane lane;
    lane.id = "L";
    lane.pool_id = "P";
    lane.x = 140;
    lane.y = 100;
    lane.width = 560;
    lane.height = 300;
    lane.member_ids = { "a" };
    model.lanes.push_back(lane);
    LayoutOptions options;
    options.mode = LayoutMode::Preserve;

    const auto first = resolve_positions(model, options);
    const auto second = resolve_positions(model, options);

    for (const auto* out : { &first, &second }) {
        const auto& a = get(*out, "a");
        EXPECT_DOUBLE_EQ(*a.x, 70);
        EXPECT_DOUBLE_EQ(*a.y, 20);
        EXPECT_EQ(a.parent_id, std::optional<std::string>("L"));
        EXPECT_DOUBLE_EQ(*out->find_lane("L")->x, 40);
        EXPECT_DOUBLE_EQ(*out->find_lane("L")->y, 0);
    }
}

TEST_F(PositionResolverTest, ResolverKeepsItsOptions) {
    LayoutOptions options;
    options.direction = Direction::BottomToTop;
    const PositionResolver resolver(options);
    EXPECT_EQ(resolver.options().direction, Direction::BottomToTop);
}
