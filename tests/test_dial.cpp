#include <gtest/gtest.h>
#include <entities/dial_indicator.hpp>
#include <entities/primitives.hpp>
#include <numbers>
#include <stdexcept>

using namespace animatic;

namespace {

// Part whose top surface is the line y = 0
NodeTree flat_part() {
    return make_polygon({{-5.0, -1.0, 0.0}, {5.0, -1.0, 0.0}, {5.0, 0.0, 0.0}, {-5.0, 0.0, 0.0}});
}

}  // namespace

TEST(DialIndicatorTest, FreshDialReadsZero) {
    NodeTree dial = make_dial_indicator(1.0);
    const shape::Dial& state = dial::state(dial);
    EXPECT_DOUBLE_EQ(state.readout, 0.0);
    EXPECT_DOUBLE_EQ(state.min_swept, 0.0);
    EXPECT_DOUBLE_EQ(state.max_swept, 0.0);
    EXPECT_FALSE(state.highlight_show);
    EXPECT_FALSE(dial.node(state.wedge).visible);
    EXPECT_TRUE(dial.node(state.plunger).visible);
}

TEST(DialIndicatorTest, RejectsBadConstruction) {
    EXPECT_THROW(make_dial_indicator(0.0), std::invalid_argument);
    EXPECT_THROW(make_dial_indicator(1.0, {.readout_scale = 0.0}), std::invalid_argument);
}

TEST(DialIndicatorTest, DeflectionMovesNeedleAndPlunger) {
    NodeTree dial = make_dial_indicator(1.0);
    dial::set_deflection(dial, 0.25);

    const shape::Dial& state = dial::state(dial);
    EXPECT_NEAR(state.readout, 25.0, 1e-9);
    EXPECT_EQ(dial.node(state.plunger).position, Vec3(0.0, 0.25, 0.0));

    // Quarter turn clockwise: the needle's i axis points down
    Vec3 i = dial.node(state.needle).orientation.cols[0];
    EXPECT_NEAR(i.x, 0.0, 1e-12);
    EXPECT_NEAR(i.y, -1.0, 1e-12);
}

TEST(DialIndicatorTest, ClockwiseMoveExtendsMinimum) {
    NodeTree dial = make_dial_indicator(1.0);
    dial::set_deflection(dial, 0.25);

    const shape::Dial& state = dial::state(dial);
    EXPECT_NEAR(state.min_swept, 25.0, 1e-9);
    EXPECT_DOUBLE_EQ(state.max_swept, 0.0);

    const auto& wedge = std::get<shape::Wedge>(dial.node(state.wedge).shape);
    EXPECT_NEAR(wedge.start_angle, 0.0, 1e-12);
    EXPECT_NEAR(wedge.end_angle, std::numbers::pi / 2.0, 1e-12);
}

TEST(DialIndicatorTest, ReadoutInsideRangeKeepsRange) {
    NodeTree dial = make_dial_indicator(1.0);
    dial::set_deflection(dial, 0.25);
    dial::set_deflection(dial, 0.10);

    const shape::Dial& state = dial::state(dial);
    EXPECT_NEAR(state.readout, 10.0, 1e-9);
    EXPECT_NEAR(state.min_swept, 25.0, 1e-9);
    EXPECT_DOUBLE_EQ(state.max_swept, 0.0);
    EXPECT_EQ(dial::check_min_max(state), 0);
}

TEST(DialIndicatorTest, ReadoutWrapsPastFullTurn) {
    NodeTree dial = make_dial_indicator(1.0);
    dial::set_deflection(dial, 1.3);
    EXPECT_NEAR(dial::state(dial).readout, 30.0, 1e-9);

    dial::set_deflection(dial, -0.1);
    EXPECT_NEAR(dial::state(dial).readout, 90.0, 1e-9);
}

TEST(DialIndicatorTest, ReadoutScale) {
    NodeTree dial = make_dial_indicator(1.0, {.readout_scale = 2.0});
    dial::set_deflection(dial, 0.5);
    EXPECT_NEAR(dial::state(dial).readout, 25.0, 1e-9);
}

TEST(DialIndicatorTest, ResetHighlightCollapsesRange) {
    NodeTree dial = make_dial_indicator(1.0);
    dial::set_deflection(dial, 0.25);
    dial::set_deflection(dial, 0.40);
    dial::reset_highlight(dial);

    const shape::Dial& state = dial::state(dial);
    EXPECT_DOUBLE_EQ(state.min_swept, state.readout);
    EXPECT_DOUBLE_EQ(state.max_swept, state.readout);
}

TEST(DialIndicatorTest, DisplayToggles) {
    NodeTree dial = make_dial_indicator(1.0);
    const shape::Dial& state = dial::state(dial);

    dial::display_highlight(dial, true);
    EXPECT_TRUE(dial::state(dial).highlight_show);
    EXPECT_TRUE(dial.node(state.wedge).visible);
    EXPECT_TRUE(dial.node(state.min_line).visible);
    EXPECT_TRUE(dial.node(state.max_line).visible);

    dial::display_highlight(dial, false);
    EXPECT_FALSE(dial.node(state.wedge).visible);

    dial::display_plunger(dial, false);
    EXPECT_FALSE(dial.node(state.plunger).visible);
}

TEST(DialIndicatorTest, HighlightAttributeMirrorsState) {
    NodeTree dial = make_dial_indicator(1.0, {.highlight_show = true});
    EXPECT_TRUE(std::get<bool>(dial.get_attribute(NodeTree::kRoot, "highlight_show")));
    dial::set_deflection(dial, 0.25);
    EXPECT_NEAR(std::get<double>(dial.get_attribute(NodeTree::kRoot, "readout")), 25.0, 1e-9);
}

TEST(DialIndicatorTest, TrackRestsTipOnSurface) {
    NodeTree dial = make_dial_indicator(1.0, {}, {.position = {0.0, 1.0, 0.0}});
    dial::track(dial, flat_part());
    EXPECT_NEAR(dial::state(dial).deflection, dial::kTrackScale - 1.0, 1e-9);
}

TEST(DialIndicatorTest, TrackOutOfReachIsFullyExtended) {
    NodeTree dial = make_dial_indicator(1.0, {}, {.position = {0.0, 2.0, 0.0}});
    dial::track(dial, flat_part());
    EXPECT_DOUBLE_EQ(dial::state(dial).deflection, 0.0);

    // Nothing below the tip at all
    NodeTree beside = make_dial_indicator(1.0, {}, {.position = {20.0, 1.0, 0.0}});
    dial::track(beside, flat_part());
    EXPECT_DOUBLE_EQ(dial::state(beside).deflection, 0.0);
}

TEST(DialIndicatorTest, TrackFollowsMovedPart) {
    NodeTree dial = make_dial_indicator(1.0, {}, {.position = {0.0, 1.0, 0.0}});
    NodeTree part = flat_part();
    part.move(NodeTree::kRoot, MoveSpec{.delta_position = Vec3(0.0, 0.2, 0.0)});
    dial::track(dial, part);
    EXPECT_NEAR(dial::state(dial).deflection, dial::kTrackScale - 0.8, 1e-9);
}

TEST(DialIndicatorTest, WorksWhenNestedInGroup) {
    NodeTree group = make_group();
    NodeId id = group.attach(NodeTree::kRoot, make_dial_indicator(1.0));
    dial::set_deflection(group, 0.25, id);

    const shape::Dial& state = dial::state(group, id);
    EXPECT_NEAR(state.readout, 25.0, 1e-9);
    EXPECT_EQ(group.node(state.plunger).position, Vec3(0.0, 0.25, 0.0));
    EXPECT_EQ(*group.node(state.plunger).parent, id);
}

TEST(DialIndicatorTest, RejectsOtherKinds) {
    NodeTree group = make_group();
    EXPECT_THROW(dial::state(group), std::invalid_argument);
    EXPECT_THROW(dial::set_deflection(group, 0.1), std::invalid_argument);
}
