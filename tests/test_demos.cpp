#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include <demos/dial_inspection.hpp>
#include <demos/flatness_roll.hpp>
#include <entities/dial_indicator.hpp>
#include <geometry/flatness.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace animatic;

namespace {

// Wavy profile over the 6 mm part, heights within 0.5 mm
std::vector<Vec2> wavy_profile() {
    std::vector<Vec2> points;
    for (int i = 0; i <= 24; ++i) {
        double x = 0.25 * i;
        points.push_back({x, 0.25 + 0.2 * std::sin(1.3 * x) + 0.03 * std::cos(7.0 * x)});
    }
    return points;
}

}  // namespace

TEST(FlatnessRollTest, LinesFollowRollSteps) {
    std::vector<Vec2> points = wavy_profile();
    FlatnessResult result = min_zone_flatness(points);
    ASSERT_FALSE(result.steps.empty());

    FlatnessDemoConfig config;
    config.cycle = false;
    Scene scene = build_flatness_roll(points, result, config, test::small_scene());

    EXPECT_EQ(scene.aliases(), (std::vector<std::string>{"points", "lower", "upper", "label"}));
    EXPECT_EQ(scene.entity("points").root().children.size(), points.size());

    // 0.15 s per step at 10 fps is one frame per step
    const int steps = static_cast<int>(result.steps.size());
    scene.seek(steps);
    const FlatnessStep& last = result.steps.back();
    EXPECT_EQ(scene.entity("lower").root().position, last.p0.to_vec3());
    EXPECT_EQ(scene.entity("upper").root().position, last.p1.to_vec3());
    EXPECT_EQ(std::get<Vec3>(scene.entity("lower").get_attribute(NodeTree::kRoot, "slope")),
              last.slope.to_vec3());

    scene.seek(scene.last_frame() + 1);
    EXPECT_DOUBLE_EQ(scene.entity("label").root().opacity, 1.0);
}

TEST(FlatnessRollTest, CycleReturnsToFirstStep) {
    std::vector<Vec2> points = wavy_profile();
    FlatnessResult result = min_zone_flatness(points);
    Scene scene = build_flatness_roll(points, result, {}, test::small_scene());

    scene.seek(2 * static_cast<int>(result.steps.size()));
    EXPECT_EQ(scene.entity("lower").root().position, result.steps.front().p0.to_vec3());
}

TEST(FlatnessRollTest, RejectsEmptyResult) {
    EXPECT_THROW(build_flatness_roll(wavy_profile(), FlatnessResult{}, {}, test::small_scene()),
                 std::invalid_argument);
}

TEST(DialInspectionTest, PartPolygon) {
    DialDemoConfig config;
    NodeTree part = make_inspected_part(wavy_profile(), config);
    EXPECT_EQ(part.root().children.size(), wavy_profile().size() + 2);
    EXPECT_DOUBLE_EQ(part.root().opacity, 0.0);
    EXPECT_EQ(part.node(part.root().children[0]).position,
              Vec3(config.part_width + config.part_extension, -config.part_thickness, 0.0));

    EXPECT_THROW(make_inspected_part({{0.0, 0.0}}, config), std::invalid_argument);
}

TEST(DialInspectionTest, ShowsComputedFlatness) {
    std::vector<Vec2> profile = wavy_profile();
    Scene scene = build_dial_inspection(profile, {}, test::small_scene());

    std::ostringstream expected;
    expected << std::fixed << std::setprecision(2) << min_zone_flatness(profile).flatness;
    EXPECT_EQ(std::get<std::string>(scene.entity("flat_dim_text").get_attribute(NodeTree::kRoot, "text")),
              expected.str());
}

TEST(DialInspectionTest, TraversalSweepsReadoutRange) {
    Scene scene = build_dial_inspection(wavy_profile(), {}, test::small_scene());

    // Mid-way through the recorded traversal
    scene.seek(400);
    const shape::Dial& state = dial::state(scene.entity("dial"));
    EXPECT_TRUE(state.highlight_show);
    EXPECT_GT(state.deflection, 0.0);
    EXPECT_GT(std::abs(state.max_swept - state.min_swept), 1.0);
}

TEST(DialInspectionTest, ReplaysToTheEnd) {
    Scene scene = build_dial_inspection(wavy_profile(), {}, test::small_scene());
    EXPECT_NO_THROW(scene.seek(scene.last_frame() + 1));
    EXPECT_FALSE(scene.entity("poly").root().visible);
}
