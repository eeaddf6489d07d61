#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include <animation/builders.hpp>
#include <entities/primitives.hpp>
#include <numbers>
#include <stdexcept>

using namespace animatic;
using namespace animatic::animation;

namespace {

Scene disk_scene() {
    Scene scene(test::small_scene());
    scene.register_entity("disk", make_disk(0.5));
    return scene;
}

}  // namespace

TEST(BuildersTest, FrameCount) {
    EXPECT_EQ(frame_count(1.0, 10), 10);
    EXPECT_EQ(frame_count(0.25, 10), 2);
    EXPECT_EQ(frame_count(0.0, 10), 1);
    EXPECT_EQ(frame_count(kSingleFrame, 10), 1);
}

TEST(BuildersTest, StartFrame) {
    Scene scene = disk_scene();
    EXPECT_EQ(start_frame(scene, 0.5), 5);
    EXPECT_EQ(start_frame(scene, kAppend), 0);
    EXPECT_THROW(start_frame(scene, -2.0), std::invalid_argument);
}

TEST(BuildersTest, PauseExtendsTimeline) {
    Scene scene = disk_scene();
    pause(scene, 1.0);
    EXPECT_EQ(scene.last_frame(), 10);
    pause(scene, 0.5);
    EXPECT_EQ(scene.last_frame(), 15);
}

TEST(BuildersTest, AppendStartsAtLastFrame) {
    Scene scene = disk_scene();
    pause(scene, 1.0);
    slide(scene, 0.5, "disk", {1.0, 0.0, 0.0}, Profile::Linear);

    // First sample is the starting state; steps land on the following frames
    EXPECT_EQ(scene.script().count(10), 1u);
    EXPECT_EQ(scene.last_frame(), 14);
}

TEST(BuildersTest, SlideMovesByDisplacement) {
    Scene scene(test::small_scene());
    scene.register_entity("disk", make_disk(0.5, {.position = {1.0, 1.0, 0.0}}));
    slide(scene, 1.0, "disk", {2.0, -1.0, 0.0}, Profile::Sigmoid, 0.0);

    scene.seek(scene.last_frame() + 1);
    Vec3 p = scene.entity("disk").root().position;
    EXPECT_NEAR(p.x, 3.0, 1e-12);
    EXPECT_NEAR(p.y, 0.0, 1e-12);
}

TEST(BuildersTest, SingleFrameSlideSnaps) {
    Scene scene = disk_scene();
    slide(scene, kSingleFrame, "disk", {2.0, 0.0, 0.0}, Profile::Linear, 0.3);
    ASSERT_EQ(scene.script().count(3), 1u);
    scene.seek(4);
    EXPECT_EQ(scene.entity("disk").root().position, Vec3(2.0, 0.0, 0.0));
}

TEST(BuildersTest, SlideToReachesTarget) {
    Scene scene = disk_scene();
    slide(scene, 0.5, "disk", {1.0, 0.0, 0.0}, Profile::Linear, 0.0);
    slide_to(scene, 1.0, "disk", {-2.0, 3.0, 0.0}, Profile::Sinusoid, 0.2);

    scene.seek(scene.last_frame() + 1);
    Vec3 p = scene.entity("disk").root().position;
    EXPECT_NEAR(p.x, -2.0, 1e-12);
    EXPECT_NEAR(p.y, 3.0, 1e-12);
}

TEST(BuildersTest, RotateTurnsAxes) {
    Scene scene = disk_scene();
    rotate(scene, 0.5, "disk", vec3::unit_z(), std::numbers::pi / 2.0, Profile::Linear, 0.0);
    scene.seek(scene.last_frame() + 1);

    Vec3 i = scene.entity("disk").root().orientation.cols[0];
    EXPECT_NEAR(i.x, 0.0, 1e-9);
    EXPECT_NEAR(i.y, 1.0, 1e-9);

    EXPECT_THROW(rotate(scene, 0.5, "disk", vec3::zero(), 1.0), std::invalid_argument);
}

TEST(BuildersTest, SweepAttrEndsExactly) {
    Scene scene = disk_scene();
    sweep_attr(scene, 1.0, "disk", "radius", 0.5, 1.0, Profile::Sigmoid, 0.0);

    // One sample per frame, starting on the start frame
    EXPECT_EQ(scene.last_frame(), 9);
    scene.seek(1);
    EXPECT_EQ(std::get<shape::Disk>(scene.entity("disk").root().shape).radius, 0.5);
    scene.seek(10);
    EXPECT_EQ(std::get<shape::Disk>(scene.entity("disk").root().shape).radius, 1.0);
}

TEST(BuildersTest, SweepAttrColor) {
    Scene scene = disk_scene();
    sweep_attr(scene, 0.5, "disk", "color", colors::black(), Color{0, 156, 230}, Profile::Linear, 0.0);
    scene.seek(scene.last_frame() + 1);
    EXPECT_EQ(scene.entity("disk").root().color, (Color{0, 156, 230}));
}

TEST(BuildersTest, SetAttrHonorsStart) {
    Scene scene = disk_scene();
    set_attr(scene, "disk", "opacity", 0.3, 0.6);
    scene.seek(6);
    EXPECT_DOUBLE_EQ(scene.entity("disk").root().opacity, 1.0);
    scene.seek(7);
    EXPECT_DOUBLE_EQ(scene.entity("disk").root().opacity, 0.3);
}

TEST(BuildersTest, FadeInShowsThenRamps) {
    Scene scene(test::small_scene());
    scene.register_entity("disk", make_disk(0.5, {.visible = false}));
    fade_in(scene, 0.5, "disk", Profile::Linear, 1.0);

    scene.seek(11);
    EXPECT_TRUE(scene.entity("disk").root().visible);
    EXPECT_DOUBLE_EQ(scene.entity("disk").root().opacity, 0.0);
    scene.seek(15);
    EXPECT_DOUBLE_EQ(scene.entity("disk").root().opacity, 1.0);
}

TEST(BuildersTest, FadeOutHidesOnLastFrame) {
    Scene scene = disk_scene();
    fade_out(scene, 0.5, "disk", Profile::Linear, 0.0);
    EXPECT_EQ(scene.last_frame(), 4);

    scene.seek(4);
    EXPECT_TRUE(scene.entity("disk").root().visible);
    EXPECT_GT(scene.entity("disk").root().opacity, 0.0);

    scene.seek(5);
    EXPECT_FALSE(scene.entity("disk").root().visible);
    EXPECT_DOUBLE_EQ(scene.entity("disk").root().opacity, 0.0);
}

TEST(BuildersTest, SweepCmdRunsOncePerFrame) {
    Scene scene = disk_scene();
    int calls = 0;
    sweep_cmd(scene, 0.3, "count()", [&calls](Scene&) { ++calls; }, 0.0);
    set_cmd(scene, "count()", [&calls](Scene&) { ++calls; }, 1.0);

    scene.seek(3);
    EXPECT_EQ(calls, 3);
    scene.seek(11);
    EXPECT_EQ(calls, 4);
}

TEST(BuildersTest, CommandSeesLiveEntities) {
    Scene scene = disk_scene();
    set_cmd(scene, "grow()", [](Scene& s) {
        s.entity("disk").set_attribute(NodeTree::kRoot, "radius", 2.0);
    }, 0.0);
    scene.seek(1);
    EXPECT_DOUBLE_EQ(std::get<shape::Disk>(scene.entity("disk").root().shape).radius, 2.0);
    scene.seek(0);
    EXPECT_DOUBLE_EQ(std::get<shape::Disk>(scene.entity("disk").root().shape).radius, 0.5);
}
