#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include <render/frame_buffer.hpp>
#include <render/software_rasterizer.hpp>
#include <render/font_face.hpp>
#include <render/node_renderer.hpp>
#include <entities/primitives.hpp>
#include <entities/leader.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace animatic;

TEST(FrameBufferTest, FillsBackground) {
    FrameBuffer buffer(4, 3, Color{10, 20, 30});
    EXPECT_EQ(buffer.data().size(), 36u);
    EXPECT_EQ(buffer.pixel(3, 2), (Color{10, 20, 30}));
}

TEST(FrameBufferTest, Bounds) {
    FrameBuffer buffer(4, 3);
    EXPECT_THROW(buffer.pixel(4, 0), std::out_of_range);
    EXPECT_THROW(buffer.pixel(0, -1), std::out_of_range);
    // Clipped, not an error
    buffer.set_pixel(-1, 10, colors::white());
    EXPECT_EQ(test::count_pixels(buffer, colors::white()), 0);

    EXPECT_THROW(FrameBuffer(0, 3), std::invalid_argument);
}

TEST(FrameBufferTest, BlendRoundsPerChannel) {
    FrameBuffer under(2, 2, colors::black());
    FrameBuffer over(2, 2, colors::white());
    under.blend(over, 0.5);
    EXPECT_EQ(under.pixel(1, 1), (Color{128, 128, 128}));

    FrameBuffer small(1, 1);
    EXPECT_THROW(under.blend(small, 0.5), std::invalid_argument);
}

TEST(SoftwareRasterizerTest, HorizontalLine) {
    FrameBuffer buffer(20, 10);
    SoftwareRasterizer r;
    r.draw_line(buffer, {2.0, 5.0}, {12.0, 5.0}, colors::white(), 1);
    EXPECT_EQ(test::count_pixels(buffer, colors::white()), 11);
    EXPECT_EQ(buffer.pixel(2, 5), colors::white());
    EXPECT_EQ(buffer.pixel(12, 5), colors::white());
}

TEST(SoftwareRasterizerTest, LineFarOutsideIsClipped) {
    FrameBuffer buffer(20, 10);
    SoftwareRasterizer r;
    r.draw_line(buffer, {-1.0e6, 5.0}, {1.0e6, 5.0}, colors::white(), 1);
    EXPECT_EQ(test::count_pixels(buffer, colors::white()), 20);
}

TEST(SoftwareRasterizerTest, FillSquare) {
    FrameBuffer buffer(40, 40);
    SoftwareRasterizer r;
    std::vector<std::vector<Vec2>> loops{{{10.0, 10.0}, {20.0, 10.0}, {20.0, 20.0}, {10.0, 20.0}}};
    r.fill_polygon(buffer, loops, colors::white());
    EXPECT_EQ(test::count_pixels(buffer, colors::white()), 110);
}

TEST(SoftwareRasterizerTest, HoleIsNotFilled) {
    FrameBuffer buffer(40, 40);
    SoftwareRasterizer r;
    std::vector<std::vector<Vec2>> loops{
        {{5.0, 5.0}, {35.0, 5.0}, {35.0, 35.0}, {5.0, 35.0}},
        {{15.0, 15.0}, {25.0, 15.0}, {25.0, 25.0}, {15.0, 25.0}},
    };
    r.fill_polygon(buffer, loops, colors::white());
    EXPECT_EQ(buffer.pixel(8, 20), colors::white());
    EXPECT_EQ(buffer.pixel(20, 20), colors::black());
}

TEST(SoftwareRasterizerTest, WedgeCoversOneQuadrant) {
    FrameBuffer buffer(41, 41);
    SoftwareRasterizer r;
    // Angles counter-clockwise from +x as seen on screen: upper right quadrant
    r.fill_wedge(buffer, {20.0, 20.0}, 15.0, 0.0, 1.5707963267948966, colors::white());
    EXPECT_EQ(buffer.pixel(27, 13), colors::white());
    EXPECT_EQ(buffer.pixel(13, 27), colors::black());
    EXPECT_EQ(buffer.pixel(13, 13), colors::black());
}

TEST(FontTest, MissingFontFileThrows) {
    EXPECT_THROW(FontFace("/nonexistent/animatic.ttf"), std::runtime_error);
    EXPECT_THROW(SoftwareRasterizer("/nonexistent/animatic.ttf"), std::runtime_error);
}

TEST(FontTest, EmptyOrFlatTextDrawsNothing) {
    FrameBuffer buffer(60, 20);
    SoftwareRasterizer r;
    r.draw_text(buffer, {2.0, 16.0}, "0.52", 0.0, colors::white(), 1);
    r.draw_text(buffer, {2.0, 16.0}, "", 14.0, colors::white(), 1);
    EXPECT_EQ(test::count_pixels(buffer, colors::black()), 60 * 20);
}

TEST(FontTest, TextDrawsGlyphsAboveBaseline) {
    std::optional<std::string> path = find_system_font();
    if (!path) {
        GTEST_SKIP() << "no system font installed";
    }
    FrameBuffer buffer(60, 20);
    SoftwareRasterizer r(*path);
    ASSERT_NE(r.font(), nullptr);
    r.draw_text(buffer, {2.0, 16.0}, "0.52", 14.0, colors::white(), 1);

    int lit = 60 * 20 - test::count_pixels(buffer, colors::black());
    EXPECT_GT(lit, 0);
    // Digits sit on the baseline; nothing is drawn well below it
    for (int y = 18; y < 20; ++y) {
        for (int x = 0; x < 60; ++x) {
            EXPECT_EQ(buffer.pixel(x, y), colors::black());
        }
    }

    FrameBuffer bold(60, 20);
    r.draw_text(bold, {2.0, 16.0}, "0.52", 14.0, colors::white(), 3);
    EXPECT_GT(60 * 20 - test::count_pixels(bold, colors::black()), lit);
}

TEST(FontTest, AdvanceScalesWithText) {
    std::optional<std::string> path = find_system_font();
    if (!path) {
        GTEST_SKIP() << "no system font installed";
    }
    FontFace face(*path);
    double one = face.advance("0", 14.0);
    EXPECT_GT(one, 0.0);
    EXPECT_NEAR(face.advance("00", 14.0), 2.0 * one, 1e-9);
    EXPECT_GT(face.advance("0", 28.0), one);
    EXPECT_EQ(face.advance("0", 0.0), 0.0);
}

TEST(NodeRendererTest, DiskAtSceneOrigin) {
    SceneConfig config = test::small_scene();
    FrameBuffer buffer(config.width, config.height);
    SoftwareRasterizer r;
    Viewport view{config.resolution, {32.0, 24.0}};

    render_tree(make_disk(1.0), buffer, r, view);
    EXPECT_EQ(buffer.pixel(32, 24), colors::white());
    EXPECT_EQ(buffer.pixel(32 + 9, 24), colors::white());
    EXPECT_EQ(buffer.pixel(32 + 12, 24), colors::black());
}

TEST(NodeRendererTest, ViewportFlipsY) {
    Viewport view{10.0, {32.0, 24.0}};
    Vec2 p = view.to_pixel({1.0, 1.0, 0.0});
    EXPECT_DOUBLE_EQ(p.x, 42.0);
    EXPECT_DOUBLE_EQ(p.y, 14.0);
}

TEST(NodeRendererTest, HiddenOrTransparentDrawsNothing) {
    FrameBuffer buffer(64, 48);
    SoftwareRasterizer r;
    Viewport view{10.0, {32.0, 24.0}};

    render_tree(make_disk(1.0, {.visible = false}), buffer, r, view);
    render_tree(make_disk(1.0, {.opacity = 0.0}), buffer, r, view);
    // A leader is drawn only once it has started to extend
    render_tree(make_leader({{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}}), buffer, r, view);
    EXPECT_EQ(buffer, FrameBuffer(64, 48));
}

TEST(NodeRendererTest, PartialOpacityBlends) {
    FrameBuffer buffer(64, 48);
    SoftwareRasterizer r;
    Viewport view{10.0, {32.0, 24.0}};

    render_tree(make_disk(1.0, {.opacity = 0.5}), buffer, r, view);
    EXPECT_EQ(buffer.pixel(32, 24), (Color{128, 128, 128}));
}

TEST(NodeRendererTest, GroupDrawsChildrenWithOffset) {
    FrameBuffer buffer(64, 48);
    SoftwareRasterizer r;
    Viewport view{10.0, {32.0, 24.0}};

    NodeTree group = make_group({.position = {1.0, 0.0, 0.0}});
    group.attach(NodeTree::kRoot, make_disk(0.5, {.position = {0.0, 1.0, 0.0}}));
    render_tree(group, buffer, r, view);

    EXPECT_EQ(buffer.pixel(42, 14), colors::white());
    EXPECT_EQ(buffer.pixel(32, 24), colors::black());
}

TEST(NodeRendererTest, PolygonFromVertexChildren) {
    FrameBuffer buffer(64, 48);
    SoftwareRasterizer r;
    Viewport view{10.0, {32.0, 24.0}};

    NodeTree poly = make_polygon({{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {1.0, 1.0, 0.0}, {0.0, 1.0, 0.0}},
                                 {.color = Color{250, 180, 130}});
    render_tree(poly, buffer, r, view);
    EXPECT_EQ(test::count_pixels(buffer, Color{250, 180, 130}), 110);
}
