#ifndef ANIMATIC_RENDER_RASTERIZER_HPP
#define ANIMATIC_RENDER_RASTERIZER_HPP

#include "frame_buffer.hpp"
#include <math/vec2.hpp>
#include <span>
#include <string>
#include <vector>

namespace animatic {

// Drawing backend. All coordinates are in pixels with y growing downwards.
// Angles are in radians, counter-clockwise as seen on screen, starting at +x.
class Rasterizer {
public:
    virtual ~Rasterizer() = default;

    virtual void draw_point(FrameBuffer& buffer, const Vec2& center, double radius,
                            const Color& color) = 0;

    virtual void draw_line(FrameBuffer& buffer, const Vec2& from, const Vec2& to,
                           const Color& color, int thickness) = 0;

    virtual void draw_polyline(FrameBuffer& buffer, std::span<const Vec2> points, bool closed,
                               const Color& color, int thickness) = 0;

    // Even-odd fill of one or more closed loops (outer boundary plus holes)
    virtual void fill_polygon(FrameBuffer& buffer, std::span<const std::vector<Vec2>> loops,
                              const Color& color) = 0;

    virtual void draw_circle(FrameBuffer& buffer, const Vec2& center, double radius,
                             const Color& color, int thickness) = 0;

    virtual void fill_circle(FrameBuffer& buffer, const Vec2& center, double radius,
                             const Color& color) = 0;

    // Sector between the two angles; their order does not matter
    virtual void fill_wedge(FrameBuffer& buffer, const Vec2& center, double radius,
                            double start_angle, double end_angle, const Color& color) = 0;

    virtual void draw_arc(FrameBuffer& buffer, const Vec2& center, double radius,
                          double start_angle, double end_angle,
                          const Color& color, int thickness) = 0;

    // `origin` is the lower-left corner of the first glyph
    virtual void draw_text(FrameBuffer& buffer, const Vec2& origin, const std::string& text,
                           double height, const Color& color, int thickness) = 0;
};

}  // namespace animatic

#endif // ANIMATIC_RENDER_RASTERIZER_HPP
