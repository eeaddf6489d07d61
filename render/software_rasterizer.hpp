#ifndef ANIMATIC_RENDER_SOFTWARE_RASTERIZER_HPP
#define ANIMATIC_RENDER_SOFTWARE_RASTERIZER_HPP

#include "rasterizer.hpp"
#include "font_face.hpp"
#include <memory>

namespace animatic {

// CPU rasterizer: Bresenham lines with a square brush, midpoint circles and
// scanline polygon fill, without anti-aliasing. Text goes through FreeType.
class SoftwareRasterizer : public Rasterizer {
public:
    // Text uses find_system_font(), looked up on the first draw_text call.
    // Without a usable font, text is skipped with a warning.
    SoftwareRasterizer() = default;

    // Text uses the given font file. Throws std::runtime_error if it cannot be loaded.
    explicit SoftwareRasterizer(const std::string& font_path);

    const FontFace* font();

    void draw_point(FrameBuffer& buffer, const Vec2& center, double radius,
                    const Color& color) override;
    void draw_line(FrameBuffer& buffer, const Vec2& from, const Vec2& to,
                   const Color& color, int thickness) override;
    void draw_polyline(FrameBuffer& buffer, std::span<const Vec2> points, bool closed,
                       const Color& color, int thickness) override;
    void fill_polygon(FrameBuffer& buffer, std::span<const std::vector<Vec2>> loops,
                      const Color& color) override;
    void draw_circle(FrameBuffer& buffer, const Vec2& center, double radius,
                     const Color& color, int thickness) override;
    void fill_circle(FrameBuffer& buffer, const Vec2& center, double radius,
                     const Color& color) override;
    void fill_wedge(FrameBuffer& buffer, const Vec2& center, double radius,
                    double start_angle, double end_angle, const Color& color) override;
    void draw_arc(FrameBuffer& buffer, const Vec2& center, double radius,
                  double start_angle, double end_angle,
                  const Color& color, int thickness) override;
    void draw_text(FrameBuffer& buffer, const Vec2& origin, const std::string& text,
                   double height, const Color& color, int thickness) override;

private:
    std::unique_ptr<FontFace> font_;
    bool font_resolved_ = false;
};

}  // namespace animatic

#endif // ANIMATIC_RENDER_SOFTWARE_RASTERIZER_HPP
