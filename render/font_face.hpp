#ifndef ANIMATIC_RENDER_FONT_FACE_HPP
#define ANIMATIC_RENDER_FONT_FACE_HPP

#include "frame_buffer.hpp"
#include <math/vec2.hpp>
#include <optional>
#include <string>
#include <string_view>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace animatic {

// One TrueType/OpenType face loaded through FreeType.
class FontFace {
public:
    // Throws std::runtime_error if FreeType cannot open the file
    explicit FontFace(const std::string& path);
    ~FontFace();

    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    const std::string& path() const { return path_; }

    // Draws `text` with its baseline starting at `origin`. `pixel_height` is
    // the em size. Glyph coverage is blended over the existing pixels;
    // `embolden` widens the outlines by that many pixels.
    void draw(FrameBuffer& buffer, const Vec2& origin, std::string_view text,
              double pixel_height, const Color& color, int embolden = 0);

    // Horizontal advance of `text` at `pixel_height`, in pixels
    double advance(std::string_view text, double pixel_height);

private:
    void set_size(double pixel_height);

    std::string path_;
    FT_Library library_ = nullptr;
    FT_Face face_ = nullptr;
};

// Font used when none is configured: $ANIMATIC_FONT, then a few common
// system locations. Empty if nothing readable is found.
std::optional<std::string> find_system_font();

}  // namespace animatic

#endif // ANIMATIC_RENDER_FONT_FACE_HPP
