#include "font_face.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include FT_OUTLINE_H

namespace animatic {

namespace {

const char* const kSystemFonts[] = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
    "/usr/share/fonts/liberation/LiberationSans-Regular.ttf",
    "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
    "/usr/share/fonts/noto/NotoSans-Regular.ttf",
    "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
    "/Library/Fonts/Arial.ttf",
    "/System/Library/Fonts/Helvetica.ttc",
};

uint8_t mix(uint8_t under, uint8_t over, unsigned coverage) {
    return static_cast<uint8_t>((under * (255u - coverage) + over * coverage + 127u) / 255u);
}

}  // namespace

FontFace::FontFace(const std::string& path) : path_(path) {
    FT_Error error = FT_Init_FreeType(&library_);
    if (error) {
        throw std::runtime_error("Failed to initialize FreeType (error " + std::to_string(error) + ")");
    }
    error = FT_New_Face(library_, path.c_str(), 0, &face_);
    if (error) {
        FT_Done_FreeType(library_);
        library_ = nullptr;
        throw std::runtime_error("Cannot load font: " + path + " (FreeType error " +
                                 std::to_string(error) + ")");
    }
    logging::get_logger()->debug("Loaded font {} ({})", path,
                                 face_->family_name ? face_->family_name : "unnamed");
}

FontFace::~FontFace() {
    if (face_) {
        FT_Done_Face(face_);
    }
    if (library_) {
        FT_Done_FreeType(library_);
    }
}

void FontFace::set_size(double pixel_height) {
    FT_UInt size = static_cast<FT_UInt>(std::max(1L, std::lround(pixel_height)));
    FT_Error error = FT_Set_Pixel_Sizes(face_, 0, size);
    if (error) {
        throw std::runtime_error("Font " + path_ + " does not support size " + std::to_string(size));
    }
}

void FontFace::draw(FrameBuffer& buffer, const Vec2& origin, std::string_view text,
                    double pixel_height, const Color& color, int embolden) {
    if (pixel_height <= 0.0 || text.empty()) return;
    set_size(pixel_height);

    double pen_x = origin.x;
    const int baseline = static_cast<int>(std::lround(origin.y));
    for (char c : text) {
        FT_UInt glyph_index = FT_Get_Char_Index(face_, static_cast<unsigned char>(c));
        if (FT_Load_Glyph(face_, glyph_index, FT_LOAD_DEFAULT)) {
            logging::get_logger()->warn("Font {} has no glyph for '{}'", path_, c);
            continue;
        }
        FT_GlyphSlot slot = face_->glyph;
        if (embolden > 0 && slot->format == FT_GLYPH_FORMAT_OUTLINE) {
            FT_Outline_Embolden(&slot->outline, static_cast<FT_Pos>(embolden) * 64);
        }
        if (FT_Render_Glyph(slot, FT_RENDER_MODE_NORMAL)) {
            throw std::runtime_error("FreeType failed to render glyph '" + std::string(1, c) + "'");
        }

        const FT_Bitmap& bitmap = slot->bitmap;
        const int left = static_cast<int>(std::lround(pen_x)) + slot->bitmap_left;
        const int top = baseline - slot->bitmap_top;
        for (unsigned row = 0; row < bitmap.rows; ++row) {
            const unsigned char* line = bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
            for (unsigned col = 0; col < bitmap.width; ++col) {
                const unsigned coverage = line[col];
                const int x = left + static_cast<int>(col);
                const int y = top + static_cast<int>(row);
                if (coverage == 0 || !buffer.contains(x, y)) continue;
                Color under = buffer.pixel(x, y);
                buffer.set_pixel(x, y, Color{mix(under.r, color.r, coverage),
                                             mix(under.g, color.g, coverage),
                                             mix(under.b, color.b, coverage)});
            }
        }
        pen_x += static_cast<double>(slot->advance.x) / 64.0;
    }
}

double FontFace::advance(std::string_view text, double pixel_height) {
    if (pixel_height <= 0.0) return 0.0;
    set_size(pixel_height);
    double width = 0.0;
    for (char c : text) {
        FT_UInt glyph_index = FT_Get_Char_Index(face_, static_cast<unsigned char>(c));
        if (FT_Load_Glyph(face_, glyph_index, FT_LOAD_DEFAULT)) continue;
        width += static_cast<double>(face_->glyph->advance.x) / 64.0;
    }
    return width;
}

std::optional<std::string> find_system_font() {
    if (const char* env = std::getenv("ANIMATIC_FONT")) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(env, ec)) {
            return std::string(env);
        }
        logging::get_logger()->warn("ANIMATIC_FONT={} is not a readable file", env);
    }
    for (const char* candidate : kSystemFonts) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return std::string(candidate);
        }
    }
    return std::nullopt;
}

}  // namespace animatic
