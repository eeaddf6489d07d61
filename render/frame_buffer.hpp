#ifndef ANIMATIC_RENDER_FRAME_BUFFER_HPP
#define ANIMATIC_RENDER_FRAME_BUFFER_HPP

#include <scene/attribute.hpp>
#include <cstdint>
#include <vector>

namespace animatic {

// Packed 8-bit RGB image, row-major from the top-left corner.
class FrameBuffer {
public:
    FrameBuffer(int width, int height, Color background = colors::black());

    int width() const { return width_; }
    int height() const { return height_; }

    bool contains(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    // Throws std::out_of_range outside the image
    Color pixel(int x, int y) const;

    // Writes outside the image are clipped
    void set_pixel(int x, int y, const Color& color);

    void fill(const Color& color);

    // this = this * (1 - weight) + over * weight, per channel with rounding.
    // Throws std::invalid_argument if the sizes differ.
    void blend(const FrameBuffer& over, double weight);

    const std::vector<uint8_t>& data() const { return data_; }

    bool operator==(const FrameBuffer& other) const {
        return width_ == other.width_ && height_ == other.height_ && data_ == other.data_;
    }

private:
    int width_;
    int height_;
    std::vector<uint8_t> data_;
};

}  // namespace animatic

#endif // ANIMATIC_RENDER_FRAME_BUFFER_HPP
