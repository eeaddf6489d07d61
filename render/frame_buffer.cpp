#include "frame_buffer.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace animatic {

FrameBuffer::FrameBuffer(int width, int height, Color background)
    : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("FrameBuffer: invalid size " + std::to_string(width) +
                                    "x" + std::to_string(height));
    }
    data_.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 3);
    fill(background);
}

Color FrameBuffer::pixel(int x, int y) const {
    if (!contains(x, y)) {
        throw std::out_of_range("FrameBuffer::pixel: (" + std::to_string(x) + ", " +
                                std::to_string(y) + ") outside image");
    }
    size_t i = (static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x)) * 3;
    return {data_[i], data_[i + 1], data_[i + 2]};
}

void FrameBuffer::set_pixel(int x, int y, const Color& color) {
    if (!contains(x, y)) {
        return;
    }
    size_t i = (static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x)) * 3;
    data_[i] = color.r;
    data_[i + 1] = color.g;
    data_[i + 2] = color.b;
}

void FrameBuffer::fill(const Color& color) {
    for (size_t i = 0; i < data_.size(); i += 3) {
        data_[i] = color.r;
        data_[i + 1] = color.g;
        data_[i + 2] = color.b;
    }
}

void FrameBuffer::blend(const FrameBuffer& over, double weight) {
    if (over.width_ != width_ || over.height_ != height_) {
        throw std::invalid_argument("FrameBuffer::blend: size mismatch");
    }
    const double w = std::clamp(weight, 0.0, 1.0);
    for (size_t i = 0; i < data_.size(); ++i) {
        double v = data_[i] * (1.0 - w) + over.data_[i] * w;
        data_[i] = static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
    }
}

}  // namespace animatic
