#ifndef ANIMATIC_SCENE_ATTRIBUTE_HPP
#define ANIMATIC_SCENE_ATTRIBUTE_HPP

#include <math/vec2.hpp>
#include <math/vec3.hpp>
#include <math/mat3.hpp>
#include <geometry/interpolation.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace animatic {

// 8-bit RGB display color.
struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;

    constexpr bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    constexpr bool operator!=(const Color& other) const {
        return !(*this == other);
    }
};

namespace colors {
    constexpr Color black() { return {0, 0, 0}; }
    constexpr Color white() { return {255, 255, 255}; }
}

// Closed set of values a node attribute can hold.
using AttributeValue = std::variant<double, Vec2, Vec3, Mat3, Color, bool, std::string>;

// Name of the held alternative, for error messages ("double", "vec3", ...)
std::string type_name(const AttributeValue& value);

// Literal rendering used in instruction descriptions, e.g. "[1, 0, 0]".
std::string to_string(const AttributeValue& value);

// interpolate() over attribute values. Both ends must hold the same numeric
// kind (double, Vec2, Vec3 or Color); colors are rounded per channel.
// Throws std::invalid_argument otherwise.
std::vector<AttributeValue> interpolate_values(const AttributeValue& from,
                                               const AttributeValue& to,
                                               int n,
                                               Profile profile);

}  // namespace animatic

#endif // ANIMATIC_SCENE_ATTRIBUTE_HPP
