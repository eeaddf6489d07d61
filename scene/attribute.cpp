#include "attribute.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace animatic {

namespace {

std::string format_number(double v) {
    std::ostringstream out;
    out << v;
    return out.str();
}

Vec3 color_to_vec3(const Color& c) {
    return {static_cast<double>(c.r), static_cast<double>(c.g), static_cast<double>(c.b)};
}

uint8_t channel(double v) {
    double rounded = std::round(v);
    if (rounded < 0.0) return 0;
    if (rounded > 255.0) return 255;
    return static_cast<uint8_t>(rounded);
}

}  // namespace

std::string type_name(const AttributeValue& value) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, double>) return "double";
        else if constexpr (std::is_same_v<T, Vec2>) return "vec2";
        else if constexpr (std::is_same_v<T, Vec3>) return "vec3";
        else if constexpr (std::is_same_v<T, Mat3>) return "mat3";
        else if constexpr (std::is_same_v<T, Color>) return "color";
        else if constexpr (std::is_same_v<T, bool>) return "bool";
        else return "string";
    }, value);
}

std::string to_string(const AttributeValue& value) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, double>) {
            return format_number(arg);
        } else if constexpr (std::is_same_v<T, Vec2>) {
            return "[" + format_number(arg.x) + ", " + format_number(arg.y) + "]";
        } else if constexpr (std::is_same_v<T, Vec3>) {
            return "[" + format_number(arg.x) + ", " + format_number(arg.y) + ", " +
                   format_number(arg.z) + "]";
        } else if constexpr (std::is_same_v<T, Mat3>) {
            std::string out = "[";
            for (size_t r = 0; r < 3; ++r) {
                Vec3 row = arg.row(r);
                if (r > 0) out += ", ";
                out += "[" + format_number(row.x) + ", " + format_number(row.y) + ", " +
                       format_number(row.z) + "]";
            }
            return out + "]";
        } else if constexpr (std::is_same_v<T, Color>) {
            return "(" + std::to_string(arg.r) + ", " + std::to_string(arg.g) + ", " +
                   std::to_string(arg.b) + ")";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "True" : "False";
        } else {
            return "\"" + arg + "\"";
        }
    }, value);
}

std::vector<AttributeValue> interpolate_values(const AttributeValue& from,
                                               const AttributeValue& to,
                                               int n,
                                               Profile profile) {
    if (from.index() != to.index()) {
        throw std::invalid_argument("cannot interpolate " + type_name(from) +
                                    " to " + type_name(to));
    }

    std::vector<AttributeValue> result;
    if (const auto* a = std::get_if<double>(&from)) {
        for (double v : interpolate(*a, std::get<double>(to), n, profile)) {
            result.emplace_back(v);
        }
    } else if (const auto* a = std::get_if<Vec2>(&from)) {
        for (const Vec2& v : interpolate(*a, std::get<Vec2>(to), n, profile)) {
            result.emplace_back(v);
        }
    } else if (const auto* a = std::get_if<Vec3>(&from)) {
        for (const Vec3& v : interpolate(*a, std::get<Vec3>(to), n, profile)) {
            result.emplace_back(v);
        }
    } else if (const auto* a = std::get_if<Color>(&from)) {
        auto samples = interpolate(color_to_vec3(*a), color_to_vec3(std::get<Color>(to)), n, profile);
        for (const Vec3& v : samples) {
            result.emplace_back(Color{channel(v.x), channel(v.y), channel(v.z)});
        }
    } else {
        throw std::invalid_argument("cannot interpolate values of type " + type_name(from));
    }
    return result;
}

}  // namespace animatic
