#ifndef ANIMATIC_MATH_MAT3_HPP
#define ANIMATIC_MATH_MAT3_HPP

#include "vec3.hpp"
#include <array>
#include <cmath>

namespace animatic {

// 3x3 matrix stored as columns. For an orientation the columns are the local
// i, j, k unit vectors expressed in the parent frame.
struct Mat3 {
    std::array<Vec3, 3> cols{vec3::unit_x(), vec3::unit_y(), vec3::unit_z()};

    constexpr Mat3() = default;
    constexpr Mat3(const Vec3& c0, const Vec3& c1, const Vec3& c2) : cols{c0, c1, c2} {}

    static constexpr Mat3 identity() { return Mat3{}; }

    // Build from rows, matching the way matrices are written on paper
    static constexpr Mat3 from_rows(const Vec3& r0, const Vec3& r1, const Vec3& r2) {
        return Mat3{Vec3{r0.x, r1.x, r2.x},
                    Vec3{r0.y, r1.y, r2.y},
                    Vec3{r0.z, r1.z, r2.z}};
    }

    // Rotation about +z by angle radians (counter-clockwise in the xy plane)
    static Mat3 rotation_z(double angle) {
        double c = std::cos(angle);
        double s = std::sin(angle);
        return from_rows({c, -s, 0.0}, {s, c, 0.0}, {0.0, 0.0, 1.0});
    }

    constexpr double at(size_t row, size_t col) const {
        return cols[col][row];
    }

    constexpr Vec3 row(size_t r) const {
        return {cols[0][r], cols[1][r], cols[2][r]};
    }

    constexpr Vec3 operator*(const Vec3& v) const {
        return cols[0] * v.x + cols[1] * v.y + cols[2] * v.z;
    }

    constexpr Mat3 operator*(const Mat3& other) const {
        return Mat3{*this * other.cols[0], *this * other.cols[1], *this * other.cols[2]};
    }

    constexpr Mat3 transposed() const {
        return from_rows(cols[0], cols[1], cols[2]);
    }

    constexpr bool operator==(const Mat3& other) const {
        return cols[0] == other.cols[0] && cols[1] == other.cols[1] && cols[2] == other.cols[2];
    }

    constexpr bool operator!=(const Mat3& other) const {
        return !(*this == other);
    }
};

}  // namespace animatic

#endif // ANIMATIC_MATH_MAT3_HPP
