#ifndef ANIMATIC_MATH_QUATERNION_HPP
#define ANIMATIC_MATH_QUATERNION_HPP

#include "vec3.hpp"
#include <cmath>

namespace animatic {

// Unit quaternion used for relative rotations of a node's axes.
struct Quaternion {
    double w = 1.0;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Quaternion() = default;
    constexpr Quaternion(double w_, double x_, double y_, double z_) : w(w_), x(x_), y(y_), z(z_) {}

    static Quaternion from_axis_angle(const Vec3& axis, double radians) {
        Vec3 u = axis.normalized();
        double h = radians * 0.5;
        double s = std::sin(h);
        return {std::cos(h), u.x * s, u.y * s, u.z * s};
    }

    constexpr Vec3 vector_part() const {
        return {x, y, z};
    }

    // Hamilton product: (this * other) applies other first, then this
    constexpr Quaternion operator*(const Quaternion& o) const {
        return {
            w * o.w - x * o.x - y * o.y - z * o.z,
            w * o.x + x * o.w + y * o.z - z * o.y,
            w * o.y - x * o.z + y * o.w + z * o.x,
            w * o.z + x * o.y - y * o.x + z * o.w
        };
    }

    constexpr Quaternion conjugate() const {
        return {w, -x, -y, -z};
    }

    // q v q*
    constexpr Vec3 rotate(const Vec3& v) const {
        Vec3 u = vector_part();
        Vec3 t = u.cross(v) * 2.0;
        return v + t * w + u.cross(t);
    }

    double angle() const {
        return 2.0 * std::atan2(vector_part().length(), w);
    }

    constexpr bool operator==(const Quaternion& o) const {
        return w == o.w && x == o.x && y == o.y && z == o.z;
    }
};

}  // namespace animatic

#endif // ANIMATIC_MATH_QUATERNION_HPP
