#include "polygon.hpp"
#include <limits>
#include <stdexcept>

namespace animatic {

double ray_polygon_distance(const Polygon2& polygon, const Vec2& point, const Vec2& direction) {
    if (polygon.size() < 2) {
        throw std::invalid_argument("ray_polygon_distance requires at least 2 vertices");
    }
    if (direction.length() == 0.0) {
        throw std::invalid_argument("ray_polygon_distance requires a non-zero direction");
    }

    const Vec2 a = direction.normalized();
    const Vec2 n = a.perpendicular();  // normal to the ray line

    double min_forward = std::numeric_limits<double>::infinity();
    double inside_factor = 1.0;

    for (size_t i = 0; i < polygon.size(); ++i) {
        const Vec2 start = polygon[i] - point;
        const Vec2 end = polygon[(i + 1) % polygon.size()] - point;

        double norm_start = n.dot(start);
        double norm_end = n.dot(end);
        if (norm_start * norm_end > 0.0) {
            continue;  // both endpoints on the same side of the ray line
        }
        if (norm_start == norm_end) {
            continue;  // edge lies on the ray line
        }

        double ax_start = a.dot(start);
        double ax_end = a.dot(end);
        double forward = ax_start + (-norm_start) / (norm_end - norm_start) * (ax_end - ax_start);

        if (forward < 0.0) {
            inside_factor = -1.0;
            continue;
        }
        if (forward < min_forward) {
            min_forward = forward;
        }
    }

    return inside_factor * min_forward;
}

bool is_convex(const Polygon2& polygon) {
    const size_t n = polygon.size();
    if (n < 3) {
        throw std::invalid_argument("is_convex requires at least 3 vertices");
    }

    int sign = 0;
    for (size_t i = 0; i < n; ++i) {
        const Vec2& a = polygon[i];
        const Vec2& b = polygon[(i + 1) % n];
        const Vec2& c = polygon[(i + 2) % n];
        double turn = (b - a).cross(c - b);
        if (turn == 0.0) {
            continue;
        }
        int s = turn > 0.0 ? 1 : -1;
        if (sign == 0) {
            sign = s;
        } else if (s != sign) {
            return false;
        }
    }
    return true;
}

double signed_area(const Polygon2& polygon) {
    double area = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const Vec2& a = polygon[i];
        const Vec2& b = polygon[(i + 1) % polygon.size()];
        area += a.cross(b);
    }
    return area * 0.5;
}

}  // namespace animatic
