#include "leader_path.hpp"
#include <algorithm>
#include <cmath>

namespace animatic {

double arrow_length_for(double stroke_size) {
    return std::sqrt(std::max(stroke_size, 0.0)) * kArrowLength;
}

double polyline_length(const std::vector<Vec3>& vertices) {
    double total = 0.0;
    for (size_t i = 1; i < vertices.size(); ++i) {
        total += vertices[i].distance_to(vertices[i - 1]);
    }
    return total;
}

namespace {

Vec3 in_plane_normal(const Vec3& e) {
    return {-e.y, e.x, e.z};
}

std::vector<Vec3> extended_polyline(std::vector<Vec3> verts, bool start_arrow, bool end_arrow,
                                    double extension, double arrow_length) {
    std::vector<Vec3> output{verts.front()};
    if (verts.size() == 1) {
        return output;
    }

    const double total = polyline_length(verts);

    // The line stops at the base of each arrow head
    if (start_arrow) {
        Vec3 base = verts[0] + (verts[1] - verts[0]).normalized() * arrow_length;
        verts.insert(verts.begin() + 1, base);
    }
    if (end_arrow) {
        const size_t last = verts.size() - 1;
        verts[last] = verts[last] + (verts[last - 1] - verts[last]).normalized() * arrow_length;
    }

    const double target = total * extension;
    double current = 0.0;
    for (size_t i = 1; i < verts.size(); ++i) {
        const Vec3& prev = verts[i - 1];
        const Vec3& curr = verts[i];
        double delta = curr.distance_to(prev);
        if (current + delta <= target) {
            output.push_back(curr);
            current += delta;
        } else {
            output.push_back(prev + (curr - prev).normalized() * (target - current));
            break;
        }
    }

    if (start_arrow) {
        output.erase(output.begin());
    }
    return output;
}

}  // namespace

LeaderPath leader_path(const std::vector<Vec3>& vertices,
                       bool start_arrow,
                       bool end_arrow,
                       double extension,
                       double arrow_length) {
    LeaderPath path;
    if (vertices.empty() || extension < 1e-8) {
        return path;
    }

    path.polyline = extended_polyline(vertices, start_arrow, end_arrow, extension, arrow_length);
    if (vertices.size() < 2) {
        return path;
    }

    const double total = polyline_length(vertices);
    const double tan_taper = std::tan(kArrowTaper);

    if (start_arrow) {
        // Shrinks while the extension has not yet passed the arrow
        double bounded = std::min(extension * total, arrow_length);
        double half_width = bounded * tan_taper;
        const Vec3& start = vertices[0];
        Vec3 e = (vertices[1] - start).normalized();
        Vec3 n = in_plane_normal(e);
        path.start_arrow = {start,
                            start + e * bounded + n * half_width,
                            start + e * bounded - n * half_width};
    }

    if (end_arrow) {
        // Truncated to a trapezoid until the extension reaches the tip
        double trap_height = extension * total - (total - arrow_length);
        if (trap_height > 0.0) {
            double base_width = arrow_length * tan_taper;
            double mid_width = (arrow_length - trap_height) * tan_taper;
            const Vec3& end = vertices.back();
            Vec3 e = (end - vertices[vertices.size() - 2]).normalized();
            Vec3 n = in_plane_normal(e);
            Vec3 base = end - e * arrow_length;
            Vec3 mid = end - e * (arrow_length - trap_height);
            path.end_arrow = {base + n * base_width,
                              base - n * base_width,
                              mid - n * mid_width,
                              mid + n * mid_width};
        }
    }
    return path;
}

}  // namespace animatic
