#ifndef ANIMATIC_GEOMETRY_LEADER_PATH_HPP
#define ANIMATIC_GEOMETRY_LEADER_PATH_HPP

#include <math/vec3.hpp>
#include <vector>

namespace animatic {

// Half angle of an arrow tip, radians
constexpr double kArrowTaper = 0.25;
// Arrow length in mm for a 1 px stroke; scales with sqrt(stroke size)
constexpr double kArrowLength = 0.09;

double arrow_length_for(double stroke_size);

// Visible part of a leader line drawn to `extension` (0..1) of its length.
// Polyline vertices are the partially extended path, shortened at either end
// where an arrow head covers the line.
struct LeaderPath {
    std::vector<Vec3> polyline;
    std::vector<Vec3> start_arrow;  // triangle, empty if none
    std::vector<Vec3> end_arrow;    // triangle or truncated quad, empty if none
};

double polyline_length(const std::vector<Vec3>& vertices);

LeaderPath leader_path(const std::vector<Vec3>& vertices,
                       bool start_arrow,
                       bool end_arrow,
                       double extension,
                       double arrow_length);

}  // namespace animatic

#endif // ANIMATIC_GEOMETRY_LEADER_PATH_HPP
