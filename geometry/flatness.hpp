#ifndef ANIMATIC_GEOMETRY_FLATNESS_HPP
#define ANIMATIC_GEOMETRY_FLATNESS_HPP

#include <math/vec2.hpp>
#include <vector>

namespace animatic {

// One roll position of the two parallel support lines.
struct FlatnessStep {
    double separation = 0.0;  // Perpendicular distance between the lines
    Vec2 slope;               // Unit direction of the lower (p0) line
    Vec2 p0;                  // Anchor on the lower support line
    Vec2 p1;                  // Anchor on the upper support line
};

struct FlatnessResult {
    double flatness = 0.0;            // Minimum separation over all steps
    std::vector<FlatnessStep> steps;  // Every evaluated roll position, in order
};

// Minimum-zone flatness of a planar point set.
//
// Two anchors start on the lowest and highest points with antiparallel
// horizontal slopes and roll around the set like a string being wrapped:
// each step advances the anchor whose best candidate is most aligned with its
// current slope (ties advance the lower anchor), keeping both slopes
// antiparallel. The search ends when either anchor lands on the other's
// starting point. Requires points in general position.
//
// Throws std::invalid_argument for fewer than two distinct points, and
// std::runtime_error if the roll does not terminate within 4*N + 4 steps
// (possible with duplicate coordinates, since termination compares points by
// value).
FlatnessResult min_zone_flatness(const std::vector<Vec2>& points);

}  // namespace animatic

#endif // ANIMATIC_GEOMETRY_FLATNESS_HPP
