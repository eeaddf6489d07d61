#ifndef ANIMATIC_GEOMETRY_CONTOUR_HPP
#define ANIMATIC_GEOMETRY_CONTOUR_HPP

#include <math/vec2.hpp>
#include <cstdint>
#include <random>
#include <variant>
#include <vector>

namespace animatic {

struct LineContour {
    Vec2 start;
    Vec2 end;
};

// Arc swept from start_angle to end_angle (radians, counter-clockwise
// positive). end_angle < start_angle sweeps clockwise.
struct ArcContour {
    Vec2 center;
    double radius = 1.0;
    double start_angle = 0.0;
    double end_angle = 0.0;
};

using ContourSegment = std::variant<LineContour, ArcContour>;

// Full circle, starting at 45 degrees.
ArcContour circle_contour(const Vec2& center, double radius);

// Sampled contour: normals[i] is the unit normal at points[i].
struct ContourSamples {
    std::vector<Vec2> points;
    std::vector<Vec2> normals;
};

// Samples n_points along one segment at non-uniform parameter values drawn
// from a Dirichlet(10) distribution using `rng`. The first sample is exactly
// the segment start and the last exactly the segment end.
ContourSamples sample_segment(const ContourSegment& segment, int n_points, std::mt19937& rng);

// Samples every segment in order with a generator seeded once from `seed`.
ContourSamples sample_contour(const std::vector<ContourSegment>& contour, int n_points, uint32_t seed);

// Hand-drawn variant of sample_contour: each interior point is pushed along
// its normal by a uniform offset in [-jaggedness, +jaggedness]. The first and
// last points of the contour are never moved. The same seed always gives the
// same output. Throws std::invalid_argument if n_points < 2.
ContourSamples jagged_samples(const std::vector<ContourSegment>& contour,
                              double jaggedness,
                              int n_points,
                              uint32_t seed);

}  // namespace animatic

#endif // ANIMATIC_GEOMETRY_CONTOUR_HPP
