#include "contour.hpp"
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace animatic {

namespace {

constexpr double kDirichletConcentration = 10.0;

// Cumulative parameter values in [0, 1]: a leading 0 followed by the running
// sum of n_points - 1 Dirichlet spacings.
std::vector<double> dirichlet_parameters(int n_points, std::mt19937& rng) {
    if (n_points < 2) {
        throw std::invalid_argument("contour sampling requires at least 2 points");
    }

    std::gamma_distribution<double> gamma(kDirichletConcentration, 1.0);
    std::vector<double> spacings(static_cast<size_t>(n_points - 1));
    double total = 0.0;
    for (double& s : spacings) {
        s = gamma(rng);
        total += s;
    }

    std::vector<double> params;
    params.reserve(static_cast<size_t>(n_points));
    params.push_back(0.0);
    double cumulative = 0.0;
    for (double s : spacings) {
        cumulative += s / total;
        params.push_back(cumulative);
    }
    params.back() = 1.0;
    return params;
}

ContourSamples sample_all(const std::vector<ContourSegment>& contour, int n_points, std::mt19937& rng) {
    ContourSamples result;
    for (const auto& segment : contour) {
        ContourSamples s = sample_segment(segment, n_points, rng);
        result.points.insert(result.points.end(), s.points.begin(), s.points.end());
        result.normals.insert(result.normals.end(), s.normals.begin(), s.normals.end());
    }
    return result;
}

}  // namespace

ArcContour circle_contour(const Vec2& center, double radius) {
    return ArcContour{center, radius, std::numbers::pi / 4.0, 9.0 * std::numbers::pi / 4.0};
}

ContourSamples sample_segment(const ContourSegment& segment, int n_points, std::mt19937& rng) {
    std::vector<double> params = dirichlet_parameters(n_points, rng);

    ContourSamples samples;
    samples.points.reserve(params.size());
    samples.normals.reserve(params.size());

    if (const auto* line = std::get_if<LineContour>(&segment)) {
        Vec2 delta = line->end - line->start;
        Vec2 normal = delta.normalized().perpendicular();
        for (double t : params) {
            samples.points.push_back(line->start + delta * t);
            samples.normals.push_back(normal);
        }
        samples.points.back() = line->end;
    } else {
        const auto& arc = std::get<ArcContour>(segment);
        for (double t : params) {
            double angle = arc.start_angle + (arc.end_angle - arc.start_angle) * t;
            Vec2 radial{std::cos(angle), std::sin(angle)};
            samples.points.push_back(arc.center + radial * arc.radius);
            samples.normals.push_back(radial);
        }
    }
    return samples;
}

ContourSamples sample_contour(const std::vector<ContourSegment>& contour, int n_points, uint32_t seed) {
    std::mt19937 rng(seed);
    ContourSamples result = sample_all(contour, n_points, rng);
    return result;
}

ContourSamples jagged_samples(const std::vector<ContourSegment>& contour,
                              double jaggedness,
                              int n_points,
                              uint32_t seed) {
    if (n_points < 2) {
        throw std::invalid_argument("jagged_samples requires at least 2 points per segment");
    }

    std::mt19937 rng(seed);
    ContourSamples result = sample_all(contour, n_points, rng);

    const double amplitude = std::abs(jaggedness);
    if (result.points.empty() || amplitude == 0.0) {
        return result;
    }

    std::uniform_real_distribution<double> offset_dist(-amplitude, amplitude);
    const size_t last = result.points.size() - 1;
    for (size_t i = 0; i < result.points.size(); ++i) {
        double offset = offset_dist(rng);
        if (i == 0 || i == last) {
            continue;  // endpoints stay on the nominal contour
        }
        result.points[i] += result.normals[i] * offset;
    }
    return result;
}

}  // namespace animatic
