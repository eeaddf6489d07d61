#include "flatness.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace animatic {

namespace {

struct RollCandidate {
    size_t index = 0;
    Vec2 direction;
    double alignment = -std::numeric_limits<double>::infinity();
};

// Best point to roll onto from `anchor`: the one whose direction is most
// aligned with the anchor's current slope. First index wins ties.
std::optional<RollCandidate> best_candidate(const std::vector<Vec2>& points,
                                            const Vec2& anchor,
                                            const Vec2& slope) {
    std::optional<RollCandidate> best;
    for (size_t i = 0; i < points.size(); ++i) {
        if (points[i] == anchor) {
            continue;
        }
        Vec2 dir = (points[i] - anchor).normalized();
        double alignment = slope.dot(dir);
        if (!best || alignment > best->alignment) {
            best = RollCandidate{i, dir, alignment};
        }
    }
    return best;
}

}  // namespace

FlatnessResult min_zone_flatness(const std::vector<Vec2>& points) {
    auto log = logging::get_logger();

    if (points.size() < 2) {
        throw std::invalid_argument("min_zone_flatness requires at least 2 points");
    }

    size_t n0 = 0;  // lowest y
    size_t n1 = 0;  // highest y
    bool distinct = false;
    for (size_t i = 1; i < points.size(); ++i) {
        if (points[i].y < points[n0].y) n0 = i;
        if (points[i].y > points[n1].y) n1 = i;
        if (points[i] != points[0]) distinct = true;
    }
    if (!distinct) {
        throw std::invalid_argument("min_zone_flatness requires at least 2 distinct points");
    }

    FlatnessResult result;

    const Vec2 start0 = points[n0];
    const Vec2 start1 = points[n1];
    Vec2 p0 = start0;
    Vec2 p1 = start1;
    Vec2 slope0{1.0, 0.0};
    Vec2 slope1 = -slope0;

    const size_t max_steps = 4 * points.size() + 4;

    while (p0 != start1 && p1 != start0) {
        if (result.steps.size() >= max_steps) {
            log->error("Flatness roll did not terminate after {} steps ({} points)",
                       result.steps.size(), points.size());
            throw std::runtime_error(
                "min_zone_flatness: roll did not terminate after " +
                std::to_string(result.steps.size()) +
                " steps; duplicate or degenerate points?");
        }

        auto c0 = best_candidate(points, p0, slope0);
        auto c1 = best_candidate(points, p1, slope1);
        if (!c0 || !c1) {
            throw std::runtime_error("min_zone_flatness: no candidate point to roll onto");
        }

        if (c0->alignment >= c1->alignment) {
            p0 = points[c0->index];
            slope0 = c0->direction;
            slope1 = -slope0;
        } else {
            p1 = points[c1->index];
            slope1 = c1->direction;
            slope0 = -slope1;
        }

        Vec2 normal = slope0.perpendicular();
        double separation = std::abs((p1 - p0).dot(normal));
        result.steps.push_back(FlatnessStep{separation, slope0, p0, p1});
    }

    if (result.steps.empty()) {
        // Lowest and highest point coincide: every point lies on one
        // horizontal line.
        result.flatness = 0.0;
        return result;
    }

    result.flatness = std::numeric_limits<double>::infinity();
    for (const auto& step : result.steps) {
        result.flatness = std::min(result.flatness, step.separation);
    }

    log->debug("Flatness {} from {} roll steps over {} points",
               result.flatness, result.steps.size(), points.size());
    return result;
}

}  // namespace animatic
