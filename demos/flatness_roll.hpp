#ifndef ANIMATIC_DEMOS_FLATNESS_ROLL_HPP
#define ANIMATIC_DEMOS_FLATNESS_ROLL_HPP

#include <timeline/scene.hpp>
#include <geometry/flatness.hpp>
#include <vector>

namespace animatic {

struct FlatnessDemoConfig {
    double step_duration = 0.15;        // seconds per roll position
    double point_size = 4.0;
    Color point_color = colors::white();
    Color lower_color{0, 255, 0};
    Color upper_color{255, 0, 0};
    bool cycle = true;                  // play the roll back in reverse afterwards
};

SceneConfig flatness_scene_defaults();

// Animation of the two support lines rolling around a point set, one roll
// position of `result` per step.
Scene build_flatness_roll(const std::vector<Vec2>& points,
                          const FlatnessResult& result,
                          const FlatnessDemoConfig& config = {},
                          const SceneConfig& scene_config = flatness_scene_defaults());

}  // namespace animatic

#endif // ANIMATIC_DEMOS_FLATNESS_ROLL_HPP
