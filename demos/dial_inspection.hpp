#ifndef ANIMATIC_DEMOS_DIAL_INSPECTION_HPP
#define ANIMATIC_DEMOS_DIAL_INSPECTION_HPP

#include <timeline/scene.hpp>
#include <math/vec2.hpp>
#include <string>
#include <vector>

namespace animatic {

struct DialDemoConfig {
    double diameter = 1.25;                 // mm
    Vec3 dial_position{0.0, 1.103, 0.0};

    // Inspected part: the profile on top, a flat bottom `thickness` below y = 0
    double part_width = 6.0;
    double part_extension = 0.01;           // overhang past the profile ends
    double part_thickness = 0.25;
    Vec3 part_position{-3.0, -1.8, 0.0};
    Color part_color{250, 180, 130};

    Color annotation_color{0, 156, 230};
    std::string low_reading = "0.08";
    std::string high_reading = "0.52";
};

SceneConfig dial_scene_defaults();

// Polygon entity for a measured profile: two bottom corners followed by the
// profile points, hidden (opacity 0) until faded in.
NodeTree make_inspected_part(const std::vector<Vec2>& profile, const DialDemoConfig& config);

// Full flatness inspection: the part slides under a dial indicator whose
// plunger tracks the surface, the swept range is highlighted, and the
// flatness (computed from the profile) is derived on screen.
Scene build_dial_inspection(const std::vector<Vec2>& profile,
                            const DialDemoConfig& config = {},
                            const SceneConfig& scene_config = dial_scene_defaults());

}  // namespace animatic

#endif // ANIMATIC_DEMOS_DIAL_INSPECTION_HPP
