#include "dial_inspection.hpp"
#include <animation/builders.hpp>
#include <entities/dial_indicator.hpp>
#include <entities/leader.hpp>
#include <entities/primitives.hpp>
#include <geometry/flatness.hpp>
#include <common/logging.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace animatic {

namespace {

NodeTree make_label(const std::string& text, double scale, double size, const Vec3& position,
                    const Color& color) {
    return make_text(text, scale, {.position = position, .opacity = 0.0, .color = color, .size = size});
}

NodeTree make_annotation(const std::vector<Vec3>& vertices, bool end_arrow, double size,
                         const Color& color) {
    return make_leader(vertices, false, end_arrow, 0.0, {.color = color, .size = size});
}

}  // namespace

SceneConfig dial_scene_defaults() {
    SceneConfig config;
    config.width = 1920;
    config.height = 1080;
    config.resolution = 272.0;
    config.fps = 60;
    return config;
}

NodeTree make_inspected_part(const std::vector<Vec2>& profile, const DialDemoConfig& config) {
    if (profile.size() < 2) {
        throw std::invalid_argument("make_inspected_part: profile needs at least 2 points");
    }
    std::vector<Vec3> vertices{
        {config.part_width + config.part_extension, -config.part_thickness, 0.0},
        {-config.part_extension, -config.part_thickness, 0.0},
    };
    for (const Vec2& p : profile) {
        vertices.push_back(p.to_vec3());
    }
    return make_polygon(vertices, {.position = config.part_position, .opacity = 0.0,
                                   .color = config.part_color});
}

Scene build_dial_inspection(const std::vector<Vec2>& profile, const DialDemoConfig& config,
                            const SceneConfig& scene_config) {
    using namespace animation;
    auto log = logging::get_logger();

    const double flatness = min_zone_flatness(profile).flatness;
    log->info("Profile flatness: {:.4f} mm over {} points", flatness, profile.size());

    const Color white = colors::white();
    const Color ano = config.annotation_color;

    Scene scene(scene_config);
    scene.register_entity("dial", make_dial_indicator(config.diameter, {},
                                                      {.position = config.dial_position, .opacity = 0.0}));
    scene.register_entity("poly", make_inspected_part(profile, config));
    scene.register_entity("title_text_1", make_label("FLATNESS MEASUREMENT", 0.010, 3.0, {-1.97, 0.8, 0.0}, white));
    scene.register_entity("title_text_2", make_label("WITH DIAL INDICATOR", 0.010, 3.0, {-1.61, 0.4, 0.0}, white));

    scene.register_entity("flat_lo_leader", make_annotation(
        {{0.0, 0.2130, 0.0}, {0.4818, 1.0893, 0.0}, {0.6818, 1.0893, 0.0}}, false, 2.0, ano));
    scene.register_entity("flat_hi_leader", make_annotation(
        {{0.0, 0.2130, 0.0}, {-0.1253, -0.7791, 0.0}, {-0.3253, -0.7791, 0.0}}, false, 2.0, ano));
    scene.register_entity("flat_lo_text", make_label(config.low_reading, 0.005, 2.0, {0.75, 1.04, 0.0}, ano));
    scene.register_entity("flat_hi_text", make_label(config.high_reading, 0.005, 2.0, {-0.74, -0.83, 0.0}, ano));

    scene.register_entity("meas_flat_text", make_label("MEASURED FLATNESS", 0.005, 2.0, {-2.95, -0.70, 0.0}, white));
    scene.register_entity("minus_text", make_label("-", 0.005, 2.0, {-2.55, -0.90, 0.0}, ano));
    scene.register_entity("equals_text", make_label("=", 0.005, 2.0, {-1.95, -0.90, 0.0}, ano));
    scene.register_entity("flat_dim_text", make_label(fmt::format("{:.2f}", flatness), 0.005, 2.0,
                                                      {-1.75, -0.90, 0.0}, ano));
    scene.register_entity("mm_text", make_label("mm", 0.005, 2.0, {-1.35, -0.90, 0.0}, ano));

    scene.register_entity("top_dim_arrow", make_annotation(
        {{-3.00, -0.85, 0.0}, {-3.20, -0.85, 0.0}, {-3.20, -1.275, 0.0}}, true, 1.0, ano));
    scene.register_entity("bottom_dim_arrow", make_annotation(
        {{-3.20, -2.00, 0.0}, {-3.20, -1.72, 0.0}}, true, 1.0, ano));
    scene.register_entity("top_dim_line", make_annotation(
        {{-3.30, -1.275, 0.0}, {3.30, -1.275, 0.0}}, false, 1.0, ano));
    scene.register_entity("bottom_dim_line", make_annotation(
        {{-3.30, -1.72, 0.0}, {3.30, -1.72, 0.0}}, false, 1.0, ano));

    const Command track = [](Scene& s) { dial::track(s.entity("dial"), s.entity("poly")); };
    const Command reset_highlight = [](Scene& s) { dial::reset_highlight(s.entity("dial")); };
    const Command show_highlight = [](Scene& s) { dial::display_highlight(s.entity("dial"), true); };
    const Command hide_highlight = [](Scene& s) { dial::display_highlight(s.entity("dial"), false); };

    // Opening: black, then the part and title
    pause(scene, 1.5);
    fade_in(scene, 1.5, "title_text_1", Profile::Sigmoid, 1.5);
    fade_in(scene, 1.5, "title_text_2", Profile::Sigmoid, 1.5);
    fade_in(scene, 1.5, "poly", Profile::Sigmoid, 1.5);
    fade_out(scene, 1.0, "title_text_1", Profile::Sigmoid, 5.5);
    fade_out(scene, 1.0, "title_text_2", Profile::Sigmoid, 5.5);

    // Dial comes in and is lowered onto the part
    fade_in(scene, 1.5, "dial", Profile::Sigmoid, 7.0);
    slide(scene, 2.5, "poly", {-2.97, 0.0, 0.0}, Profile::Sigmoid, 9.5);
    sweep_cmd(scene, 43.0, "dial.track(poly)", track, 12.0);
    slide(scene, 2.0, "dial", {0.0, -0.89, 0.0}, Profile::Sinusoid, 12.0);

    // Traverse, return, then traverse again recording the swept range
    slide(scene, 10.0, "poly", {5.94, 0.0, 0.0}, Profile::Linear, 15.0);
    slide(scene, 2.0, "poly", {-5.94, 0.0, 0.0}, Profile::Sigmoid, 26.5);
    set_cmd(scene, "dial.reset_highlight()", reset_highlight, 29.5);
    set_cmd(scene, "dial.display_highlight(True)", show_highlight, 29.5);
    slide(scene, 15.0, "poly", {5.94, 0.0, 0.0}, Profile::Linear, 30.0);

    // Readings at both ends of the swept range
    sweep_attr(scene, 0.5, "flat_lo_leader", "extension", 0.0, 1.0, Profile::Sinusoid, 46.0);
    fade_in(scene, 0.5, "flat_lo_text", Profile::Sigmoid, 46.5);
    sweep_attr(scene, 0.5, "flat_hi_leader", "extension", 0.0, 1.0, Profile::Sinusoid, 48.0);
    fade_in(scene, 0.5, "flat_hi_text", Profile::Sigmoid, 48.5);

    set_cmd(scene, "dial.reset_highlight()", reset_highlight, 50.5);
    set_cmd(scene, "dial.display_highlight(False)", hide_highlight, 50.5);
    fade_out(scene, 1.0, "flat_hi_leader", Profile::Linear, 51.0);
    fade_out(scene, 1.0, "flat_lo_leader", Profile::Linear, 51.0);

    slide(scene, 1.0, "dial", {0.0, 4.0, 0.0}, Profile::Quadratic, 52.0);
    set_attr(scene, "dial", "opacity", 0.0, 53.0);

    // Subtraction of the two readings
    slide_to(scene, 1.0, "flat_hi_text", {-2.95, -0.9, 0.0}, Profile::Sigmoid, 53.0);
    slide_to(scene, 1.0, "flat_lo_text", {-2.35, -0.9, 0.0}, Profile::Sigmoid, 53.0);
    fade_in(scene, 0.5, "meas_flat_text", Profile::Sigmoid, 54.0);
    fade_in(scene, 0.5, "minus_text", Profile::Sigmoid, 54.0);
    fade_in(scene, 0.5, "equals_text", Profile::Sigmoid, 55.5);
    fade_in(scene, 0.5, "flat_dim_text", Profile::Sigmoid, 55.5);
    fade_in(scene, 0.5, "mm_text", Profile::Sigmoid, 56.0);

    fade_out(scene, 1.0, "minus_text", Profile::Sigmoid, 57.5);
    fade_out(scene, 1.0, "equals_text", Profile::Sigmoid, 57.5);
    fade_out(scene, 1.0, "flat_lo_text", Profile::Sigmoid, 57.5);
    fade_out(scene, 1.0, "flat_hi_text", Profile::Sigmoid, 57.5);
    slide_to(scene, 1.0, "flat_dim_text", {-2.95, -0.9, 0.0}, Profile::Sigmoid, 58.0);
    slide_to(scene, 1.0, "mm_text", {-2.55, -0.9, 0.0}, Profile::Sigmoid, 58.0);

    // Dimension lines on the recentred part
    slide(scene, 2.0, "poly", {-2.97, 0.0, 0.0}, Profile::Sigmoid, 59.0);
    sweep_attr(scene, 0.5, "top_dim_arrow", "extension", 0.0, 1.0, Profile::Sinusoid, 61.0);
    sweep_attr(scene, 0.5, "bottom_dim_arrow", "extension", 0.0, 1.0, Profile::Sinusoid, 61.0);
    sweep_attr(scene, 0.5, "top_dim_line", "extension", 0.0, 1.0, Profile::Sinusoid, 61.5);
    sweep_attr(scene, 0.5, "bottom_dim_line", "extension", 0.0, 1.0, Profile::Sinusoid, 61.5);

    for (const char* alias : {"top_dim_arrow", "bottom_dim_arrow", "top_dim_line", "bottom_dim_line"}) {
        fade_out(scene, 0.5, alias, Profile::Sigmoid, 65.0);
    }
    for (const char* alias : {"meas_flat_text", "mm_text", "flat_dim_text"}) {
        fade_out(scene, 0.5, alias, Profile::Sigmoid, 65.5);
    }
    fade_out(scene, 0.5, "poly", Profile::Sigmoid, 66.0);
    pause(scene, 1.5);

    log->debug("Dial inspection script: {} entities, last frame {}",
               scene.aliases().size(), scene.last_frame());
    return scene;
}

}  // namespace animatic
