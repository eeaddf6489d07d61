#include "flatness_roll.hpp"
#include <animation/builders.hpp>
#include <entities/primitives.hpp>
#include <common/logging.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace animatic {

SceneConfig flatness_scene_defaults() {
    SceneConfig config;
    config.width = 1500;
    config.height = 1000;
    config.resolution = 5.0;
    config.fps = 60;
    config.origin = Vec2{500.0, 1000.0};
    return config;
}

Scene build_flatness_roll(const std::vector<Vec2>& points, const FlatnessResult& result,
                          const FlatnessDemoConfig& config, const SceneConfig& scene_config) {
    if (result.steps.empty()) {
        throw std::invalid_argument("build_flatness_roll: flatness result has no steps");
    }
    auto log = logging::get_logger();

    Scene scene(scene_config);

    NodeTree cloud = make_group();
    for (const Vec2& p : points) {
        cloud.attach(NodeTree::kRoot, make_point(p.to_vec3(), {.color = config.point_color,
                                                               .size = config.point_size}));
    }
    scene.register_entity("points", cloud);

    const FlatnessStep& first = result.steps.front();
    scene.register_entity("lower", make_line(first.p0.to_vec3(), first.slope.to_vec3(),
                                             {.color = config.lower_color}));
    scene.register_entity("upper", make_line(first.p1.to_vec3(), first.slope.to_vec3(),
                                             {.color = config.upper_color}));
    scene.register_entity("label", make_text(fmt::format("FLATNESS {:.4f}", result.flatness), 0.25,
                                             {.position = {10.0, 190.0, 0.0}, .opacity = 0.0, .size = 2.0}));

    const int frames_per_step = animation::frame_count(config.step_duration, scene_config.fps);
    std::vector<size_t> order;
    for (size_t i = 0; i < result.steps.size(); ++i) {
        order.push_back(i);
    }
    if (config.cycle) {
        for (size_t i = result.steps.size(); i-- > 0;) {
            order.push_back(i);
        }
    }

    int frame = 0;
    for (size_t index : order) {
        const FlatnessStep& step = result.steps[index];
        scene.append_instruction(frame, instruction::SetPosition{"lower", step.p0.to_vec3()});
        scene.append_instruction(frame, instruction::SetAttribute{"lower", "slope", step.slope.to_vec3()});
        scene.append_instruction(frame, instruction::SetPosition{"upper", step.p1.to_vec3()});
        scene.append_instruction(frame, instruction::SetAttribute{"upper", "slope", step.slope.to_vec3()});
        frame += frames_per_step;
    }

    animation::fade_in(scene, 0.5, "label");
    animation::pause(scene, 1.0);

    log->debug("Flatness roll: {} steps, {} frames", order.size(), scene.last_frame() + 1);
    return scene;
}

}  // namespace animatic
