#include "cli_common.hpp"
#include "render_output.hpp"
#include <demos/flatness_roll.hpp>
#include <geometry/flatness.hpp>
#include <io/point_csv.hpp>
#include <serialization/config_json.hpp>
#include <common/logging.hpp>

namespace animatic::cli {

int command_animate_flatness(int argc, char** argv) {
    auto log = animatic::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: animatic animate-flatness <points.csv> -o <frames-dir|video.mp4> [-c config.json]\n";
            return ctx.help ? 0 : 1;
        }

        nlohmann::json config = load_config(ctx);
        SceneConfig scene_config = flatness_scene_defaults();
        if (config.contains("scene")) {
            from_json(config["scene"], scene_config);
        }
        FlatnessDemoConfig demo_config;
        if (config.contains("flatness")) {
            from_json(config["flatness"], demo_config);
        }

        std::vector<Vec2> points = load_points_csv(ctx.input_path);
        FlatnessResult result = min_zone_flatness(points);
        log->info("Flatness {} over {} roll steps", result.flatness, result.steps.size());

        Scene scene = build_flatness_roll(points, result, demo_config, scene_config);
        render_scene(scene, export_config(ctx, config));
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace animatic::cli
