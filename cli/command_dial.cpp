#include "cli_common.hpp"
#include "render_output.hpp"
#include <demos/dial_inspection.hpp>
#include <io/point_csv.hpp>
#include <serialization/config_json.hpp>
#include <common/logging.hpp>

namespace animatic::cli {

int command_dial(int argc, char** argv) {
    auto log = animatic::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: animatic dial <profile.csv> -o <frames-dir|video.mp4> [-c config.json]\n";
            return ctx.help ? 0 : 1;
        }

        nlohmann::json config = load_config(ctx);
        SceneConfig scene_config = dial_scene_defaults();
        if (config.contains("scene")) {
            from_json(config["scene"], scene_config);
        }
        DialDemoConfig demo_config;
        if (config.contains("dial")) {
            from_json(config["dial"], demo_config);
        }

        log->info("Building dial inspection from: {}", ctx.input_path);
        std::vector<Vec2> profile = load_points_csv(ctx.input_path);
        Scene scene = build_dial_inspection(profile, demo_config, scene_config);
        render_scene(scene, export_config(ctx, config));
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace animatic::cli
