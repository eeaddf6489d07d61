#include "cli_common.hpp"
#include <geometry/flatness.hpp>
#include <io/point_csv.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/flatness_json.hpp>
#include <common/logging.hpp>

namespace animatic::cli {

int command_flatness(int argc, char** argv) {
    auto log = animatic::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: animatic flatness <points.csv> [-o report.json]\n";
            return ctx.help ? 0 : 1;
        }

        log->info("Computing flatness of: {}", ctx.input_path);
        std::vector<Vec2> points = load_points_csv(ctx.input_path);
        FlatnessResult result = min_zone_flatness(points);
        log->debug("Flatness search took {} roll steps", result.steps.size());

        std::cout << "FLATNESS: " << result.flatness << "\n";

        if (ctx.output_path.empty()) {
            return 0;
        }

        json::Report report;
        report.kind = "flatness";
        report.generated_at = json::utc_timestamp();
        report.source = ctx.input_path;
        report.data = flatness_to_json(result);
        report.stats = {
            {"point_count", points.size()},
            {"step_count", result.steps.size()}
        };
        json::write_report(ctx.output_path, report);

        log->info("Wrote flatness report to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << result.steps.size() << " steps)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace animatic::cli
