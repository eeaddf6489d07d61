#ifndef ANIMATIC_CLI_RENDER_OUTPUT_HPP
#define ANIMATIC_CLI_RENDER_OUTPUT_HPP

#include "cli_common.hpp"
#include <serialization/config_json.hpp>
#include <render/software_rasterizer.hpp>
#include <timeline/scene.hpp>
#include <memory>

namespace animatic::cli {

// Export settings from the "export" section of the config, with -o as the
// output when given. A .mp4/.mkv/.mov/.avi output selects the ffmpeg sink.
inline ExportConfig export_config(const CommandContext& ctx, const nlohmann::json& config) {
    ExportConfig result;
    if (config.contains("export")) {
        result = config["export"].get<ExportConfig>();
    }
    if (!ctx.output_path.empty()) {
        result.output = ctx.output_path;
        for (const char* ext : {".mp4", ".mkv", ".mov", ".avi"}) {
            const std::string suffix = ext;
            if (result.output.size() > suffix.size() &&
                result.output.compare(result.output.size() - suffix.size(), suffix.size(), suffix) == 0) {
                result.sink = "ffmpeg";
            }
        }
    }
    return result;
}

// Plays the whole timeline into the configured sink
inline int render_scene(Scene& scene, const ExportConfig& config) {
    auto sink = make_sink(config);
    std::unique_ptr<SoftwareRasterizer> rasterizer = config.font.empty()
        ? std::make_unique<SoftwareRasterizer>()
        : std::make_unique<SoftwareRasterizer>(config.font);
    int count = scene.render_to(*sink, *rasterizer);
    std::cerr << "Wrote " << config.output << " (" << count << " frames)\n";
    return count;
}

}  // namespace animatic::cli

#endif // ANIMATIC_CLI_RENDER_OUTPUT_HPP
