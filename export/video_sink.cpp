#include "video_sink.hpp"
#include "ffmpeg_pipe_sink.hpp"
#include "ppm_sequence_sink.hpp"
#include <stdexcept>

namespace animatic {

std::unique_ptr<VideoSink> make_sink(const ExportConfig& config) {
    if (config.sink == "ppm") {
        return std::make_unique<PpmSequenceSink>(config.output);
    }
    if (config.sink == "ffmpeg") {
        return std::make_unique<FfmpegPipeSink>(config.output, config.ffmpeg_path,
                                                config.ffmpeg_extra_args);
    }
    throw std::invalid_argument("Unknown sink '" + config.sink + "' (expected ppm or ffmpeg)");
}

}  // namespace animatic
