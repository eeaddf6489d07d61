#ifndef ANIMATIC_EXPORT_FFMPEG_PIPE_SINK_HPP
#define ANIMATIC_EXPORT_FFMPEG_PIPE_SINK_HPP

#include "video_sink.hpp"
#include <cstdio>
#include <string>

namespace animatic {

// Streams raw RGB frames into an ffmpeg process that encodes `output`.
class FfmpegPipeSink : public VideoSink {
public:
    FfmpegPipeSink(std::string output, std::string ffmpeg_path = "ffmpeg",
                   std::string extra_args = "");
    ~FfmpegPipeSink() override;

    FfmpegPipeSink(const FfmpegPipeSink&) = delete;
    FfmpegPipeSink& operator=(const FfmpegPipeSink&) = delete;

    void open(int width, int height, int fps) override;
    void write(const FrameBuffer& frame) override;
    void close() override;
    void abort() noexcept override;

    // Shell command used to start the encoder
    std::string command(int width, int height, int fps) const;

private:
    std::string output_;
    std::string ffmpeg_path_;
    std::string extra_args_;
    FILE* pipe_ = nullptr;
    int width_ = 0;
    int height_ = 0;
};

}  // namespace animatic

#endif // ANIMATIC_EXPORT_FFMPEG_PIPE_SINK_HPP
