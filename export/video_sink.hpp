#ifndef ANIMATIC_EXPORT_VIDEO_SINK_HPP
#define ANIMATIC_EXPORT_VIDEO_SINK_HPP

#include <render/frame_buffer.hpp>
#include <memory>
#include <string>

namespace animatic {

// Consumer of an ordered run of equally sized frames.
class VideoSink {
public:
    virtual ~VideoSink() = default;

    // Starts a stream. Every frame written afterwards must be width x height.
    virtual void open(int width, int height, int fps) = 0;
    virtual void write(const FrameBuffer& frame) = 0;
    virtual void close() = 0;

    // Ends the stream and removes whatever it already produced, so a failed
    // batch leaves no partial output. Does not throw.
    virtual void abort() noexcept = 0;
};

struct ExportConfig {
    std::string sink = "ppm";          // "ppm" or "ffmpeg"
    std::string output = "frames";     // directory for ppm, video file for ffmpeg
    std::string ffmpeg_path = "ffmpeg";
    std::string ffmpeg_extra_args;     // replaces the default encoder arguments when set
    std::string font;                  // text font file; empty looks up a system font
};

// Sink selected by config.sink. Throws std::invalid_argument for unknown names.
std::unique_ptr<VideoSink> make_sink(const ExportConfig& config);

}  // namespace animatic

#endif // ANIMATIC_EXPORT_VIDEO_SINK_HPP
