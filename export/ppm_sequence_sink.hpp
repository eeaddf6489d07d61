#ifndef ANIMATIC_EXPORT_PPM_SEQUENCE_SINK_HPP
#define ANIMATIC_EXPORT_PPM_SEQUENCE_SINK_HPP

#include "video_sink.hpp"
#include <filesystem>
#include <string>

namespace animatic {

// Writes each frame as a binary PPM (P6): <directory>/frame_00000.ppm, ...
class PpmSequenceSink : public VideoSink {
public:
    explicit PpmSequenceSink(std::filesystem::path directory);

    void open(int width, int height, int fps) override;
    void write(const FrameBuffer& frame) override;
    void close() override;
    void abort() noexcept override;

    int frames_written() const { return frame_index_; }

    // Path of the i-th frame file
    std::filesystem::path frame_path(int index) const;

private:
    std::filesystem::path directory_;
    int width_ = 0;
    int height_ = 0;
    int frame_index_ = 0;
    bool open_ = false;
    bool created_directory_ = false;
};

// Writes one frame as a binary PPM file. Throws std::runtime_error on I/O failure.
void write_ppm(const std::filesystem::path& path, const FrameBuffer& frame);

}  // namespace animatic

#endif // ANIMATIC_EXPORT_PPM_SEQUENCE_SINK_HPP
