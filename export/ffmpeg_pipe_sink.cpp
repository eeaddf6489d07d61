#include "ffmpeg_pipe_sink.hpp"
#include <common/logging.hpp>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace animatic {

FfmpegPipeSink::FfmpegPipeSink(std::string output, std::string ffmpeg_path, std::string extra_args)
    : output_(std::move(output)),
      ffmpeg_path_(std::move(ffmpeg_path)),
      extra_args_(std::move(extra_args)) {}

FfmpegPipeSink::~FfmpegPipeSink() {
    if (pipe_) {
        pclose(pipe_);
    }
}

std::string FfmpegPipeSink::command(int width, int height, int fps) const {
    std::ostringstream cmd;
    cmd << ffmpeg_path_
        << " -y -loglevel error"
        << " -f rawvideo"
        << " -pixel_format rgb24"
        << " -video_size " << width << "x" << height
        << " -framerate " << fps
        << " -i - ";
    if (!extra_args_.empty()) {
        cmd << extra_args_ << " ";
    } else {
        cmd << "-c:v libx264 -preset veryfast -crf 18 ";
    }
    cmd << "-pix_fmt yuv420p \"" << output_ << "\"";
    return cmd.str();
}

void FfmpegPipeSink::open(int width, int height, int fps) {
    if (pipe_) {
        throw std::logic_error("FfmpegPipeSink::open: already open");
    }
    std::string cmd = command(width, height, fps);
    logging::get_logger()->debug("FFmpeg command: {}", cmd);

    pipe_ = popen(cmd.c_str(), "w");
    if (!pipe_) {
        throw std::runtime_error("Failed to start ffmpeg process: " + ffmpeg_path_);
    }
    width_ = width;
    height_ = height;
}

void FfmpegPipeSink::write(const FrameBuffer& frame) {
    if (!pipe_) {
        throw std::logic_error("FfmpegPipeSink::write: sink is not open");
    }
    if (frame.width() != width_ || frame.height() != height_) {
        throw std::invalid_argument("FfmpegPipeSink::write: frame size does not match the stream");
    }
    const auto& bytes = frame.data();
    size_t written = fwrite(bytes.data(), 1, bytes.size(), pipe_);
    if (written != bytes.size()) {
        throw std::runtime_error("FFmpeg pipe write short: " + std::to_string(written) + " / " +
                                 std::to_string(bytes.size()) + " bytes");
    }
}

void FfmpegPipeSink::close() {
    if (!pipe_) {
        return;
    }
    int status = pclose(pipe_);
    pipe_ = nullptr;
    if (status != 0) {
        throw std::runtime_error("ffmpeg exited with status " + std::to_string(status));
    }
    logging::get_logger()->info("Wrote video {}", output_);
}

void FfmpegPipeSink::abort() noexcept {
    if (pipe_) {
        pclose(pipe_);
        pipe_ = nullptr;
    }
    std::error_code ec;
    if (std::filesystem::remove(output_, ec)) {
        logging::get_logger()->warn("Removed partial video {}", output_);
    }
}

}  // namespace animatic
