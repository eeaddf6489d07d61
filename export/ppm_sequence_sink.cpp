#include "ppm_sequence_sink.hpp"
#include <common/logging.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace animatic {

void write_ppm(const std::filesystem::path& path, const FrameBuffer& frame) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path.string());
    }
    file << "P6\n" << frame.width() << " " << frame.height() << "\n255\n";
    const auto& bytes = frame.data();
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw std::runtime_error("Short write to file: " + path.string());
    }
}

PpmSequenceSink::PpmSequenceSink(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

void PpmSequenceSink::open(int width, int height, int fps) {
    created_directory_ = std::filesystem::create_directories(directory_);
    width_ = width;
    height_ = height;
    frame_index_ = 0;
    open_ = true;
    logging::get_logger()->info("Writing {}x{} frames at {} fps to {}/", width, height, fps,
                                directory_.string());
}

std::filesystem::path PpmSequenceSink::frame_path(int index) const {
    char name[32];
    std::snprintf(name, sizeof(name), "frame_%05d.ppm", index);
    return directory_ / name;
}

void PpmSequenceSink::write(const FrameBuffer& frame) {
    if (!open_) {
        throw std::logic_error("PpmSequenceSink::write: sink is not open");
    }
    if (frame.width() != width_ || frame.height() != height_) {
        throw std::invalid_argument("PpmSequenceSink::write: frame size does not match the stream");
    }
    write_ppm(frame_path(frame_index_), frame);
    ++frame_index_;
}

void PpmSequenceSink::close() {
    if (open_) {
        logging::get_logger()->debug("Wrote {} frames to {}/", frame_index_, directory_.string());
    }
    open_ = false;
}

void PpmSequenceSink::abort() noexcept {
    auto log = logging::get_logger();
    std::error_code ec;
    // frame_index_ itself may be a half-written file from a failed write
    for (int i = 0; i <= frame_index_; ++i) {
        std::filesystem::remove(frame_path(i), ec);
        if (ec) {
            log->warn("Could not remove {}: {}", frame_path(i).string(), ec.message());
        }
    }
    if (created_directory_) {
        std::filesystem::remove(directory_, ec);
        created_directory_ = false;
    }
    log->warn("Discarded {} partial frames in {}/", frame_index_, directory_.string());
    frame_index_ = 0;
    open_ = false;
}

}  // namespace animatic
