#include "scene.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <export/video_sink.hpp>
#include <algorithm>
#include <stdexcept>

namespace animatic {

Scene::Scene(const SceneConfig& config) : config_(config) {
    if (config_.width <= 0 || config_.height <= 0) {
        throw std::invalid_argument("Scene: width and height must be positive");
    }
    if (config_.fps <= 0) {
        throw std::invalid_argument("Scene: fps must be positive");
    }
    if (config_.resolution <= 0.0) {
        throw std::invalid_argument("Scene: resolution must be positive");
    }
    append_instruction(0, instruction::Marker{});
}

Viewport Scene::viewport() const {
    Vec2 origin = config_.origin.value_or(Vec2{static_cast<double>(config_.width / 2),
                                               static_cast<double>(config_.height / 2)});
    return Viewport{config_.resolution, origin};
}

double Scene::time_of(int frame) const {
    return static_cast<double>(frame) / config_.fps;
}

void Scene::register_entity(const std::string& alias, const NodeTree& tree) {
    auto it = std::find_if(entities_.begin(), entities_.end(),
                           [&alias](const Entity& e) { return e.alias == alias; });
    if (it != entities_.end()) {
        logging::get_logger()->debug("Scene: replacing entity '{}'", alias);
        it->live = tree;
        it->initial = tree;
        return;
    }
    logging::get_logger()->debug("Scene: registered entity '{}' ({} nodes)", alias, tree.node_count());
    entities_.push_back(Entity{alias, tree, tree});
}

bool Scene::has_entity(const std::string& alias) const {
    return std::any_of(entities_.begin(), entities_.end(),
                       [&alias](const Entity& e) { return e.alias == alias; });
}

Scene::Entity& Scene::find(const std::string& alias) {
    for (Entity& e : entities_) {
        if (e.alias == alias) {
            return e;
        }
    }
    throw std::out_of_range("unknown entity '" + alias + "'");
}

const Scene::Entity& Scene::find(const std::string& alias) const {
    for (const Entity& e : entities_) {
        if (e.alias == alias) {
            return e;
        }
    }
    throw std::out_of_range("unknown entity '" + alias + "'");
}

NodeTree& Scene::entity(const std::string& alias) {
    return find(alias).live;
}

const NodeTree& Scene::entity(const std::string& alias) const {
    return find(alias).live;
}

std::vector<std::string> Scene::aliases() const {
    std::vector<std::string> result;
    result.reserve(entities_.size());
    for (const Entity& e : entities_) {
        result.push_back(e.alias);
    }
    return result;
}

void Scene::append_instruction(int frame, Instruction instr) {
    if (frame < 0) {
        throw std::invalid_argument("Scene::append_instruction: negative frame " +
                                    std::to_string(frame));
    }
    script_[frame].push_back(std::move(instr));
}

int Scene::last_frame() const {
    return script_.rbegin()->first;
}

void Scene::reset() {
    logging::get_logger()->debug("Scene: reset to frame 0");
    for (Entity& e : entities_) {
        e.live = e.initial;
    }
    current_frame_ = 0;
    dirty_ = false;
}

void Scene::replay(int from, int to) {
    auto first = script_.lower_bound(from);
    auto last = script_.lower_bound(to);
    for (auto it = first; it != last; ++it) {
        const int frame = it->first;
        for (const Instruction& instr : it->second) {
            try {
                apply(instr, *this);
            } catch (const std::exception& e) {
                dirty_ = true;
                ReplayError error(frame, time_of(frame), describe(instr), e.what());
                logging::get_logger()->error("{}", error.what());
                throw error;
            }
        }
    }
}

void Scene::seek(int frame) {
    if (frame < 0) {
        throw std::invalid_argument("Scene::seek: negative frame " + std::to_string(frame));
    }
    logging::get_logger()->trace("Scene: seek {} -> {}", current_frame_, frame);
    if (dirty_ || frame < current_frame_) {
        reset();
    }
    replay(current_frame_, frame);
    current_frame_ = frame;
}

FrameBuffer Scene::capture(Rasterizer& rasterizer) const {
    FrameBuffer buffer(config_.width, config_.height, config_.background);
    const Viewport view = viewport();
    for (const Entity& e : entities_) {
        render_tree(e.live, buffer, rasterizer, view);
    }
    return buffer;
}

int Scene::resolve_end(int start, std::optional<int> end) const {
    int last = end.value_or(last_frame());
    if (start < 0 || last < start) {
        throw std::invalid_argument("Scene: invalid frame range [" + std::to_string(start) +
                                    ", " + std::to_string(last) + "]");
    }
    return last;
}

std::vector<FrameBuffer> Scene::frames(Rasterizer& rasterizer, int start, std::optional<int> end) {
    const int last = resolve_end(start, end);
    auto logger = logging::get_logger();

    std::vector<FrameBuffer> result;
    result.reserve(static_cast<size_t>(last - start + 1));
    for (int i = start; i <= last; ++i) {
        if (i % 10 == 0 || i == last) {
            logger->debug("Getting frame {} of {}", i, last);
        }
        seek(i);
        result.push_back(capture(rasterizer));
    }
    return result;
}

int Scene::render_to(VideoSink& sink, Rasterizer& rasterizer, int start, std::optional<int> end) {
    const int last = resolve_end(start, end);
    auto logger = logging::get_logger();

    sink.open(config_.width, config_.height, config_.fps);
    try {
        for (int i = start; i <= last; ++i) {
            if (i % 10 == 0 || i == last) {
                logger->debug("Rendering frame {} of {}", i, last);
            }
            seek(i);
            sink.write(capture(rasterizer));
        }
        sink.close();
    } catch (const std::exception& e) {
        // The batch failed as a whole; nothing it wrote is kept
        logger->error("Rendering aborted: {}", e.what());
        sink.abort();
        throw;
    }

    int count = last - start + 1;
    logger->info("Rendered {} frames ({:.2f}s at {} fps)", count, time_of(count), config_.fps);
    return count;
}

}  // namespace animatic
