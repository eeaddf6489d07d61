#ifndef ANIMATIC_TIMELINE_SCENE_HPP
#define ANIMATIC_TIMELINE_SCENE_HPP

#include "instruction.hpp"
#include <scene/node_tree.hpp>
#include <render/frame_buffer.hpp>
#include <render/node_renderer.hpp>
#include <render/rasterizer.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace animatic {

class VideoSink;

struct SceneConfig {
    int width = 1920;               // pixels
    int height = 1080;              // pixels
    double resolution = 100.0;      // pixels per mm
    int fps = 60;
    Color background = colors::black();
    std::optional<Vec2> origin;     // pixel position of the scene origin; image centre if unset
};

// Timeline/replay engine. Owns the registered entities, a snapshot of each
// as registered, and a sparse frame-indexed script of instructions.
//
// Any frame is materialized by replaying the script: forward seeks replay
// only the newly crossed frames, backward seeks restore every entity from its
// snapshot and replay from frame 0. Instructions may be relative, so there
// is no shortcut for going backwards.
class Scene {
public:
    explicit Scene(const SceneConfig& config = {});

    const SceneConfig& config() const { return config_; }
    Viewport viewport() const;

    // Elapsed time of a frame in seconds
    double time_of(int frame) const;

    // Entity registry. Entities render in registration order. Registering an
    // alias again replaces that entity (and its snapshot) in place.
    void register_entity(const std::string& alias, const NodeTree& tree);
    bool has_entity(const std::string& alias) const;
    NodeTree& entity(const std::string& alias);
    const NodeTree& entity(const std::string& alias) const;
    std::vector<std::string> aliases() const;

    // Script
    void append_instruction(int frame, Instruction instr);
    const std::map<int, std::vector<Instruction>>& script() const { return script_; }
    int last_frame() const;
    int current_frame() const { return current_frame_; }

    // Brings every entity to the state at the start of `frame`, i.e. after
    // all instructions of frames [0, frame). Throws ReplayError if an
    // instruction fails.
    void seek(int frame);

    // Renders the current state. Does not change the timeline.
    FrameBuffer capture(Rasterizer& rasterizer) const;

    // seek + capture for every frame in [start, end]; `end` defaults to the
    // last scheduled frame. Fails as a whole: no frames are returned if any
    // instruction fails.
    std::vector<FrameBuffer> frames(Rasterizer& rasterizer, int start = 0,
                                    std::optional<int> end = std::nullopt);

    // Same range as frames(), streamed to `sink` one frame at a time.
    // Returns the number of frames written. On any failure the sink is
    // aborted, discarding what it wrote, and the error is rethrown.
    int render_to(VideoSink& sink, Rasterizer& rasterizer, int start = 0,
                  std::optional<int> end = std::nullopt);

private:
    struct Entity {
        std::string alias;
        NodeTree live;
        NodeTree initial;
    };

    Entity& find(const std::string& alias);
    const Entity& find(const std::string& alias) const;
    void reset();
    void replay(int from, int to);
    int resolve_end(int start, std::optional<int> end) const;

    SceneConfig config_;
    std::vector<Entity> entities_;
    std::map<int, std::vector<Instruction>> script_;
    int current_frame_ = 0;
    bool dirty_ = false;  // a replay failed part-way; next seek must reset
};

}  // namespace animatic

#endif // ANIMATIC_TIMELINE_SCENE_HPP
