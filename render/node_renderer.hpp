#ifndef ANIMATIC_RENDER_NODE_RENDERER_HPP
#define ANIMATIC_RENDER_NODE_RENDERER_HPP

#include "frame_buffer.hpp"
#include "rasterizer.hpp"
#include <scene/node_tree.hpp>
#include <math/vec2.hpp>

namespace animatic {

// Base glyph height in pixels for a text scale of 1 at 1 px/mm
constexpr double kTextBaseHeight = 22.0;

// Scene millimetres to pixels: pixel = origin + xy * [1, -1] * scale
struct Viewport {
    double scale = 1.0;   // px per mm
    Vec2 origin;          // pixel position of the scene origin

    Vec2 to_pixel(const Vec3& p) const {
        return {origin.x + p.x * scale, origin.y - p.y * scale};
    }
};

// Draws node `id` and, for group-like nodes, its descendants.
// Invisible or fully transparent nodes draw nothing. A partially transparent
// node is drawn into a scratch copy that is then blended over `buffer` with
// the node's effective opacity.
void render_node(const NodeTree& tree, NodeId id, FrameBuffer& buffer,
                 Rasterizer& rasterizer, const Viewport& view);

// Draws the whole tree from its root
void render_tree(const NodeTree& tree, FrameBuffer& buffer,
                 Rasterizer& rasterizer, const Viewport& view);

}  // namespace animatic

#endif // ANIMATIC_RENDER_NODE_RENDERER_HPP
