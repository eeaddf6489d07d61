#include "node_renderer.hpp"
#include <geometry/contour.hpp>
#include <geometry/leader_path.hpp>
#include <algorithm>
#include <cmath>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace animatic {

namespace {

// Far enough to leave any frame; the rasterizer clips the rest
constexpr double kInfiniteLineReach = 1.0e6;

int stroke(const SceneNode& n) {
    return std::max(1, static_cast<int>(std::lround(n.size)));
}

// In-plane rotation of a frame, radians
double frame_angle(const Mat3& m) {
    return std::atan2(m.cols[0].y, m.cols[0].x);
}

std::vector<Vec2> contour_pixels(const NodeTree& tree, NodeId id, const shape::Contour& c,
                                 const Viewport& view) {
    const Vec3 origin = tree.global_position(id);
    const Mat3 frame = tree.global_orientation(id);
    ContourSamples samples = jagged_samples(c.segments, c.jaggedness, c.n_points, c.seed);

    std::vector<Vec2> pixels;
    pixels.reserve(samples.points.size());
    for (const Vec2& p : samples.points) {
        pixels.push_back(view.to_pixel(origin + frame * p.to_vec3()));
    }
    return pixels;
}

std::vector<Vec2> local_pixels(const NodeTree& tree, NodeId id, const std::vector<Vec3>& points,
                               const Viewport& view) {
    const Vec3 origin = tree.global_position(id);
    const Mat3 frame = tree.global_orientation(id);
    std::vector<Vec2> pixels;
    pixels.reserve(points.size());
    for (const Vec3& p : points) {
        pixels.push_back(view.to_pixel(origin + frame * p));
    }
    return pixels;
}

void draw_self(const NodeTree& tree, NodeId id, FrameBuffer& buffer,
               Rasterizer& rasterizer, const Viewport& view) {
    const SceneNode& n = tree.node(id);
    const Vec2 center = view.to_pixel(tree.global_position(id));

    std::visit([&](auto&& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, shape::Group> || std::is_same_v<T, shape::Dial>) {
            for (NodeId child : n.children) {
                render_node(tree, child, buffer, rasterizer, view);
            }
        } else if constexpr (std::is_same_v<T, shape::Point>) {
            rasterizer.draw_point(buffer, center, n.size, n.color);
        } else if constexpr (std::is_same_v<T, shape::Line>) {
            Vec3 slope = tree.global_orientation(id) * s.slope.normalized();
            Vec3 p = tree.global_position(id);
            rasterizer.draw_line(buffer,
                                 view.to_pixel(p + slope * kInfiniteLineReach),
                                 view.to_pixel(p - slope * kInfiniteLineReach),
                                 n.color, stroke(n));
        } else if constexpr (std::is_same_v<T, shape::Segment>) {
            if (n.children.size() < 2) {
                throw std::runtime_error("segment node " + std::to_string(id) +
                                         " needs two endpoint children");
            }
            rasterizer.draw_line(buffer,
                                 view.to_pixel(tree.global_position(n.children[0])),
                                 view.to_pixel(tree.global_position(n.children[1])),
                                 n.color, stroke(n));
        } else if constexpr (std::is_same_v<T, shape::Circle>) {
            rasterizer.draw_circle(buffer, center, s.radius * view.scale, n.color, stroke(n));
        } else if constexpr (std::is_same_v<T, shape::Disk>) {
            rasterizer.fill_circle(buffer, center, s.radius * view.scale, n.color);
        } else if constexpr (std::is_same_v<T, shape::Wedge>) {
            double turn = frame_angle(tree.global_orientation(id));
            rasterizer.fill_wedge(buffer, center, s.radius * view.scale,
                                  s.start_angle + turn, s.end_angle + turn, n.color);
        } else if constexpr (std::is_same_v<T, shape::Polygon>) {
            std::vector<std::vector<Vec2>> loops(1);
            for (NodeId vertex : n.children) {
                loops[0].push_back(view.to_pixel(tree.global_position(vertex)));
            }
            rasterizer.fill_polygon(buffer, loops, n.color);
        } else if constexpr (std::is_same_v<T, shape::Text>) {
            rasterizer.draw_text(buffer, center, s.text, kTextBaseHeight * s.scale * view.scale,
                                 n.color, stroke(n));
        } else if constexpr (std::is_same_v<T, shape::Contour>) {
            rasterizer.draw_polyline(buffer, contour_pixels(tree, id, s, view), false,
                                     n.color, stroke(n));
        } else if constexpr (std::is_same_v<T, shape::Face>) {
            std::vector<std::vector<Vec2>> loops;
            for (const shape::Contour& boundary : s.boundaries) {
                loops.push_back(contour_pixels(tree, id, boundary, view));
            }
            rasterizer.fill_polygon(buffer, loops, n.color);
        } else if constexpr (std::is_same_v<T, shape::Leader>) {
            LeaderPath path = leader_path(s.vertices, s.start_arrow, s.end_arrow, s.extension,
                                          arrow_length_for(n.size));
            rasterizer.draw_polyline(buffer, local_pixels(tree, id, path.polyline, view), false,
                                     n.color, stroke(n));
            for (const auto* arrow : {&path.start_arrow, &path.end_arrow}) {
                if (arrow->empty()) continue;
                std::vector<std::vector<Vec2>> loop{local_pixels(tree, id, *arrow, view)};
                rasterizer.fill_polygon(buffer, loop, n.color);
            }
        }
    }, n.shape);
}

}  // namespace

void render_node(const NodeTree& tree, NodeId id, FrameBuffer& buffer,
                 Rasterizer& rasterizer, const Viewport& view) {
    const SceneNode& n = tree.node(id);
    if (!n.visible || n.opacity <= 0.0) {
        return;
    }
    if (const auto* leader = std::get_if<shape::Leader>(&n.shape)) {
        if (leader->extension <= 0.0) {
            return;
        }
    }

    if (n.opacity >= 1.0) {
        draw_self(tree, id, buffer, rasterizer, view);
        return;
    }

    FrameBuffer scratch = buffer;
    draw_self(tree, id, scratch, rasterizer, view);
    buffer.blend(scratch, tree.effective_opacity(id));
}

void render_tree(const NodeTree& tree, FrameBuffer& buffer,
                 Rasterizer& rasterizer, const Viewport& view) {
    render_node(tree, NodeTree::kRoot, buffer, rasterizer, view);
}

}  // namespace animatic
