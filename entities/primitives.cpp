#include "primitives.hpp"
#include <geometry/polygon.hpp>
#include <stdexcept>
#include <string>

namespace animatic {

SceneNode styled_node(const NodeStyle& style, NodeShape shape) {
    SceneNode node;
    node.position = style.position;
    node.orientation = style.orientation;
    node.opacity = style.opacity;
    node.visible = style.visible;
    node.color = style.color;
    node.size = style.size;
    node.shape = std::move(shape);
    return node;
}

namespace {

SceneNode vertex_node(const Vec3& coords) {
    SceneNode vertex;
    vertex.position = coords;
    vertex.shape = shape::Point{};
    return vertex;
}

}  // namespace

NodeTree make_group(const NodeStyle& style) {
    return NodeTree(styled_node(style, shape::Group{}));
}

NodeTree make_point(const Vec3& coords, const NodeStyle& style) {
    SceneNode node = styled_node(style, shape::Point{});
    node.position = coords;
    return NodeTree(node);
}

NodeTree make_line(const Vec3& coords, const Vec3& slope, const NodeStyle& style) {
    if (slope.length() == 0.0) {
        throw std::invalid_argument("make_line: slope must be non-zero");
    }
    SceneNode node = styled_node(style, shape::Line{slope.normalized()});
    node.position = coords;
    return NodeTree(node);
}

NodeTree make_segment(const Vec3& start, const Vec3& end, const NodeStyle& style) {
    NodeTree tree(styled_node(style, shape::Segment{}));
    tree.add_node(vertex_node(start), NodeTree::kRoot);
    tree.add_node(vertex_node(end), NodeTree::kRoot);
    return tree;
}

NodeTree make_circle(double radius, const NodeStyle& style) {
    return NodeTree(styled_node(style, shape::Circle{radius}));
}

NodeTree make_disk(double radius, const NodeStyle& style) {
    return NodeTree(styled_node(style, shape::Disk{radius}));
}

NodeTree make_wedge(double radius, double start_angle, double end_angle, const NodeStyle& style) {
    return NodeTree(styled_node(style, shape::Wedge{radius, start_angle, end_angle}));
}

NodeTree make_polygon(const std::vector<Vec3>& vertices, const NodeStyle& style) {
    Polygon2 outline;
    outline.reserve(vertices.size());
    for (const Vec3& v : vertices) {
        outline.push_back(xy(v));
    }
    bool convex = outline.size() < 3 || is_convex(outline);

    NodeTree tree(styled_node(style, shape::Polygon{convex}));
    for (const Vec3& v : vertices) {
        tree.add_node(vertex_node(v), NodeTree::kRoot);
    }
    return tree;
}

NodeTree make_text(const std::string& text, double scale, const NodeStyle& style) {
    return NodeTree(styled_node(style, shape::Text{text, scale}));
}

NodeTree make_contour(const std::vector<ContourSegment>& segments,
                      double jaggedness,
                      int n_points,
                      uint32_t seed,
                      const NodeStyle& style) {
    if (n_points < 2) {
        throw std::invalid_argument("make_contour: n_points must be at least 2");
    }
    return NodeTree(styled_node(style, shape::Contour{segments, jaggedness, n_points, seed}));
}

NodeTree make_face(const std::vector<shape::Contour>& boundaries, const NodeStyle& style) {
    return NodeTree(styled_node(style, shape::Face{boundaries}));
}

std::vector<Vec2> polygon_vertices(const NodeTree& tree, NodeId id) {
    const SceneNode& n = tree.node(id);
    if (!std::holds_alternative<shape::Polygon>(n.shape)) {
        throw std::invalid_argument("polygon_vertices: node " + std::to_string(id) + " is a " +
                                    kind_name(n.shape));
    }
    std::vector<Vec2> vertices;
    vertices.reserve(n.children.size());
    for (NodeId child : n.children) {
        vertices.push_back(xy(tree.global_position(child)));
    }
    return vertices;
}

double segment_length(const NodeTree& tree, NodeId id) {
    const SceneNode& n = tree.node(id);
    if (!std::holds_alternative<shape::Segment>(n.shape) || n.children.size() < 2) {
        throw std::invalid_argument("segment_length: node " + std::to_string(id) +
                                    " is not a segment with two endpoints");
    }
    return tree.local_position(n.children[0]).distance_to(tree.local_position(n.children[1]));
}

}  // namespace animatic
