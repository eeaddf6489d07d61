#ifndef ANIMATIC_ENTITIES_PRIMITIVES_HPP
#define ANIMATIC_ENTITIES_PRIMITIVES_HPP

#include <scene/node_tree.hpp>
#include <geometry/contour.hpp>
#include <math/vec3.hpp>
#include <string>
#include <vector>

namespace animatic {

// Common visual settings for a new entity root
struct NodeStyle {
    Vec3 position;
    Mat3 orientation;
    double opacity = 1.0;
    bool visible = true;
    Color color = colors::white();
    double size = 1.0;
};

SceneNode styled_node(const NodeStyle& style, NodeShape shape);

NodeTree make_group(const NodeStyle& style = {});

// Point at `coords`; style.position is ignored
NodeTree make_point(const Vec3& coords, const NodeStyle& style = {});

// Infinite line through `coords` with direction `slope`
NodeTree make_line(const Vec3& coords, const Vec3& slope, const NodeStyle& style = {});

// Segment with endpoint children at `start` and `end`
NodeTree make_segment(const Vec3& start, const Vec3& end, const NodeStyle& style = {});

NodeTree make_circle(double radius, const NodeStyle& style = {});
NodeTree make_disk(double radius, const NodeStyle& style = {});
NodeTree make_wedge(double radius, double start_angle, double end_angle, const NodeStyle& style = {});

// Filled polygon with one Point child per vertex. Convexity is evaluated once
// at construction from the xy coordinates.
NodeTree make_polygon(const std::vector<Vec3>& vertices, const NodeStyle& style = {});

NodeTree make_text(const std::string& text, double scale, const NodeStyle& style = {});

NodeTree make_contour(const std::vector<ContourSegment>& segments,
                      double jaggedness = 0.0,
                      int n_points = 30,
                      uint32_t seed = 0,
                      const NodeStyle& style = {});

NodeTree make_face(const std::vector<shape::Contour>& boundaries, const NodeStyle& style = {});

// Global xy of each vertex of a polygon node, in order
std::vector<Vec2> polygon_vertices(const NodeTree& tree, NodeId id);

// Length of a segment node in its parent frame
double segment_length(const NodeTree& tree, NodeId id);

}  // namespace animatic

#endif // ANIMATIC_ENTITIES_PRIMITIVES_HPP
