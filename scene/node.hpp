#ifndef ANIMATIC_SCENE_NODE_HPP
#define ANIMATIC_SCENE_NODE_HPP

#include "attribute.hpp"
#include <geometry/contour.hpp>
#include <math/vec3.hpp>
#include <math/mat3.hpp>
#include <math/quaternion.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace animatic {

using NodeId = uint32_t;

namespace shape {

// Draws nothing itself; renders its children
struct Group {};

// Filled dot at the node origin, radius = size in pixels
struct Point {};

// Infinite line through the node origin along `slope` (local frame)
struct Line {
    Vec3 slope = vec3::unit_x();
};

// Segment between the first two child Point nodes
struct Segment {};

struct Circle {
    double radius = 1.0;
};

struct Disk {
    double radius = 1.0;
};

// Filled circular sector. Angles in radians, counter-clockwise from +x.
struct Wedge {
    double radius = 1.0;
    double start_angle = 0.0;
    double end_angle = 0.0;
};

// Filled polygon whose vertices are the child Point nodes, in order
struct Polygon {
    bool convex = true;
};

// Text run anchored at its lower-left corner. `scale` is a font scale factor:
// glyph height is a fixed base height times scale times the render resolution.
struct Text {
    std::string text;
    double scale = 1.0;
};

// Stroked chain of line/arc segments, optionally jagged
struct Contour {
    std::vector<ContourSegment> segments;
    double jaggedness = 0.0;
    int n_points = 30;
    uint32_t seed = 0;
};

// Filled region bounded by one or more contours (outer boundary plus holes)
struct Face {
    std::vector<Contour> boundaries;
};

// Polyline with optional arrow heads, drawn up to `extension` of its length
struct Leader {
    std::vector<Vec3> vertices;
    bool start_arrow = false;
    bool end_arrow = false;
    double extension = 0.0;
};

// Dial indicator state. Part ids refer to nodes in the same tree.
struct Dial {
    double diameter = 1.0;
    double readout_scale = 1.0;
    double deflection = 0.0;
    double readout = 0.0;
    double min_swept = 0.0;
    double max_swept = 0.0;
    bool highlight_show = false;
    bool plunger_show = true;

    NodeId needle = 0;
    NodeId plunger = 0;
    NodeId wedge = 0;
    NodeId min_line = 0;
    NodeId max_line = 0;
};

}  // namespace shape

using NodeShape = std::variant<
    shape::Group, shape::Point, shape::Line, shape::Segment,
    shape::Circle, shape::Disk, shape::Wedge, shape::Polygon,
    shape::Text, shape::Contour, shape::Face, shape::Leader, shape::Dial
>;

// Kind name for logging ("group", "polygon", ...)
std::string kind_name(const NodeShape& shape);

// One element of the scene graph. Position and orientation are relative to
// the parent; the columns of `orientation` are the local i, j, k axes.
struct SceneNode {
    NodeId id = 0;
    std::optional<NodeId> parent;
    std::vector<NodeId> children;

    Vec3 position;
    Mat3 orientation;
    double opacity = 1.0;
    bool visible = true;
    Color color = colors::white();
    double size = 1.0;  // stroke or point thickness, pixels

    NodeShape shape = shape::Group{};

    // Attributes outside the typed schema
    std::map<std::string, AttributeValue> extras;
};

// Arguments to NodeTree::move. Absolute values take precedence over deltas.
struct MoveSpec {
    std::optional<Vec3> position;
    std::optional<Vec3> delta_position;
    std::optional<Mat3> orientation;
    std::optional<Quaternion> delta_rotation;
};

}  // namespace animatic

#endif // ANIMATIC_SCENE_NODE_HPP
