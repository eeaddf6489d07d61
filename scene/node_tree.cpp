#include "node_tree.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <cmath>
#include <stdexcept>

namespace animatic {

namespace {

template <typename T>
T expect(const AttributeValue& value, const std::string& name) {
    if (const auto* v = std::get_if<T>(&value)) {
        return *v;
    }
    throw AttributeError("attribute '" + name + "' expects " + type_name(AttributeValue{T{}}) +
                         ", got " + type_name(value));
}

int expect_int(const AttributeValue& value, const std::string& name) {
    return static_cast<int>(std::lround(expect<double>(value, name)));
}

std::optional<AttributeValue> get_shape_field(const NodeShape& shape, const std::string& name) {
    return std::visit([&name](auto&& s) -> std::optional<AttributeValue> {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, shape::Line>) {
            if (name == "slope") return s.slope;
        } else if constexpr (std::is_same_v<T, shape::Circle> || std::is_same_v<T, shape::Disk>) {
            if (name == "radius") return s.radius;
        } else if constexpr (std::is_same_v<T, shape::Wedge>) {
            if (name == "radius") return s.radius;
            if (name == "start_angle") return s.start_angle;
            if (name == "end_angle") return s.end_angle;
        } else if constexpr (std::is_same_v<T, shape::Polygon>) {
            if (name == "convex") return s.convex;
        } else if constexpr (std::is_same_v<T, shape::Text>) {
            if (name == "text") return s.text;
            if (name == "scale") return s.scale;
        } else if constexpr (std::is_same_v<T, shape::Contour>) {
            if (name == "jaggedness") return s.jaggedness;
            if (name == "n_points") return static_cast<double>(s.n_points);
            if (name == "seed") return static_cast<double>(s.seed);
        } else if constexpr (std::is_same_v<T, shape::Leader>) {
            if (name == "extension") return s.extension;
            if (name == "start_arrow") return s.start_arrow;
            if (name == "end_arrow") return s.end_arrow;
        } else if constexpr (std::is_same_v<T, shape::Dial>) {
            if (name == "diameter") return s.diameter;
            if (name == "readout_scale") return s.readout_scale;
            if (name == "deflection") return s.deflection;
            if (name == "readout") return s.readout;
            if (name == "min_swept") return s.min_swept;
            if (name == "max_swept") return s.max_swept;
            if (name == "highlight_show") return s.highlight_show;
            if (name == "plunger_show") return s.plunger_show;
        }
        return std::nullopt;
    }, shape);
}

// Returns false if `name` is not a field of this node kind
bool set_shape_field(NodeShape& shape, const std::string& name, const AttributeValue& value) {
    return std::visit([&name, &value](auto&& s) -> bool {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, shape::Line>) {
            if (name == "slope") { s.slope = expect<Vec3>(value, name); return true; }
        } else if constexpr (std::is_same_v<T, shape::Circle> || std::is_same_v<T, shape::Disk>) {
            if (name == "radius") { s.radius = expect<double>(value, name); return true; }
        } else if constexpr (std::is_same_v<T, shape::Wedge>) {
            if (name == "radius") { s.radius = expect<double>(value, name); return true; }
            if (name == "start_angle") { s.start_angle = expect<double>(value, name); return true; }
            if (name == "end_angle") { s.end_angle = expect<double>(value, name); return true; }
        } else if constexpr (std::is_same_v<T, shape::Polygon>) {
            if (name == "convex") { s.convex = expect<bool>(value, name); return true; }
        } else if constexpr (std::is_same_v<T, shape::Text>) {
            if (name == "text") { s.text = expect<std::string>(value, name); return true; }
            if (name == "scale") { s.scale = expect<double>(value, name); return true; }
        } else if constexpr (std::is_same_v<T, shape::Contour>) {
            if (name == "jaggedness") { s.jaggedness = expect<double>(value, name); return true; }
            if (name == "n_points") { s.n_points = expect_int(value, name); return true; }
            if (name == "seed") { s.seed = static_cast<uint32_t>(expect_int(value, name)); return true; }
        } else if constexpr (std::is_same_v<T, shape::Leader>) {
            if (name == "extension") { s.extension = expect<double>(value, name); return true; }
            if (name == "start_arrow") { s.start_arrow = expect<bool>(value, name); return true; }
            if (name == "end_arrow") { s.end_arrow = expect<bool>(value, name); return true; }
        } else if constexpr (std::is_same_v<T, shape::Dial>) {
            if (name == "diameter") { s.diameter = expect<double>(value, name); return true; }
            if (name == "readout_scale") { s.readout_scale = expect<double>(value, name); return true; }
            if (name == "deflection") { s.deflection = expect<double>(value, name); return true; }
            if (name == "readout") { s.readout = expect<double>(value, name); return true; }
            if (name == "min_swept") { s.min_swept = expect<double>(value, name); return true; }
            if (name == "max_swept") { s.max_swept = expect<double>(value, name); return true; }
            if (name == "highlight_show") { s.highlight_show = expect<bool>(value, name); return true; }
            if (name == "plunger_show") { s.plunger_show = expect<bool>(value, name); return true; }
        }
        return false;
    }, shape);
}

}  // namespace

std::string kind_name(const NodeShape& shape) {
    return std::visit([](auto&& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, shape::Group>) return "group";
        else if constexpr (std::is_same_v<T, shape::Point>) return "point";
        else if constexpr (std::is_same_v<T, shape::Line>) return "line";
        else if constexpr (std::is_same_v<T, shape::Segment>) return "segment";
        else if constexpr (std::is_same_v<T, shape::Circle>) return "circle";
        else if constexpr (std::is_same_v<T, shape::Disk>) return "disk";
        else if constexpr (std::is_same_v<T, shape::Wedge>) return "wedge";
        else if constexpr (std::is_same_v<T, shape::Polygon>) return "polygon";
        else if constexpr (std::is_same_v<T, shape::Text>) return "text";
        else if constexpr (std::is_same_v<T, shape::Contour>) return "contour";
        else if constexpr (std::is_same_v<T, shape::Face>) return "face";
        else if constexpr (std::is_same_v<T, shape::Leader>) return "leader";
        else return "dial";
    }, shape);
}

NodeTree::NodeTree() : NodeTree(SceneNode{}) {}

NodeTree::NodeTree(const SceneNode& root) {
    SceneNode new_root = root;
    new_root.id = kRoot;
    new_root.parent.reset();
    new_root.children.clear();
    nodes_.push_back(std::move(new_root));
}

NodeId NodeTree::add_node(const SceneNode& node, NodeId parent) {
    if (!contains(parent)) {
        throw CompositionError("NodeTree::add_node: parent " + std::to_string(parent) +
                               " does not exist");
    }
    NodeId id = static_cast<NodeId>(nodes_.size());
    SceneNode new_node = node;
    new_node.id = id;
    new_node.parent = parent;
    new_node.children.clear();
    nodes_.push_back(std::move(new_node));
    nodes_[parent].children.push_back(id);
    return id;
}

SceneNode& NodeTree::node(NodeId id) {
    if (id >= nodes_.size()) {
        throw std::out_of_range("NodeTree::node: invalid node id " + std::to_string(id));
    }
    return nodes_[id];
}

const SceneNode& NodeTree::node(NodeId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("NodeTree::node: invalid node id " + std::to_string(id));
    }
    return nodes_[id];
}

NodeId NodeTree::attach(NodeId parent, const NodeTree& subtree) {
    if (!contains(parent)) {
        throw CompositionError("NodeTree::attach: parent " + std::to_string(parent) +
                               " does not exist");
    }

    // Copied first: `subtree` may be this tree, whose storage grows below.
    // Ids are parent-before-child, so a single pass can remap them.
    const std::vector<SceneNode> source = subtree.nodes();
    const NodeId offset = static_cast<NodeId>(nodes_.size());
    for (const SceneNode& src : source) {
        NodeId new_parent = src.parent ? *src.parent + offset : parent;
        add_node(src, new_parent);
    }

    // Part ids stored in dial state are tree-relative
    for (NodeId id = offset; id < nodes_.size(); ++id) {
        if (auto* dial = std::get_if<shape::Dial>(&nodes_[id].shape)) {
            dial->needle += offset;
            dial->plunger += offset;
            dial->wedge += offset;
            dial->min_line += offset;
            dial->max_line += offset;
        }
    }
    return offset;
}

std::vector<NodeId> NodeTree::attach(NodeId parent, std::span<const NodeTree> subtrees) {
    if (!contains(parent)) {
        throw CompositionError("NodeTree::attach: parent " + std::to_string(parent) +
                               " does not exist");
    }
    std::vector<NodeId> roots;
    roots.reserve(subtrees.size());
    for (const NodeTree& subtree : subtrees) {
        roots.push_back(attach(parent, subtree));
    }
    return roots;
}

AttributeValue NodeTree::get_attribute(NodeId id, const std::string& name) const {
    const SceneNode& n = node(id);

    if (name == "opacity") return n.opacity;
    if (name == "visible") return n.visible;
    if (name == "color") return n.color;
    if (name == "size") return n.size;
    if (name == "position") return n.position;
    if (name == "orientation") return n.orientation;

    if (auto field = get_shape_field(n.shape, name)) {
        return *field;
    }

    auto it = n.extras.find(name);
    if (it == n.extras.end()) {
        throw AttributeError("unknown attribute '" + name + "' on " + kind_name(n.shape) +
                             " node " + std::to_string(id));
    }
    return it->second;
}

void NodeTree::set_attribute(NodeId id, const std::string& name, const AttributeValue& value) {
    SceneNode& n = node(id);

    if (name == "opacity") { n.opacity = expect<double>(value, name); return; }
    if (name == "visible") { n.visible = expect<bool>(value, name); return; }
    if (name == "color") { n.color = expect<Color>(value, name); return; }
    if (name == "size") { n.size = expect<double>(value, name); return; }
    if (name == "position") { n.position = expect<Vec3>(value, name); return; }
    if (name == "orientation") { n.orientation = expect<Mat3>(value, name); return; }

    if (set_shape_field(n.shape, name, value)) {
        return;
    }

    logging::get_logger()->trace("NodeTree: storing extension attribute '{}' on node {}", name, id);
    n.extras[name] = value;
}

bool NodeTree::has_attribute(NodeId id, const std::string& name) const {
    try {
        get_attribute(id, name);
        return true;
    } catch (const AttributeError&) {
        return false;
    }
}

Vec3 NodeTree::global_position(NodeId id) const {
    const SceneNode& n = node(id);
    if (!n.parent) {
        return n.position;
    }
    return global_position(*n.parent) + global_orientation(*n.parent) * n.position;
}

Mat3 NodeTree::global_orientation(NodeId id) const {
    const SceneNode& n = node(id);
    if (!n.parent) {
        return n.orientation;
    }
    return n.orientation * global_orientation(*n.parent);
}

double NodeTree::effective_opacity(NodeId id) const {
    const SceneNode& n = node(id);
    if (!n.parent) {
        return n.opacity;
    }
    return n.opacity * effective_opacity(*n.parent);
}

void NodeTree::move(NodeId id, const MoveSpec& request) {
    SceneNode& n = node(id);

    if (request.position) {
        n.position = *request.position;
    } else if (request.delta_position) {
        n.position += *request.delta_position;
    }

    if (request.orientation) {
        n.orientation = *request.orientation;
    } else if (request.delta_rotation) {
        // Columns rotate independently; repeated deltas can drift from orthonormal
        for (auto& axis : n.orientation.cols) {
            axis = request.delta_rotation->rotate(axis);
        }
    }
}

}  // namespace animatic
