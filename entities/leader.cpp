#include "leader.hpp"
#include <stdexcept>
#include <string>

namespace animatic {

namespace {

const shape::Leader& leader_shape(const NodeTree& tree, NodeId id) {
    const SceneNode& n = tree.node(id);
    const auto* leader = std::get_if<shape::Leader>(&n.shape);
    if (!leader) {
        throw std::invalid_argument("node " + std::to_string(id) + " is a " +
                                    kind_name(n.shape) + ", not a leader");
    }
    return *leader;
}

}  // namespace

NodeTree make_leader(const std::vector<Vec3>& vertices,
                     bool start_arrow,
                     bool end_arrow,
                     double extension,
                     const NodeStyle& style) {
    shape::Leader leader{vertices, start_arrow, end_arrow, extension};
    return NodeTree(styled_node(style, std::move(leader)));
}

double leader_length(const NodeTree& tree, NodeId id) {
    return polyline_length(leader_shape(tree, id).vertices);
}

LeaderPath visible_leader_path(const NodeTree& tree, NodeId id) {
    const shape::Leader& leader = leader_shape(tree, id);
    return leader_path(leader.vertices, leader.start_arrow, leader.end_arrow, leader.extension,
                       arrow_length_for(tree.node(id).size));
}

}  // namespace animatic
