#ifndef ANIMATIC_ENTITIES_LEADER_HPP
#define ANIMATIC_ENTITIES_LEADER_HPP

#include "primitives.hpp"
#include <geometry/leader_path.hpp>
#include <vector>

namespace animatic {

// Annotation polyline with optional arrow heads. Vertices are in the leader's
// own frame. `extension` (0..1) is the drawn fraction; sweep it to animate
// the leader growing from its first vertex.
NodeTree make_leader(const std::vector<Vec3>& vertices,
                     bool start_arrow = false,
                     bool end_arrow = false,
                     double extension = 0.0,
                     const NodeStyle& style = {});

// Total length of the leader's polyline
double leader_length(const NodeTree& tree, NodeId id = NodeTree::kRoot);

// Geometry currently visible for a leader node, in its own frame
LeaderPath visible_leader_path(const NodeTree& tree, NodeId id = NodeTree::kRoot);

}  // namespace animatic

#endif // ANIMATIC_ENTITIES_LEADER_HPP
