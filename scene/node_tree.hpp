#ifndef ANIMATIC_SCENE_NODE_TREE_HPP
#define ANIMATIC_SCENE_NODE_TREE_HPP

#include "node.hpp"
#include <span>
#include <string>
#include <vector>

namespace animatic {

// Arena holding one entity: a tree of SceneNodes addressed by index.
// Node 0 is the root. A node is only ever added under an existing parent, so
// parent ids are always smaller than child ids and the tree cannot cycle.
// Copying a NodeTree yields a fully independent deep copy.
class NodeTree {
public:
    static constexpr NodeId kRoot = 0;

    NodeTree();
    explicit NodeTree(const SceneNode& root);

    // Node management
    NodeId add_node(const SceneNode& node, NodeId parent);
    SceneNode& node(NodeId id);
    const SceneNode& node(NodeId id) const;
    SceneNode& root() { return node(kRoot); }
    const SceneNode& root() const { return node(kRoot); }
    size_t node_count() const { return nodes_.size(); }
    const std::vector<SceneNode>& nodes() const { return nodes_; }
    bool contains(NodeId id) const { return id < nodes_.size(); }

    // Grafts a copy of `subtree` under `parent`. Returns the new id of the
    // subtree's root. Throws CompositionError before any mutation if
    // `parent` does not exist.
    NodeId attach(NodeId parent, const NodeTree& subtree);
    std::vector<NodeId> attach(NodeId parent, std::span<const NodeTree> subtrees);

    // Named attribute access: common fields, then the node kind's own fields,
    // then the extension map. Throws AttributeError for unknown names on get
    // and for values of the wrong type on typed fields.
    AttributeValue get_attribute(NodeId id, const std::string& name) const;
    void set_attribute(NodeId id, const std::string& name, const AttributeValue& value);
    bool has_attribute(NodeId id, const std::string& name) const;

    // Transforms
    const Vec3& local_position(NodeId id) const { return node(id).position; }
    const Mat3& local_orientation(NodeId id) const { return node(id).orientation; }
    Vec3 global_position(NodeId id) const;
    Mat3 global_orientation(NodeId id) const;

    // Product of local opacities from `id` up to the root
    double effective_opacity(NodeId id) const;

    void move(NodeId id, const MoveSpec& request);

private:
    std::vector<SceneNode> nodes_;
};

}  // namespace animatic

#endif // ANIMATIC_SCENE_NODE_TREE_HPP
