#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include <scene/node_tree.hpp>
#include <entities/primitives.hpp>
#include <common/errors.hpp>
#include <numbers>
#include <vector>

using namespace animatic;

TEST(NodeTreeTest, DefaultTreeHasRoot) {
    NodeTree tree;
    EXPECT_EQ(tree.node_count(), 1u);
    EXPECT_FALSE(tree.root().parent.has_value());
    EXPECT_TRUE(std::holds_alternative<shape::Group>(tree.root().shape));
}

TEST(NodeTreeTest, AddNodeLinksParent) {
    NodeTree tree;
    NodeId a = tree.add_node(SceneNode{}, NodeTree::kRoot);
    NodeId b = tree.add_node(SceneNode{}, a);

    EXPECT_EQ(*tree.node(b).parent, a);
    ASSERT_EQ(tree.node(a).children.size(), 1u);
    EXPECT_EQ(tree.node(a).children[0], b);
    EXPECT_LT(a, b);
}

TEST(NodeTreeTest, UnknownParentIsCompositionError) {
    NodeTree tree;
    tree.add_node(SceneNode{}, NodeTree::kRoot);
    EXPECT_THROW(tree.add_node(SceneNode{}, 17), CompositionError);
    EXPECT_THROW(tree.attach(17, make_point({1.0, 0.0, 0.0})), CompositionError);
    EXPECT_EQ(tree.node_count(), 2u);
}

TEST(NodeTreeTest, EffectiveOpacityMultiplies) {
    NodeTree tree = test::make_chain({0.5, 0.5, 0.4});
    NodeId leaf = static_cast<NodeId>(tree.node_count() - 1);
    EXPECT_NEAR(tree.effective_opacity(leaf), 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(tree.effective_opacity(NodeTree::kRoot), 0.5);
}

TEST(NodeTreeTest, GlobalPositionAccumulates) {
    NodeTree tree = test::make_chain({1.0, 1.0, 1.0}, {1.0, 0.0, 0.0});
    NodeId leaf = static_cast<NodeId>(tree.node_count() - 1);
    EXPECT_EQ(tree.global_position(leaf), Vec3(3.0, 0.0, 0.0));
    EXPECT_EQ(tree.local_position(leaf), Vec3(1.0, 0.0, 0.0));
}

TEST(NodeTreeTest, GlobalPositionFollowsParentRotation) {
    SceneNode root;
    root.orientation = Mat3::rotation_z(std::numbers::pi / 2.0);
    NodeTree tree(root);
    SceneNode child;
    child.position = {1.0, 0.0, 0.0};
    NodeId id = tree.add_node(child, NodeTree::kRoot);

    Vec3 p = tree.global_position(id);
    EXPECT_NEAR(p.x, 0.0, 1e-12);
    EXPECT_NEAR(p.y, 1.0, 1e-12);
    EXPECT_NEAR(p.z, 0.0, 1e-12);

    Vec3 axis = tree.global_orientation(id) * vec3::unit_x();
    EXPECT_NEAR(axis.y, 1.0, 1e-12);
}

TEST(NodeTreeTest, AttachCopiesSubtree) {
    NodeTree group = make_group();
    NodeTree poly = make_polygon({{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}});

    NodeId root = group.attach(NodeTree::kRoot, poly);
    EXPECT_EQ(group.node_count(), 5u);
    EXPECT_EQ(group.node(root).children.size(), 3u);
    EXPECT_EQ(*group.node(root).parent, NodeTree::kRoot);

    // Source is untouched and independent
    group.node(root + 1).position = {9.0, 9.0, 9.0};
    EXPECT_EQ(poly.node(1).position, Vec3(0.0, 0.0, 0.0));
}

TEST(NodeTreeTest, AttachToItselfGraftsASnapshot) {
    NodeTree tree = make_polygon({{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}});
    tree.root().position = {2.0, 0.0, 0.0};
    ASSERT_EQ(tree.node_count(), 4u);

    NodeId copy = tree.attach(NodeTree::kRoot, tree);
    EXPECT_EQ(copy, 4u);
    EXPECT_EQ(tree.node_count(), 8u);
    EXPECT_EQ(tree.root().children.size(), 4u);
    EXPECT_EQ(tree.root().children.back(), copy);
    EXPECT_EQ(*tree.node(copy).parent, NodeTree::kRoot);

    // The graft holds the tree as it was before the call
    EXPECT_EQ(tree.node(copy).children.size(), 3u);
    for (NodeId child : tree.node(copy).children) {
        EXPECT_EQ(*tree.node(child).parent, copy);
        EXPECT_TRUE(tree.node(child).children.empty());
    }
    EXPECT_EQ(tree.global_position(copy), Vec3(4.0, 0.0, 0.0));
    EXPECT_EQ(tree.global_position(copy + 2), Vec3(5.0, 0.0, 0.0));
}

TEST(NodeTreeTest, AttachManyFlattensToParent) {
    NodeTree group = make_group();
    std::vector<NodeTree> parts{make_point({1.0, 0.0, 0.0}), make_point({2.0, 0.0, 0.0})};
    std::vector<NodeId> roots = group.attach(NodeTree::kRoot, parts);

    ASSERT_EQ(roots.size(), 2u);
    EXPECT_EQ(group.root().children, roots);
    EXPECT_EQ(group.global_position(roots[1]), Vec3(2.0, 0.0, 0.0));
}

TEST(NodeTreeTest, CopiesAreIndependent) {
    NodeTree a = make_point({1.0, 0.0, 0.0});
    NodeTree b = a;
    b.root().position = {5.0, 0.0, 0.0};
    EXPECT_EQ(a.root().position, Vec3(1.0, 0.0, 0.0));
}

TEST(NodeTreeTest, CommonAttributes) {
    NodeTree tree = make_circle(2.0);
    tree.set_attribute(NodeTree::kRoot, "opacity", 0.25);
    tree.set_attribute(NodeTree::kRoot, "visible", false);
    tree.set_attribute(NodeTree::kRoot, "color", Color{1, 2, 3});

    EXPECT_DOUBLE_EQ(tree.root().opacity, 0.25);
    EXPECT_FALSE(tree.root().visible);
    EXPECT_EQ(std::get<Color>(tree.get_attribute(NodeTree::kRoot, "color")), (Color{1, 2, 3}));
}

TEST(NodeTreeTest, ShapeAttributes) {
    NodeTree tree = make_wedge(1.0, 0.0, 1.0);
    tree.set_attribute(NodeTree::kRoot, "end_angle", 2.0);
    EXPECT_DOUBLE_EQ(std::get<double>(tree.get_attribute(NodeTree::kRoot, "end_angle")), 2.0);
    EXPECT_DOUBLE_EQ(std::get<shape::Wedge>(tree.root().shape).end_angle, 2.0);
}

TEST(NodeTreeTest, WrongTypeIsAttributeError) {
    NodeTree tree = make_circle(2.0);
    EXPECT_THROW(tree.set_attribute(NodeTree::kRoot, "opacity", std::string("half")), AttributeError);
    EXPECT_THROW(tree.set_attribute(NodeTree::kRoot, "radius", true), AttributeError);
    EXPECT_DOUBLE_EQ(tree.root().opacity, 1.0);
}

TEST(NodeTreeTest, UnknownAttributeGoesToExtras) {
    NodeTree tree = make_group();
    EXPECT_FALSE(tree.has_attribute(NodeTree::kRoot, "label"));
    EXPECT_THROW(tree.get_attribute(NodeTree::kRoot, "label"), AttributeError);

    tree.set_attribute(NodeTree::kRoot, "label", std::string("part"));
    EXPECT_TRUE(tree.has_attribute(NodeTree::kRoot, "label"));
    EXPECT_EQ(std::get<std::string>(tree.get_attribute(NodeTree::kRoot, "label")), "part");
}

TEST(NodeTreeTest, InvalidIdThrows) {
    NodeTree tree;
    EXPECT_THROW(tree.node(3), std::out_of_range);
    EXPECT_THROW(tree.get_attribute(3, "opacity"), std::out_of_range);
}

TEST(NodeTreeTest, MoveAbsoluteWinsOverDelta) {
    NodeTree tree;
    MoveSpec request;
    request.position = Vec3(2.0, 0.0, 0.0);
    request.delta_position = Vec3(100.0, 0.0, 0.0);
    tree.move(NodeTree::kRoot, request);
    EXPECT_EQ(tree.root().position, Vec3(2.0, 0.0, 0.0));

    tree.move(NodeTree::kRoot, MoveSpec{.delta_position = Vec3(0.5, 1.0, 0.0)});
    EXPECT_EQ(tree.root().position, Vec3(2.5, 1.0, 0.0));
}

TEST(NodeTreeTest, MoveDeltaRotation) {
    NodeTree tree;
    MoveSpec request;
    request.delta_rotation = Quaternion::from_axis_angle(vec3::unit_z(), std::numbers::pi / 2.0);
    tree.move(NodeTree::kRoot, request);

    Vec3 i = tree.root().orientation.cols[0];
    EXPECT_NEAR(i.x, 0.0, 1e-12);
    EXPECT_NEAR(i.y, 1.0, 1e-12);

    request.orientation = Mat3::identity();
    tree.move(NodeTree::kRoot, request);
    EXPECT_EQ(tree.root().orientation, Mat3::identity());
}

TEST(NodeTreeTest, KindNames) {
    EXPECT_EQ(kind_name(make_group().root().shape), "group");
    EXPECT_EQ(kind_name(make_polygon({{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}}).root().shape),
              "polygon");
    EXPECT_EQ(kind_name(make_text("A", 1.0).root().shape), "text");
}
