#include "dial_indicator.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>

namespace animatic {

namespace {

constexpr double kPi = std::numbers::pi;

// Proportions, as ratios of the dial diameter
// Needle
constexpr double kArrowLengthScale = 0.455;
constexpr double kArrowWidthScale = 0.020;
constexpr double kCenterCapScale = 0.070;

// Rim and holder
constexpr double kRimThickScale = 0.95;
constexpr double kHolderWidthScale = 0.130;
constexpr double kHolderLengthScale = 0.49;
constexpr double kColumnWidthScale = 0.133;
constexpr double kColumnLowLengthScale = 0.796;
constexpr double kColumnLowChamferLengthScale = 0.7;
constexpr double kColumnHighLengthScale = 0.547;
constexpr double kColumnHighChamferLengthScale = 0.531;
constexpr double kColumnChamferWidthScale = 0.101;

// Ticks
constexpr double kMajorTickScale = 0.80;
constexpr double kMediumTickScale = 0.84;
constexpr double kMinorTickScale = 0.88;
constexpr int kTickCount = 100;

// Numbers
constexpr double kNumberScale = 0.0018723;
constexpr double kNumberPosScale = 0.35;
constexpr double kNumberShiftX = -0.035;
constexpr double kNumberShiftY = -0.02;
constexpr double kZeroShiftScale = 0.0175;

// Plunger
constexpr double kPlungerDiaScale = 0.051;
constexpr double kPlungerTopDiaScale = 0.101;
constexpr double kPlungerTopChamferDiaScale = 0.05;
constexpr double kPlungerTipMountDiaScale = 0.063;
constexpr double kPlungerTipMountChamferDiaScale = 0.005;
constexpr double kPlungerTopLengthScale = 0.646;
constexpr double kPlungerTopChamferLengthScale = 0.637;
constexpr double kPlungerLengthScale = 1.535;
constexpr double kPlungerTipLengthScale = 1.595;
constexpr double kPlungerTipChamferLengthScale = 1.545;

// Legend, in units of kLegendArrowScale * diameter
constexpr double kLegendArrowScale = 0.03;
constexpr double kLegendNumberScale = 0.001;
const Vec3 kLegendDisplacement{-0.07, -0.18, 0.0};
const Vec3 kLegendTextOffset{0.3, -0.375, 0.0};
const Vec3 kLegendL1AStart{-1.2, 0.0, 0.0};
const Vec3 kLegendL1AEnd{-0.25, 0.0, 0.0};
const Vec3 kLegendL1BStart{-0.25, 0.375, 0.0};
const Vec3 kLegendL1BEnd{-0.25, -0.375, 0.0};
const Vec3 kLegendT1P1{-0.625, 0.1875, 0.0};
const Vec3 kLegendT1P2{-0.25, 0.0, 0.0};
const Vec3 kLegendT1P3{-0.625, -0.1875, 0.0};

constexpr Color kNeedleColor{128, 0, 0};
constexpr Color kFaceColor{210, 210, 210};
constexpr Color kRimColor{70, 70, 70};
constexpr Color kMeasWedgeColor{153, 217, 234};
constexpr double kMeasWedgeOpacity = 0.30;
constexpr Color kMeasLineColor{0, 90, 213};
constexpr double kMeasLineOpacity = 0.60;
constexpr Color kPlungerColor{190, 190, 190};
constexpr Color kPlungerTipColor{128, 0, 0};

Vec3 mirror_x(const Vec3& v) {
    return {-v.x, v.y, v.z};
}

double readout_angle(double readout) {
    return -readout * 2.0 * kPi / 100.0;
}

shape::Dial& mutable_state(NodeTree& tree, NodeId id) {
    SceneNode& n = tree.node(id);
    auto* d = std::get_if<shape::Dial>(&n.shape);
    if (!d) {
        throw std::invalid_argument("node " + std::to_string(id) + " is a " +
                                    kind_name(n.shape) + ", not a dial indicator");
    }
    return *d;
}

void update_plunger(NodeTree& tree, const shape::Dial& d) {
    tree.move(d.plunger, MoveSpec{.position = Vec3{0.0, d.deflection, 0.0}});
}

void set_min_max_swept(NodeTree& tree, const shape::Dial& d) {
    double min_angle = readout_angle(d.min_swept);
    double max_angle = readout_angle(d.max_swept);
    tree.move(d.min_line, MoveSpec{.orientation = Mat3::rotation_z(min_angle)});
    tree.move(d.max_line, MoveSpec{.orientation = Mat3::rotation_z(max_angle)});

    auto& wedge = std::get<shape::Wedge>(tree.node(d.wedge).shape);
    wedge.start_angle = kPi / 2.0 + min_angle;
    wedge.end_angle = kPi / 2.0 + max_angle;
}

NodeId add_polygon(NodeTree& tree, NodeId parent, const std::vector<Vec3>& vertices, Color color,
                   double opacity = 1.0) {
    return tree.attach(parent, make_polygon(vertices, {.opacity = opacity, .color = color}));
}

NodeId add_segment(NodeTree& tree, NodeId parent, const Vec3& start, const Vec3& end,
                   const NodeStyle& style) {
    return tree.attach(parent, make_segment(start, end, style));
}

void build_holder(NodeTree& tree, NodeId dial_group, double d) {
    tree.attach(dial_group, make_disk(d / 2.0, {.color = kRimColor, .size = 5.0}));

    const double cw = d * kColumnWidthScale / 2.0;
    const double chw = d * kColumnChamferWidthScale / 2.0;
    add_polygon(tree, dial_group, {
        {-cw, d * kColumnHighChamferLengthScale, 0.0},
        {-chw, d * kColumnHighLengthScale, 0.0},
        {chw, d * kColumnHighLengthScale, 0.0},
        {cw, d * kColumnHighChamferLengthScale, 0.0},
        {cw, -d * kColumnLowChamferLengthScale, 0.0},
        {chw, -d * kColumnLowLengthScale, 0.0},
        {-chw, -d * kColumnLowLengthScale, 0.0},
        {-cw, -d * kColumnLowChamferLengthScale, 0.0},
    }, kRimColor);

    tree.attach(dial_group, make_disk(d * kHolderWidthScale / 2.0,
                                      {.position = {0.0, -d * kHolderLengthScale, 0.0},
                                       .color = kRimColor}));
}

NodeId build_plunger(NodeTree& tree, NodeId root, double d) {
    NodeId plunger = tree.add_node(SceneNode{}, root);

    const double body = d * kPlungerDiaScale / 2.0;
    const double top = d * kPlungerTopDiaScale / 2.0;
    const double top_chamfer = d * kPlungerTopChamferDiaScale / 2.0;
    const double column_top = d * kColumnHighLengthScale;
    add_polygon(tree, plunger, {
        {-body, -d * kPlungerLengthScale, 0.0},
        {-body, column_top, 0.0},
        {-top, column_top, 0.0},
        {-top, d * kPlungerTopChamferLengthScale, 0.0},
        {-top_chamfer, d * kPlungerTopLengthScale, 0.0},
        {top_chamfer, d * kPlungerTopLengthScale, 0.0},
        {top, d * kPlungerTopChamferLengthScale, 0.0},
        {top, column_top, 0.0},
        {body, column_top, 0.0},
        {body, -d * kPlungerLengthScale, 0.0},
    }, kPlungerColor);

    const double mount = d * kPlungerTipMountDiaScale / 2.0;
    const double tip = d * kPlungerTipMountChamferDiaScale / 2.0;
    add_polygon(tree, plunger, {
        {-tip, -d * kPlungerTipLengthScale, 0.0},
        {-mount, -d * kPlungerTipChamferLengthScale, 0.0},
        {-mount, -d * kPlungerLengthScale, 0.0},
        {mount, -d * kPlungerLengthScale, 0.0},
        {mount, -d * kPlungerTipChamferLengthScale, 0.0},
        {tip, -d * kPlungerTipLengthScale, 0.0},
    }, kPlungerTipColor);

    return plunger;
}

void build_scale(NodeTree& tree, NodeId dial_group, double d) {
    const double tick_end = d * (1.0 + kRimThickScale) / 4.0;
    for (int i = 0; i < kTickCount; ++i) {
        double start_scale = kMinorTickScale;
        if (i % 10 == 0) {
            start_scale = kMajorTickScale;
        } else if (i % 5 == 0) {
            start_scale = kMediumTickScale;
        }
        NodeId tick = add_segment(tree, dial_group,
                                  {0.0, d * start_scale / 2.0, 0.0}, {0.0, tick_end, 0.0},
                                  {.color = kRimColor, .size = 1.0});
        double angle = static_cast<double>(i) / kTickCount * 2.0 * kPi;
        tree.move(tick, MoveSpec{.delta_rotation = Quaternion::from_axis_angle(vec3::unit_z(), angle)});
    }

    for (int i = 0; i < kTickCount; i += 10) {
        double theta = -2.0 * kPi * i / kTickCount + kPi / 2.0;
        Vec3 pos{kNumberShiftX * d + kNumberPosScale * d * std::cos(theta) +
                     (i == 0 ? kZeroShiftScale * d : 0.0),
                 kNumberShiftY * d + kNumberPosScale * d * std::sin(theta),
                 0.0};
        tree.attach(dial_group, make_text(std::to_string(i), kNumberScale * d,
                                          {.position = pos, .color = kRimColor, .size = 1.0}));
    }
}

void build_legend(NodeTree& tree, NodeId dial_group, double d) {
    const double s = kLegendArrowScale * d;
    NodeId legend = tree.add_node(SceneNode{}, dial_group);
    const NodeStyle line{.color = kRimColor};

    add_segment(tree, legend, kLegendL1AStart * s, kLegendL1AEnd * s, line);
    add_segment(tree, legend, kLegendL1BStart * s, kLegendL1BEnd * s, line);
    add_segment(tree, legend, mirror_x(kLegendL1AStart) * s, mirror_x(kLegendL1AEnd) * s, line);
    add_segment(tree, legend, mirror_x(kLegendL1BStart) * s, mirror_x(kLegendL1BEnd) * s, line);
    add_polygon(tree, legend, {kLegendT1P1 * s, kLegendT1P2 * s, kLegendT1P3 * s}, kRimColor);
    add_polygon(tree, legend, {mirror_x(kLegendT1P1) * s, mirror_x(kLegendT1P2) * s,
                               mirror_x(kLegendT1P3) * s}, kRimColor);
    tree.attach(legend, make_text("  0.01mm", kLegendNumberScale * d,
                                  {.position = kLegendTextOffset * s, .color = kRimColor, .size = 1.0}));

    tree.move(legend, MoveSpec{.delta_position = kLegendDisplacement * d});
}

NodeId build_needle(NodeTree& tree, NodeId root, double d) {
    SceneNode group;
    group.color = kNeedleColor;
    NodeId needle = tree.add_node(group, root);
    tree.attach(needle, make_disk(d * kCenterCapScale / 2.0, {.color = kNeedleColor}));
    add_polygon(tree, needle, {
        {0.0, d * kArrowLengthScale, 0.0},
        {d * kArrowWidthScale / 2.0, 0.0, 0.0},
        {-d * kArrowWidthScale / 2.0, 0.0, 0.0},
    }, kNeedleColor);
    return needle;
}

}  // namespace

NodeTree make_dial_indicator(double diameter, const DialOptions& options, const NodeStyle& style) {
    if (diameter <= 0.0) {
        throw std::invalid_argument("make_dial_indicator: diameter must be positive");
    }
    if (options.readout_scale == 0.0) {
        throw std::invalid_argument("make_dial_indicator: readout_scale must be non-zero");
    }

    shape::Dial state;
    state.diameter = diameter;
    state.readout_scale = options.readout_scale;
    NodeTree tree(styled_node(style, state));
    const double d = diameter;

    const NodeId plunger = build_plunger(tree, NodeTree::kRoot, d);

    const NodeId dial_group = tree.add_node(SceneNode{}, NodeTree::kRoot);
    build_holder(tree, dial_group, d);
    tree.attach(dial_group, make_disk(d / 2.0 * kRimThickScale, {.color = kFaceColor}));
    build_scale(tree, dial_group, d);

    const double meas_radius = kRimThickScale * d / 2.0;
    const NodeId wedge = tree.attach(dial_group, make_wedge(meas_radius, kPi / 2.0, kPi / 2.0,
                                                            {.opacity = kMeasWedgeOpacity,
                                                             .color = kMeasWedgeColor}));
    const NodeStyle meas_line{.opacity = kMeasLineOpacity, .color = kMeasLineColor, .size = 2.0};
    const NodeId min_line = add_segment(tree, dial_group, vec3::zero(), {0.0, meas_radius, 0.0}, meas_line);
    const NodeId max_line = add_segment(tree, dial_group, vec3::zero(), {0.0, meas_radius, 0.0}, meas_line);

    build_legend(tree, dial_group, d);

    const NodeId needle = build_needle(tree, NodeTree::kRoot, d);

    shape::Dial& dial_state = mutable_state(tree, NodeTree::kRoot);
    dial_state.needle = needle;
    dial_state.plunger = plunger;
    dial_state.wedge = wedge;
    dial_state.min_line = min_line;
    dial_state.max_line = max_line;

    dial::set_deflection(tree, options.deflection);
    dial::reset_highlight(tree);
    dial::display_highlight(tree, options.highlight_show);
    dial::display_plunger(tree, options.plunger_show);

    logging::get_logger()->debug("Built dial indicator: diameter {} mm, {} nodes",
                                 diameter, tree.node_count());
    return tree;
}

namespace dial {

const shape::Dial& state(const NodeTree& tree, NodeId id) {
    const SceneNode& n = tree.node(id);
    const auto* d = std::get_if<shape::Dial>(&n.shape);
    if (!d) {
        throw std::invalid_argument("node " + std::to_string(id) + " is a " +
                                    kind_name(n.shape) + ", not a dial indicator");
    }
    return *d;
}

void set_deflection(NodeTree& tree, double deflection, NodeId id) {
    shape::Dial& d = mutable_state(tree, id);
    d.deflection = deflection;
    update_plunger(tree, d);

    double readout = std::fmod(deflection / d.readout_scale * 100.0, 100.0);
    if (readout < 0.0) {
        readout += 100.0;
    }
    set_readout(tree, readout, id);
}

void set_readout(NodeTree& tree, double readout, NodeId id) {
    shape::Dial& d = mutable_state(tree, id);
    d.readout = readout;
    tree.move(d.needle, MoveSpec{.orientation = Mat3::rotation_z(readout_angle(readout))});

    int exceeded = check_min_max(d);
    if (exceeded < 0) {
        d.min_swept = readout;
    } else if (exceeded > 0) {
        d.max_swept = readout;
    }
    set_min_max_swept(tree, d);
}

int check_min_max(const shape::Dial& d) {
    const double readout = readout_angle(d.readout);
    const double min_a = readout_angle(d.min_swept);
    const double max_a = readout_angle(d.max_swept);

    const Vec3 readout_v{std::cos(readout), std::sin(readout), 0.0};
    const Vec3 min_v{std::cos(min_a), std::sin(min_a), 0.0};
    const Vec3 max_v{std::cos(max_a), std::sin(max_a), 0.0};

    // A non-positive turn from the bound to the needle means the bound is passed
    const bool min_exceeded = min_v.cross(readout_v).z <= 0.0;
    const bool max_exceeded = readout_v.cross(max_v).z <= 0.0;

    if (min_exceeded && !max_exceeded) return -1;
    if (max_exceeded && !min_exceeded) return 1;
    if (min_exceeded || max_exceeded) {
        return min_v.dot(readout_v) >= max_v.dot(readout_v) ? -1 : 1;
    }
    return 0;
}

void reset_highlight(NodeTree& tree, NodeId id) {
    shape::Dial& d = mutable_state(tree, id);
    d.min_swept = d.readout;
    d.max_swept = d.readout;
    set_min_max_swept(tree, d);
}

void display_highlight(NodeTree& tree, bool show, NodeId id) {
    shape::Dial& d = mutable_state(tree, id);
    d.highlight_show = show;
    tree.node(d.wedge).visible = show;
    tree.node(d.min_line).visible = show;
    tree.node(d.max_line).visible = show;
}

void display_plunger(NodeTree& tree, bool show, NodeId id) {
    shape::Dial& d = mutable_state(tree, id);
    d.plunger_show = show;
    tree.node(d.plunger).visible = show;
}

void track(NodeTree& tree, const Polygon2& polygon, NodeId id) {
    const shape::Dial& d = state(tree, id);
    const double free_length = kTrackScale * d.diameter;

    // The plunger points down the dial's own -y axis
    Vec3 direction = tree.global_orientation(id) * Vec3{0.0, -1.0, 0.0};
    double distance = std::abs(ray_polygon_distance(polygon, xy(tree.global_position(id)), xy(direction)));
    set_deflection(tree, std::max(free_length - distance, 0.0), id);
}

void track(NodeTree& tree, const NodeTree& polygon, NodeId id) {
    track(tree, polygon_vertices(polygon, NodeTree::kRoot), id);
}

}  // namespace dial

}  // namespace animatic
