#ifndef ANIMATIC_ENTITIES_DIAL_INDICATOR_HPP
#define ANIMATIC_ENTITIES_DIAL_INDICATOR_HPP

#include "primitives.hpp"
#include <geometry/polygon.hpp>

namespace animatic {

struct DialOptions {
    double deflection = 0.0;       // plunger depression, mm
    bool highlight_show = false;   // min/max swept wedge and lines
    bool plunger_show = true;
    double readout_scale = 1.0;    // plunger travel (mm) for one full revolution
};

// Dial indicator gauge of the given diameter (mm): rim, face, 100 ticks,
// numbers, legend, needle, plunger and the min/max swept highlight.
// The dial state lives in the root node's shape::Dial.
NodeTree make_dial_indicator(double diameter,
                             const DialOptions& options = {},
                             const NodeStyle& style = {});

namespace dial {

// Ratio of the centre-to-plunger-tip distance to the dial diameter when the
// plunger is fully extended
constexpr double kTrackScale = 1.610;

const shape::Dial& state(const NodeTree& tree, NodeId id = NodeTree::kRoot);

// Moves the plunger and updates the readout: readout is
// deflection / readout_scale * 100, wrapped into [0, 100).
void set_deflection(NodeTree& tree, double deflection, NodeId id = NodeTree::kRoot);

// Points the needle at `readout` (0 at 12 o'clock, 25 at 3 o'clock) and
// widens the min/max swept range if the needle has left it.
void set_readout(NodeTree& tree, double readout, NodeId id = NodeTree::kRoot);

// 0 if the readout is inside the swept range, -1 past the minimum, 1 past the maximum
int check_min_max(const shape::Dial& dial);

// Collapses the swept range onto the current readout
void reset_highlight(NodeTree& tree, NodeId id = NodeTree::kRoot);

void display_highlight(NodeTree& tree, bool show, NodeId id = NodeTree::kRoot);
void display_plunger(NodeTree& tree, bool show, NodeId id = NodeTree::kRoot);

// Sets the deflection so the plunger tip rests on `polygon` (global xy), searching
// along the dial's global -y axis. No contact leaves the plunger fully extended.
void track(NodeTree& tree, const Polygon2& polygon, NodeId id = NodeTree::kRoot);

// Same, tracking the vertices of a polygon entity
void track(NodeTree& tree, const NodeTree& polygon, NodeId id = NodeTree::kRoot);

}  // namespace dial

}  // namespace animatic

#endif // ANIMATIC_ENTITIES_DIAL_INDICATOR_HPP
