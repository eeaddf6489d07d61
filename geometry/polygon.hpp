#ifndef ANIMATIC_GEOMETRY_POLYGON_HPP
#define ANIMATIC_GEOMETRY_POLYGON_HPP

#include <math/vec2.hpp>
#include <vector>

namespace animatic {

// Closed polygon: vertex[i] -> vertex[i+1], last wraps to first.
using Polygon2 = std::vector<Vec2>;

// Distance from `point` along `direction` to the polygon boundary.
//
// Returns the smallest forward distance at which the ray crosses an edge.
// If any edge is crossed behind the point, the point is inside the polygon
// and the result is negated. Returns +infinity when nothing is crossed at
// all, and -infinity when only backward crossings exist.
//
// `direction` need not be normalized. Throws std::invalid_argument for a
// zero-length direction or a polygon with fewer than 2 vertices.
double ray_polygon_distance(const Polygon2& polygon, const Vec2& point, const Vec2& direction);

// True if every turn along the boundary has the same handedness.
// Collinear vertices are ignored. Throws std::invalid_argument below 3 vertices.
bool is_convex(const Polygon2& polygon);

// Signed area, positive for counter-clockwise winding.
double signed_area(const Polygon2& polygon);

}  // namespace animatic

#endif // ANIMATIC_GEOMETRY_POLYGON_HPP
