#ifndef ANIMATIC_IO_POINT_CSV_HPP
#define ANIMATIC_IO_POINT_CSV_HPP

#include <math/vec2.hpp>
#include <istream>
#include <string>
#include <vector>

namespace animatic {

// Reads one "x,y" pair per line. Blank lines are skipped; anything else that
// is not two numbers throws std::runtime_error naming the source and line.
std::vector<Vec2> load_points_csv(const std::string& path);
std::vector<Vec2> parse_points_csv(std::istream& in, const std::string& source = "<stream>");

}  // namespace animatic

#endif // ANIMATIC_IO_POINT_CSV_HPP
