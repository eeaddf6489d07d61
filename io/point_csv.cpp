#include "point_csv.hpp"
#include <common/logging.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace animatic {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool parse_number(const std::string& field, double& out) {
    std::string text = trim(field);
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size();
}

}  // namespace

std::vector<Vec2> parse_points_csv(std::istream& in, const std::string& source) {
    std::vector<Vec2> points;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) {
            continue;
        }
        size_t comma = line.find(',');
        double x = 0.0;
        double y = 0.0;
        if (comma == std::string::npos ||
            line.find(',', comma + 1) != std::string::npos ||
            !parse_number(line.substr(0, comma), x) ||
            !parse_number(line.substr(comma + 1), y)) {
            throw std::runtime_error(source + ":" + std::to_string(line_no) +
                                     ": expected 'x,y', got '" + line + "'");
        }
        points.emplace_back(x, y);
    }
    return points;
}

std::vector<Vec2> load_points_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::vector<Vec2> points = parse_points_csv(file, path);
    logging::get_logger()->debug("Loaded {} points from {}", points.size(), path);
    return points;
}

}  // namespace animatic
