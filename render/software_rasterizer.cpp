#include "software_rasterizer.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numbers>

namespace animatic {

namespace {

constexpr double kTwoPi = 2.0 * std::numbers::pi;

int to_pixel(double v) {
    return static_cast<int>(std::lround(v));
}

void stamp(FrameBuffer& buffer, int x, int y, int rad, const Color& color) {
    for (int oy = -rad; oy <= rad; ++oy) {
        for (int ox = -rad; ox <= rad; ++ox) {
            buffer.set_pixel(x + ox, y + oy, color);
        }
    }
}

// Liang-Barsky clip of a segment against [xmin, xmax] x [ymin, ymax].
// Returns false if nothing of the segment is left.
bool clip_segment(Vec2& a, Vec2& b, double xmin, double ymin, double xmax, double ymax) {
    const Vec2 d = b - a;
    double t0 = 0.0;
    double t1 = 1.0;
    const std::array<double, 4> p{-d.x, d.x, -d.y, d.y};
    const std::array<double, 4> q{a.x - xmin, xmax - a.x, a.y - ymin, ymax - a.y};
    for (size_t i = 0; i < 4; ++i) {
        if (p[i] == 0.0) {
            if (q[i] < 0.0) return false;
            continue;
        }
        double r = q[i] / p[i];
        if (p[i] < 0.0) {
            if (r > t1) return false;
            t0 = std::max(t0, r);
        } else {
            if (r < t0) return false;
            t1 = std::min(t1, r);
        }
    }
    const Vec2 start = a;
    a = start + d * t0;
    b = start + d * t1;
    return true;
}

// Maps `angle` into [lo, lo + 2pi)
double wrap_from(double angle, double lo) {
    double a = std::fmod(angle - lo, kTwoPi);
    if (a < 0.0) a += kTwoPi;
    return lo + a;
}

}  // namespace

SoftwareRasterizer::SoftwareRasterizer(const std::string& font_path)
    : font_(std::make_unique<FontFace>(font_path)), font_resolved_(true) {}

const FontFace* SoftwareRasterizer::font() {
    if (!font_resolved_) {
        font_resolved_ = true;
        if (auto path = find_system_font()) {
            font_ = std::make_unique<FontFace>(*path);
        } else {
            logging::get_logger()->warn("No font found; set ANIMATIC_FONT to render text");
        }
    }
    return font_.get();
}

void SoftwareRasterizer::draw_point(FrameBuffer& buffer, const Vec2& center, double radius,
                                    const Color& color) {
    if (radius < 1.0) {
        buffer.set_pixel(to_pixel(center.x), to_pixel(center.y), color);
        return;
    }
    fill_circle(buffer, center, radius, color);
}

void SoftwareRasterizer::draw_line(FrameBuffer& buffer, const Vec2& from, const Vec2& to,
                                   const Color& color, int thickness) {
    if (thickness < 1) thickness = 1;
    const int rad = thickness / 2;

    Vec2 a = from;
    Vec2 b = to;
    if (!clip_segment(a, b, -rad - 1.0, -rad - 1.0,
                      buffer.width() + rad + 1.0, buffer.height() + rad + 1.0)) {
        return;
    }

    int x0 = to_pixel(a.x);
    int y0 = to_pixel(a.y);
    const int x1 = to_pixel(b.x);
    const int y1 = to_pixel(b.y);

    const int dx = std::abs(x1 - x0);
    const int sx = (x0 < x1) ? 1 : -1;
    const int dy = -std::abs(y1 - y0);
    const int sy = (y0 < y1) ? 1 : -1;
    int err = dx + dy;

    for (;;) {
        stamp(buffer, x0, y0, rad, color);
        if (x0 == x1 && y0 == y1) break;
        int e2 = 2 * err;
        if (e2 >= dy) { err += dy; x0 += sx; }
        if (e2 <= dx) { err += dx; y0 += sy; }
    }
}

void SoftwareRasterizer::draw_polyline(FrameBuffer& buffer, std::span<const Vec2> points, bool closed,
                                       const Color& color, int thickness) {
    if (points.empty()) {
        return;
    }
    if (points.size() == 1) {
        stamp(buffer, to_pixel(points[0].x), to_pixel(points[0].y), std::max(thickness, 1) / 2, color);
        return;
    }
    for (size_t i = 1; i < points.size(); ++i) {
        draw_line(buffer, points[i - 1], points[i], color, thickness);
    }
    if (closed && points.size() > 2) {
        draw_line(buffer, points.back(), points.front(), color, thickness);
    }
}

void SoftwareRasterizer::fill_polygon(FrameBuffer& buffer, std::span<const std::vector<Vec2>> loops,
                                      const Color& color) {
    double ymin = std::numeric_limits<double>::infinity();
    double ymax = -std::numeric_limits<double>::infinity();
    for (const auto& loop : loops) {
        for (const Vec2& p : loop) {
            ymin = std::min(ymin, p.y);
            ymax = std::max(ymax, p.y);
        }
    }
    if (ymin > ymax) {
        return;
    }

    const int y_start = std::max(0, static_cast<int>(std::ceil(ymin)));
    const int y_end = std::min(buffer.height() - 1, static_cast<int>(std::floor(ymax)));

    std::vector<double> crossings;
    for (int y = y_start; y <= y_end; ++y) {
        const double ys = static_cast<double>(y);
        crossings.clear();
        for (const auto& loop : loops) {
            const size_t n = loop.size();
            if (n < 3) continue;
            for (size_t i = 0; i < n; ++i) {
                const Vec2& a = loop[i];
                const Vec2& b = loop[(i + 1) % n];
                if ((a.y <= ys && ys < b.y) || (b.y <= ys && ys < a.y)) {
                    crossings.push_back(a.x + (ys - a.y) * (b.x - a.x) / (b.y - a.y));
                }
            }
        }
        std::sort(crossings.begin(), crossings.end());
        for (size_t i = 0; i + 1 < crossings.size(); i += 2) {
            int x0 = std::max(0, static_cast<int>(std::ceil(crossings[i])));
            int x1 = std::min(buffer.width() - 1, static_cast<int>(std::floor(crossings[i + 1])));
            for (int x = x0; x <= x1; ++x) {
                buffer.set_pixel(x, y, color);
            }
        }
    }
}

void SoftwareRasterizer::draw_circle(FrameBuffer& buffer, const Vec2& center, double radius,
                                     const Color& color, int thickness) {
    const int r = to_pixel(radius);
    if (r <= 0) return;
    if (thickness < 1) thickness = 1;
    const int cx = to_pixel(center.x);
    const int cy = to_pixel(center.y);

    // Ring of concentric midpoint circles, centred on the nominal radius
    const int outer = r + thickness / 2;
    const int inner = std::max(0, outer - thickness);
    for (int rr = outer; rr > inner; --rr) {
        int x = rr;
        int y = 0;
        int err = 0;
        while (x >= y) {
            buffer.set_pixel(cx + x, cy + y, color);
            buffer.set_pixel(cx + y, cy + x, color);
            buffer.set_pixel(cx - y, cy + x, color);
            buffer.set_pixel(cx - x, cy + y, color);
            buffer.set_pixel(cx - x, cy - y, color);
            buffer.set_pixel(cx - y, cy - x, color);
            buffer.set_pixel(cx + y, cy - x, color);
            buffer.set_pixel(cx + x, cy - y, color);

            if (err <= 0) { y++; err += 2 * y + 1; }
            if (err > 0) { x--; err -= 2 * x + 1; }
        }
    }
}

void SoftwareRasterizer::fill_circle(FrameBuffer& buffer, const Vec2& center, double radius,
                                     const Color& color) {
    const int r = to_pixel(radius);
    if (r <= 0) return;
    const int cx = to_pixel(center.x);
    const int cy = to_pixel(center.y);
    for (int y = -r; y <= r; ++y) {
        int hh = static_cast<int>(std::floor(std::sqrt(static_cast<double>(r) * r -
                                                       static_cast<double>(y) * y)));
        for (int x = cx - hh; x <= cx + hh; ++x) {
            buffer.set_pixel(x, cy + y, color);
        }
    }
}

void SoftwareRasterizer::fill_wedge(FrameBuffer& buffer, const Vec2& center, double radius,
                                    double start_angle, double end_angle, const Color& color) {
    const double lo = std::min(start_angle, end_angle);
    const double hi = std::max(start_angle, end_angle);
    if (hi - lo <= 0.0 || radius <= 0.0) {
        return;
    }
    if (hi - lo >= kTwoPi) {
        fill_circle(buffer, center, radius, color);
        return;
    }

    const int r = to_pixel(radius);
    const int cx = to_pixel(center.x);
    const int cy = to_pixel(center.y);
    const double r2 = static_cast<double>(r) * r;
    for (int y = cy - r; y <= cy + r; ++y) {
        for (int x = cx - r; x <= cx + r; ++x) {
            double dx = static_cast<double>(x - cx);
            double dy = static_cast<double>(cy - y);  // screen y is down
            if (dx * dx + dy * dy > r2) continue;
            if (dx == 0.0 && dy == 0.0) {
                buffer.set_pixel(x, y, color);
                continue;
            }
            if (wrap_from(std::atan2(dy, dx), lo) <= hi) {
                buffer.set_pixel(x, y, color);
            }
        }
    }
}

void SoftwareRasterizer::draw_arc(FrameBuffer& buffer, const Vec2& center, double radius,
                                  double start_angle, double end_angle,
                                  const Color& color, int thickness) {
    if (radius <= 0.0) return;
    const double span = end_angle - start_angle;
    const int steps = std::max(8, static_cast<int>(std::ceil(std::abs(span) * radius / 2.0)));

    std::vector<Vec2> points;
    points.reserve(static_cast<size_t>(steps) + 1);
    for (int i = 0; i <= steps; ++i) {
        double a = start_angle + span * i / steps;
        points.emplace_back(center.x + radius * std::cos(a), center.y - radius * std::sin(a));
    }
    draw_polyline(buffer, points, false, color, thickness);
}

void SoftwareRasterizer::draw_text(FrameBuffer& buffer, const Vec2& origin, const std::string& text,
                                   double height, const Color& color, int thickness) {
    if (height <= 0.0 || text.empty() || !font()) return;
    font_->draw(buffer, origin, text, height, color, std::max(thickness, 1) - 1);
}

}  // namespace animatic
