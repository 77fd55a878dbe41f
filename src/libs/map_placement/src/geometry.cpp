#include <map_placement/geometry.hpp>
#include <algorithm>
#include <cmath>

namespace map_placement {

namespace {

constexpr double pi = 3.14159265358979323846;

double to_radians(double deg) {
    return deg * pi / 180.0;
}

double to_degrees(double rad) {
    return rad * 180.0 / pi;
}

} // namespace

double rect_right(const Rect& r) {
    return r.x + r.width;
}

double rect_bottom(const Rect& r) {
    return r.y + r.height;
}

map_model::Point rect_center(const Rect& r) {
    return { r.x + r.width * 0.5, r.y + r.height * 0.5 };
}

Rect rect_from_center(double cx, double cy, double width, double height) {
    return Rect{ cx - width * 0.5, cy - height * 0.5, width, height };
}

Rect inflate(const Rect& r, double margin) {
    return Rect{ r.x - margin, r.y - margin, r.width + 2.0 * margin, r.height + 2.0 * margin };
}

bool intersects(const Rect& a, const Rect& b) {
    return !(rect_right(a) < b.x || rect_right(b) < a.x ||
             rect_bottom(a) < b.y || rect_bottom(b) < a.y);
}

double overlap_area(const Rect& a, const Rect& b) {
    const double w = std::min(rect_right(a), rect_right(b)) - std::max(a.x, b.x);
    const double h = std::min(rect_bottom(a), rect_bottom(b)) - std::max(a.y, b.y);
    if (w <= 0.0 || h <= 0.0) return 0.0;
    return w * h;
}

bool contains(const Rect& outer, const Rect& inner) {
    return inner.x >= outer.x && inner.y >= outer.y &&
           rect_right(inner) <= rect_right(outer) && rect_bottom(inner) <= rect_bottom(outer);
}

Rect rotated_bounds(double cx, double cy, double width, double height, double rotation_deg) {
    if (rotation_deg == 0.0) return rect_from_center(cx, cy, width, height);
    const double c = std::abs(std::cos(to_radians(rotation_deg)));
    const double s = std::abs(std::sin(to_radians(rotation_deg)));
    return rect_from_center(cx, cy, width * c + height * s, width * s + height * c);
}

double distance(const map_model::Point& a, const map_model::Point& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

double point_segment_distance(const map_model::Point& p,
    const map_model::Point& a, const map_model::Point& b)
{
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double len2 = dx * dx + dy * dy;
    if (len2 == 0.0) return distance(p, a);
    double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / len2;
    t = std::clamp(t, 0.0, 1.0);
    return distance(p, { a.x + t * dx, a.y + t * dy });
}

double bearing_degrees(const map_model::Point& from, const map_model::Point& to) {
    // Screen y points down, so north is -y.
    const double math_angle = to_degrees(std::atan2(from.y - to.y, to.x - from.x));
    double b = std::fmod(90.0 - math_angle, 360.0);
    if (b < 0.0) b += 360.0;
    return b;
}

double upright_angle_degrees(const map_model::Point& a, const map_model::Point& b) {
    double angle = to_degrees(std::atan2(b.y - a.y, b.x - a.x));
    if (angle > 90.0) angle -= 180.0;
    else if (angle <= -90.0) angle += 180.0;
    return angle;
}

} // namespace map_placement
