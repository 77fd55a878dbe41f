#include <map_placement/anchor.hpp>
#include <map_placement/geometry.hpp>
#include <algorithm>
#include <cmath>

namespace map_placement {

namespace {

constexpr double pi = 3.14159265358979323846;

// Horizontal / vertical side of the offset point the box extends to:
// -1 = left/above, 0 = centered, +1 = right/below.
struct Side {
    int h;
    int v;
};

Side side_of(Compass c) {
    switch (c) {
    case Compass::NE: return { 1, -1 };
    case Compass::E: return { 1, 0 };
    case Compass::NW: return { -1, -1 };
    case Compass::W: return { -1, 0 };
    case Compass::SE: return { 1, 1 };
    case Compass::SW: return { -1, 1 };
    case Compass::N: return { 0, -1 };
    case Compass::S: return { 0, 1 };
    }
    return { 1, -1 };
}

double start_along(int side, double at, double extent) {
    if (side > 0) return at;
    if (side < 0) return at - extent;
    return at - extent * 0.5;
}

} // namespace

const char* compass_name(Compass c) {
    switch (c) {
    case Compass::NE: return "NE";
    case Compass::E: return "E";
    case Compass::NW: return "NW";
    case Compass::W: return "W";
    case Compass::SE: return "SE";
    case Compass::SW: return "SW";
    case Compass::N: return "N";
    case Compass::S: return "S";
    }
    return "NE";
}

double compass_bearing(Compass c) {
    switch (c) {
    case Compass::N: return 0.0;
    case Compass::NE: return 45.0;
    case Compass::E: return 90.0;
    case Compass::SE: return 135.0;
    case Compass::S: return 180.0;
    case Compass::SW: return 225.0;
    case Compass::W: return 270.0;
    case Compass::NW: return 315.0;
    }
    return 0.0;
}

map_model::Point compass_offset(Compass c, double radius) {
    const double theta = compass_bearing(c) * pi / 180.0;
    double dx = radius * std::sin(theta);
    double dy = -radius * std::cos(theta);
    // Keep cardinal offsets exact.
    if (std::abs(dx) < 1e-12) dx = 0.0;
    if (std::abs(dy) < 1e-12) dy = 0.0;
    return { dx, dy };
}

Rect aligned_box(Compass c, const map_model::Point& at, const map_model::Size& footprint,
    BoxAlignment alignment)
{
    if (alignment == BoxAlignment::Centered)
        return rect_from_center(at.x, at.y, footprint.width, footprint.height);
    const Side s = side_of(c);
    return Rect{
        start_along(s.h, at.x, footprint.width),
        start_along(s.v, at.y, footprint.height),
        footprint.width,
        footprint.height
    };
}

std::vector<Candidate> point_anchor_candidates(const map_model::Point& anchor, double radius,
    const map_model::Size& footprint, BoxAlignment alignment, double rotation, int tier)
{
    std::vector<Candidate> out;
    out.reserve(imhof_order.size());
    for (Compass c : imhof_order) {
        const map_model::Point off = compass_offset(c, radius);
        const map_model::Point at{ anchor.x + off.x, anchor.y + off.y };
        const Rect box = aligned_box(c, at, footprint, alignment);
        const map_model::Point center = rect_center(box);

        Candidate cand;
        cand.x = center.x;
        cand.y = center.y;
        cand.rotation = rotation;
        cand.box = rotation == 0.0
            ? box
            : rotated_bounds(center.x, center.y, footprint.width, footprint.height, rotation);
        cand.rank = static_cast<int>(out.size());
        cand.direction = c;
        cand.tier = tier;
        out.push_back(cand);
    }
    return out;
}

std::vector<int> segment_order(const std::vector<map_model::Point>& path) {
    std::vector<int> order;
    std::vector<double> lengths;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        const double len = distance(path[i], path[i + 1]);
        lengths.push_back(len);
        if (len > 0.0) order.push_back(static_cast<int>(i));
    }
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return lengths[a] > lengths[b];
    });
    return order;
}

std::vector<Candidate> path_anchor_candidates(const std::vector<map_model::Point>& path,
    const map_model::Size& footprint, const double* rotation_override)
{
    std::vector<Candidate> out;
    for (int seg : segment_order(path)) {
        const map_model::Point& a = path[seg];
        const map_model::Point& b = path[seg + 1];
        const double cx = (a.x + b.x) * 0.5;
        const double cy = (a.y + b.y) * 0.5;
        const double angle = rotation_override ? *rotation_override : upright_angle_degrees(a, b);

        Candidate cand;
        cand.x = cx;
        cand.y = cy;
        cand.rotation = angle;
        cand.box = rotated_bounds(cx, cy, footprint.width, footprint.height, angle);
        cand.rank = static_cast<int>(out.size());
        cand.segment = seg;
        out.push_back(cand);
    }
    return out;
}

} // namespace map_placement
