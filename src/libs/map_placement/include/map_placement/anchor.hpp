#pragma once

#include <map_model/types.hpp>
#include <map_placement/types.hpp>
#include <array>
#include <vector>

namespace map_placement {

// Imhof preference around a point: top-right first, right before left, top before bottom.
constexpr std::array<Compass, 8> imhof_order = {
    Compass::NE, Compass::E, Compass::NW, Compass::W,
    Compass::SE, Compass::SW, Compass::N, Compass::S
};

const char* compass_name(Compass c);

// 0 = north, clockwise.
double compass_bearing(Compass c);

// Offset from the anchor to the point on the anchor circle, in pixels (y down).
map_model::Point compass_offset(Compass c, double radius);

enum class BoxAlignment {
    AwayFromAnchor, // labels: the box touches the offset point and extends outward
    Centered        // decorations: the box is centered on the offset point
};

Rect aligned_box(Compass c, const map_model::Point& at, const map_model::Size& footprint,
    BoxAlignment alignment);

// The 8 Imhof positions at `radius`, in Imhof order. Ranks are 0..7.
// A non-zero rotation replaces each box with the enclosure of the rotated footprint.
std::vector<Candidate> point_anchor_candidates(const map_model::Point& anchor, double radius,
    const map_model::Size& footprint, BoxAlignment alignment, double rotation = 0.0, int tier = 0);

// Segment indices by descending length, ties by index. Zero-length segments are left out.
std::vector<int> segment_order(const std::vector<map_model::Point>& path);

// One candidate per segment, centered on it and rotated to its (upright) angle.
std::vector<Candidate> path_anchor_candidates(const std::vector<map_model::Point>& path,
    const map_model::Size& footprint, const double* rotation_override = nullptr);

} // namespace map_placement
