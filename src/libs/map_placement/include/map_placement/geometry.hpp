#pragma once

#include <map_model/types.hpp>
#include <map_placement/types.hpp>

namespace map_placement {

double rect_right(const Rect& r);
double rect_bottom(const Rect& r);
map_model::Point rect_center(const Rect& r);

Rect rect_from_center(double cx, double cy, double width, double height);

// Box grown by `margin` on every side.
Rect inflate(const Rect& r, double margin);

// Closed intervals on both axes: boxes sharing an edge intersect.
bool intersects(const Rect& a, const Rect& b);

double overlap_area(const Rect& a, const Rect& b);

bool contains(const Rect& outer, const Rect& inner);

// Axis-aligned enclosure of a width x height box rotated about its center.
Rect rotated_bounds(double cx, double cy, double width, double height, double rotation_deg);

double distance(const map_model::Point& a, const map_model::Point& b);

double point_segment_distance(const map_model::Point& p,
    const map_model::Point& a, const map_model::Point& b);

// Compass bearing of the direction a -> b in [0, 360): 0 = north, 90 = east.
double bearing_degrees(const map_model::Point& from, const map_model::Point& to);

// Screen angle of a segment folded into (-90, 90] so text reads left to right.
double upright_angle_degrees(const map_model::Point& a, const map_model::Point& b);

} // namespace map_placement
