#pragma once

#include <map_model/types.hpp>

namespace map_placement {

// Shared placement defaults (used by loaders, the debug scene and the config).
// Radii in output pixels.

namespace defaults {

// Priority tiers: lower value is placed first. Every city label tier is below
// arrow_endpoint so a city's label is resolved before its arrowheads.
namespace priority {
constexpr int city_level_1 = 0;
constexpr int city_level_2 = 20;
constexpr int city_level_3 = 30;
constexpr int event_marker = 40;
constexpr int city_level_4 = 50;
constexpr int arrow_endpoint = 55;
constexpr int river = 60;
constexpr int region = 70;
} // namespace priority

constexpr int default_city_level = 2;

// Anchor circle radius per city level (capital, city, town, modern place).
constexpr double city_level_radius[4] = { 8.0, 6.0, 5.0, 4.0 };
constexpr double event_radius = 12.0;
constexpr double arrow_endpoint_radius = 6.0;

constexpr double padding = 1.0;

// Event anchors within this distance of a city anchor are paired with it.
constexpr double pair_threshold = 10.0;

// Text sizes from the label styles.
constexpr double city_font_size[4] = { 10.0, 9.0, 8.0, 7.0 };
constexpr double river_font_size = 6.0;
constexpr double region_font_size = 20.0;
constexpr double event_font_size = 9.0;
constexpr double event_subtext_font_size = 7.0;

constexpr double arrowhead_size = 5.5;

inline constexpr bool valid_city_level(int level) {
    return level >= 1 && level <= 4;
}

// Unknown levels behave like a regular city.
inline constexpr int clamp_city_level(int level) {
    return valid_city_level(level) ? level : default_city_level;
}

inline constexpr int city_label_priority(int level) {
    switch (clamp_city_level(level)) {
    case 1: return priority::city_level_1;
    case 3: return priority::city_level_3;
    case 4: return priority::city_level_4;
    default: return priority::city_level_2;
    }
}

inline constexpr double city_radius(int level) {
    return city_level_radius[clamp_city_level(level) - 1];
}

inline constexpr double city_font(int level) {
    return city_font_size[clamp_city_level(level) - 1];
}

inline constexpr int default_priority(map_model::ElementKind kind, int level = default_city_level) {
    switch (kind) {
    case map_model::ElementKind::PointLabel: return city_label_priority(level);
    case map_model::ElementKind::PathLabel: return priority::river;
    case map_model::ElementKind::EventMarker: return priority::event_marker;
    case map_model::ElementKind::ArrowEndpoint: return priority::arrow_endpoint;
    }
    return priority::city_level_2;
}

} // namespace defaults
} // namespace map_placement
