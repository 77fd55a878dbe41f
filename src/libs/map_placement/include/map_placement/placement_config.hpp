#pragma once

#include <map_model/types.hpp>
#include <map_placement/types.hpp>
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace map_placement {

// What to do with an element none of whose candidates is overlap-free.
enum class FallbackPolicy {
    ForceLeastOverlap, // accept the candidate with the smallest total overlap area
    Suppress           // drop the element, occupy nothing
};

const char* fallback_policy_name(FallbackPolicy policy);
std::optional<FallbackPolicy> fallback_policy_from_name(const std::string& name);

struct KindConfig {
    double radius = 0.0;
    FallbackPolicy fallback = FallbackPolicy::ForceLeastOverlap;
    // Multipliers of `radius`; every tier repeats the 8 Imhof positions.
    std::vector<double> radius_tiers{ 1.0 };
};

struct PlacementConfig {
    double padding = 0.0;
    bool arrow_excludes_label_direction = true;
    // When set, candidate boxes must lie fully inside.
    std::optional<Rect> frame;
    // Indexed by map_model::ElementKind.
    std::array<KindConfig, 4> kinds{};
    // Point-label radius per city level; levels absent here use kinds[PointLabel].radius.
    std::map<int, double> level_radius;
    // A city label and an event marker whose anchors are closer than this are
    // placed together as one unit. 0 disables pairing.
    double pair_threshold = 0.0;
    // Event radius multipliers used for the event half of a pair.
    std::vector<double> pair_event_tiers{ 1.0, 1.3, 1.6 };

    KindConfig& kind(map_model::ElementKind k) { return kinds[static_cast<std::size_t>(k)]; }
    const KindConfig& kind(map_model::ElementKind k) const { return kinds[static_cast<std::size_t>(k)]; }
};

PlacementConfig default_placement_config();

// Anchor circle radius for an element under `config`.
double clearance_radius(const PlacementConfig& config, const map_model::Element& element);

} // namespace map_placement
