#pragma once

#include <map_model/types.hpp>
#include <map_placement/placement_config.hpp>
#include <map_placement/types.hpp>
#include <cstddef>
#include <vector>

namespace map_placement {

// One joint position of a city label and its event marker.
struct PairedCandidate {
    Candidate city;
    Candidate event;
};

// A city label and a co-located event marker, placed as one unit.
struct LabelPair {
    std::size_t city = 0;   // indices into the element list
    std::size_t event = 0;
    // City candidates outer, event candidates inner. Combinations whose padded
    // boxes meet are left out.
    std::vector<PairedCandidate> candidates;
    // First combination using the city's second distance tier, else 0.
    std::size_t fallback_index = 0;
};

// Each city label pairs with the first unpaired event marker whose anchor is
// closer than `config.pair_threshold` and that leaves at least one compatible
// combination. Elements with an offset override are never paired.
std::vector<LabelPair> detect_pairs(const std::vector<map_model::Element>& elements,
    const PlacementConfig& config);

} // namespace map_placement
