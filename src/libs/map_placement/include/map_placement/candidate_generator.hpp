#pragma once

#include <map_model/types.hpp>
#include <map_placement/placement_config.hpp>
#include <map_placement/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace map_placement {

// Labels resolved so far in the pass. A mapped nullopt means the label was
// resolved without consuming a compass direction (suppressed, offset, path).
using ResolvedDirections = std::map<std::string, std::optional<Compass>>;

// Ordered candidate list for one element. Ranks are renumbered 0..n-1 after
// filtering. `resolved` is only consulted for arrow endpoints.
std::vector<Candidate> generate_candidates(const map_model::Element& element,
    const PlacementConfig& config, const ResolvedDirections* resolved = nullptr);

} // namespace map_placement
