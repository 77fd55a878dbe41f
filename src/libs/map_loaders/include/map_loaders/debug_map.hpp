#pragma once

#include <map_model/map_scene.hpp>
#include <map_placement/footprint.hpp>

namespace map_loaders {

// Built-in historical demo: cities with dots, a river, a campaign with
// arrowheads and two events, crowded enough to exercise the fallbacks.
map_model::MapScene generate_debug_map(const map_placement::FootprintEstimator& estimator);

} // namespace map_loaders
