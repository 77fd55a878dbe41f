#pragma once

#include <map_model/map_scene.hpp>
#include <map_model/types.hpp>
#include <map_placement/layout_result.hpp>
#include <map_placement/placement_config.hpp>
#include <map_placement/types.hpp>
#include <vector>

namespace map_placement {

// Greedy priority-ordered placement. Each resolve() call is one independent
// pass with its own occupied space; the manager itself holds only inputs.
class PlacementManager {
public:
    explicit PlacementManager(PlacementConfig config = default_placement_config());

    // Committed before the first element of every pass.
    void add_obstacle(const Obstacle& obstacle);
    void add_obstacles(const std::vector<Obstacle>& obstacles);
    void clear_obstacles() { obstacles_.clear(); }

    const PlacementConfig& config() const { return config_; }
    const std::vector<Obstacle>& obstacles() const { return obstacles_; }

    LayoutResult resolve(const std::vector<map_model::Element>& elements) const;

private:
    PlacementConfig config_;
    std::vector<Obstacle> obstacles_;
};

LayoutResult resolve_layout(const std::vector<map_model::Element>& elements,
    const PlacementConfig& config = default_placement_config(),
    const std::vector<Obstacle>& obstacles = {});

// City dots and icons as obstacles centered on their anchors.
std::vector<Obstacle> obstacles_from_fixtures(const std::vector<map_model::Fixture>& fixtures);

} // namespace map_placement
