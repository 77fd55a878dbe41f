#pragma once

#include <map_model/map_scene.hpp>
#include <map_placement/footprint.hpp>
#include <map_placement/layout_result.hpp>
#include <map_placement/placement_config.hpp>
#include <nlohmann/json.hpp>
#include <istream>
#include <optional>
#include <string>

namespace map_loaders {

// Pre-projected scene: anchors already in output pixels. Elements without
// width/height are measured from text/subtext/font_size with `estimator`.
std::optional<map_model::MapScene> load_map_from_json(std::istream& in,
    const map_placement::FootprintEstimator& estimator);
std::optional<map_model::MapScene> load_map_from_json_file(const std::string& path,
    const map_placement::FootprintEstimator& estimator);

// Missing keys keep default_placement_config() values.
std::optional<map_placement::PlacementConfig> load_placement_config_from_json(std::istream& in);
std::optional<map_placement::PlacementConfig> load_placement_config_from_json_file(const std::string& path);

nlohmann::json layout_to_json(const map_placement::LayoutResult& result);
std::string layout_to_json_string(const map_placement::LayoutResult& result, int indent = 2);
bool write_layout_json_file(const map_placement::LayoutResult& result, const std::string& path);

} // namespace map_loaders
