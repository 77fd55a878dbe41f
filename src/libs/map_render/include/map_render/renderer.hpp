#pragma once

#include <map_model/map_scene.hpp>
#include <map_placement/layout_result.hpp>

struct ImDrawList;

namespace map_render {

struct RenderOptions {
    bool show_boxes = false;      // outline every accepted box
    bool show_suppressed = true;  // ghost suppressed labels at their anchor
    bool show_fixtures = true;
    bool show_campaigns = true;
};

// Draws the map background, campaigns, fixtures and every visible placement of
// `layout`. Forced placements are outlined in red.
void render_map(ImDrawList* draw_list,
    const map_model::MapScene& scene,
    const map_placement::LayoutResult& layout,
    float offset_x, float offset_y, float zoom,
    const RenderOptions& options = {});

} // namespace map_render
