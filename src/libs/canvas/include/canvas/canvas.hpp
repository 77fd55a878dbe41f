#pragma once

#include <map_model/map_scene.hpp>
#include <map_placement/layout_result.hpp>
#include <map_placement/overlap_audit.hpp>
#include <map_placement/placement_config.hpp>
#include <map_render/renderer.hpp>
#include <cstddef>
#include <vector>

struct ImVec2;

namespace canvas {

class MapCanvas {
public:
    MapCanvas();
    ~MapCanvas();

    // Resolves the layout immediately. The scene must outlive the canvas.
    void set_scene(const map_model::MapScene* scene);
    const map_model::MapScene* scene() const { return scene_; }

    void set_config(const map_placement::PlacementConfig& config);
    const map_placement::PlacementConfig& config() const { return config_; }

    // Re-resolves on the next update_and_draw().
    void request_resolve() { resolve_pending_ = true; }
    void resolve();

    const map_placement::LayoutResult& layout() const { return layout_; }
    const std::vector<map_placement::OverlapPair>& overlaps() const { return overlaps_; }
    std::size_t resolve_count() const { return resolve_count_; }

    map_render::RenderOptions& render_options() { return render_options_; }

    void set_grid_step(float step) { grid_step_ = step; }
    float grid_step() const { return grid_step_; }

    void pan(float dx, float dy);
    void zoom_at(float screen_x, float screen_y, float zoom_delta);
    void zoom_at_center(float zoom_delta);

    void screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const;
    void world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const;

    // Zoom and offset so the whole map extent fits the region.
    void fit_scene(float screen_region_width, float screen_region_height);
    void set_offset(float ox, float oy) { offset_x_ = ox; offset_y_ = oy; }
    void set_zoom(float z) { zoom_ = z; }
    float offset_x() const { return offset_x_; }
    float offset_y() const { return offset_y_; }
    float zoom() const { return zoom_; }

    bool update_and_draw(float region_width, float region_height);

private:
    const map_model::MapScene* scene_ = nullptr;
    map_placement::PlacementConfig config_;
    map_placement::LayoutResult layout_;
    std::vector<map_placement::OverlapPair> overlaps_;
    std::size_t resolve_count_ = 0;
    bool resolve_pending_ = false;
    bool fit_pending_ = false;
    map_render::RenderOptions render_options_;
    float offset_x_ = 0;
    float offset_y_ = 0;
    float zoom_ = 1.0f;
    float grid_step_ = 50.0f;
    bool dragging_ = false;
    float drag_start_x_ = 0;
    float drag_start_y_ = 0;
    float drag_start_offset_x_ = 0;
    float drag_start_offset_y_ = 0;

    void draw_grid(ImVec2 region_min, ImVec2 region_max);
    void handle_input(float region_width, float region_height);
    void log_diagnostics();
};

} // namespace canvas
