#include <canvas/canvas.hpp>
#include <map_placement/placement_manager.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <memory>

namespace {

const float fit_margin = 24.0f;

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> make_diagnostics_logger() {
    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "placement_latest.log";
        auto logger = spdlog::basic_logger_mt("map_placement_diagnostics", log_file.string(), true);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Placement diagnostics logger initialized. file={}", log_file.string());
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        return spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        return spdlog::default_logger();
    }
}

std::shared_ptr<spdlog::logger> diagnostics_logger() {
    static const std::shared_ptr<spdlog::logger> logger = make_diagnostics_logger();
    return logger;
}

} // namespace

namespace canvas {

MapCanvas::MapCanvas()
    : config_(map_placement::default_placement_config())
{
}

MapCanvas::~MapCanvas() = default;

void MapCanvas::set_scene(const map_model::MapScene* scene) {
    scene_ = scene;
    fit_pending_ = true;
    resolve();
}

void MapCanvas::set_config(const map_placement::PlacementConfig& config) {
    config_ = config;
    resolve_pending_ = true;
}

void MapCanvas::resolve() {
    resolve_pending_ = false;
    layout_ = map_placement::LayoutResult{};
    overlaps_.clear();
    if (!scene_) return;

    const auto obstacles = map_placement::obstacles_from_fixtures(scene_->fixtures);
    layout_ = map_placement::resolve_layout(scene_->elements, config_, obstacles);
    overlaps_ = map_placement::detect_overlaps(layout_, obstacles, config_.padding);
    ++resolve_count_;
    log_diagnostics();
}

void MapCanvas::log_diagnostics() {
    auto logger = diagnostics_logger();
    logger->info("resolve scene=\"{}\" pass={} elements={} placed={} forced={} suppressed={} overlaps={}",
        scene_ ? scene_->name : std::string(), resolve_count_, layout_.placements.size(),
        layout_.placed_count(), layout_.forced_count, layout_.suppressed_count, overlaps_.size());

    // Per-element forced/suppressed lines already go to the placement logger.
    map_placement::log_overlaps(overlaps_, logger);
}

void MapCanvas::pan(float dx, float dy) {
    offset_x_ += dx;
    offset_y_ += dy;
}

void MapCanvas::zoom_at(float screen_x, float screen_y, float zoom_delta) {
    float new_zoom = zoom_ * zoom_delta;
    if (new_zoom < 0.1f) new_zoom = 0.1f;
    if (new_zoom > 10.0f) new_zoom = 10.0f;
    float factor = new_zoom / zoom_;
    offset_x_ = screen_x - (screen_x - offset_x_) * factor;
    offset_y_ = screen_y - (screen_y - offset_y_) * factor;
    zoom_ = new_zoom;
}

void MapCanvas::zoom_at_center(float zoom_delta) {
    zoom_ *= zoom_delta;
    if (zoom_ < 0.1f) zoom_ = 0.1f;
    if (zoom_ > 10.0f) zoom_ = 10.0f;
}

void MapCanvas::screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const {
    world_x = (screen_x - offset_x_) / zoom_;
    world_y = (screen_y - offset_y_) / zoom_;
}

void MapCanvas::world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const {
    screen_x = (float)world_x * zoom_ + offset_x_;
    screen_y = (float)world_y * zoom_ + offset_y_;
}

void MapCanvas::fit_scene(float screen_region_width, float screen_region_height) {
    if (!scene_ || scene_->canvas_width <= 0 || scene_->canvas_height <= 0) {
        offset_x_ = screen_region_width * 0.5f;
        offset_y_ = screen_region_height * 0.5f;
        return;
    }
    const float avail_w = std::max(1.0f, screen_region_width - 2.0f * fit_margin);
    const float avail_h = std::max(1.0f, screen_region_height - 2.0f * fit_margin);
    zoom_ = std::min(avail_w / (float)scene_->canvas_width, avail_h / (float)scene_->canvas_height);
    zoom_ = std::clamp(zoom_, 0.1f, 10.0f);
    offset_x_ = (screen_region_width - (float)scene_->canvas_width * zoom_) * 0.5f;
    offset_y_ = (screen_region_height - (float)scene_->canvas_height * zoom_) * 0.5f;
}

void MapCanvas::draw_grid(ImVec2 region_min, ImVec2 region_max) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    const unsigned int grid_color = IM_COL32(60, 60, 65, 255);
    const float grid_thickness = 1.0f;

    double left_world, top_world, right_world, bottom_world;
    screen_to_world(region_min.x, region_min.y, left_world, top_world);
    screen_to_world(region_max.x, region_max.y, right_world, bottom_world);

    double start_x = std::floor(left_world / grid_step_) * grid_step_;
    double start_y = std::floor(top_world / grid_step_) * grid_step_;

    for (double wx = start_x; wx <= right_world + grid_step_; wx += grid_step_) {
        float sx1, sy1, sx2, sy2;
        world_to_screen(wx, top_world - 1000, sx1, sy1);
        world_to_screen(wx, bottom_world + 1000, sx2, sy2);
        dl->AddLine(ImVec2(sx1, sy1), ImVec2(sx2, sy2), grid_color, grid_thickness);
    }
    for (double wy = start_y; wy <= bottom_world + grid_step_; wy += grid_step_) {
        float sx1, sy1, sx2, sy2;
        world_to_screen(left_world - 1000, wy, sx1, sy1);
        world_to_screen(right_world + 1000, wy, sx2, sy2);
        dl->AddLine(ImVec2(sx1, sy1), ImVec2(sx2, sy2), grid_color, grid_thickness);
    }
}

void MapCanvas::handle_input(float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 win_min = ImGui::GetWindowPos();
    ImVec2 win_max = ImVec2(win_min.x + region_width, win_min.y + region_height);

    bool in_region = mouse.x >= win_min.x && mouse.x <= win_max.x &&
                     mouse.y >= win_min.y && mouse.y <= win_max.y;

    if (ImGui::IsMouseClicked(0) && in_region) {
        dragging_ = true;
        drag_start_x_ = mouse.x;
        drag_start_y_ = mouse.y;
        drag_start_offset_x_ = offset_x_;
        drag_start_offset_y_ = offset_y_;
    }
    if (ImGui::IsMouseReleased(0)) dragging_ = false;

    if (dragging_) {
        offset_x_ = drag_start_offset_x_ + (mouse.x - drag_start_x_);
        offset_y_ = drag_start_offset_y_ + (mouse.y - drag_start_y_);
    }

    if (in_region && io.MouseWheel != 0.0f) {
        float factor = io.MouseWheel > 0 ? 1.2f : 1.0f / 1.2f;
        zoom_at(mouse.x, mouse.y, factor);
    }

    if (!io.WantTextInput) {
        if (ImGui::IsKeyPressed(ImGuiKey_R)) request_resolve();
        if (ImGui::IsKeyPressed(ImGuiKey_B)) render_options_.show_boxes = !render_options_.show_boxes;
        if (ImGui::IsKeyPressed(ImGuiKey_S)) render_options_.show_suppressed = !render_options_.show_suppressed;
        if (ImGui::IsKeyPressed(ImGuiKey_F)) fit_pending_ = true;
    }
}

bool MapCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    if (fit_pending_) {
        fit_scene(region_width, region_height);
        pan(region_min.x, region_min.y);
        fit_pending_ = false;
    }

    handle_input(region_width, region_height);
    if (resolve_pending_) resolve();

    ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    draw_grid(region_min, region_max);

    if (scene_) {
        map_render::render_map(draw_list, *scene_, layout_, offset_x_, offset_y_, zoom_, render_options_);
    }

    return true;
}

} // namespace canvas
