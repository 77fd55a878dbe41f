#include <map_render/renderer.hpp>
#include <map_placement/geometry.hpp>
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <variant>

namespace map_render {

namespace {

constexpr float pi = 3.14159265358979323846f;

const unsigned int paper_color = IM_COL32(236, 226, 198, 255);
const unsigned int paper_border = IM_COL32(120, 100, 70, 255);
const unsigned int ink_color = IM_COL32(40, 32, 24, 255);
const unsigned int river_color = IM_COL32(40, 80, 150, 255);
const unsigned int region_color = IM_COL32(110, 90, 60, 160);
const unsigned int invasion_color = IM_COL32(170, 30, 30, 220);
const unsigned int retreat_color = IM_COL32(60, 60, 60, 200);
const unsigned int dot_color = IM_COL32(20, 20, 20, 255);
const unsigned int forced_color = IM_COL32(220, 20, 20, 255);
const unsigned int box_color = IM_COL32(60, 140, 60, 160);
const unsigned int ghost_color = IM_COL32(120, 120, 120, 110);

ImVec2 world_to_screen(double wx, double wy, float offset_x, float offset_y, float zoom) {
    return ImVec2((float)wx * zoom + offset_x, (float)wy * zoom + offset_y);
}

// Rotates the vertices emitted since `first_vertex` about `center` (screen space).
void rotate_vertices(ImDrawList* draw_list, int first_vertex, ImVec2 center, float degrees) {
    const float rad = degrees * pi / 180.0f;
    const float c = std::cos(rad);
    const float s = std::sin(rad);
    for (int i = first_vertex; i < draw_list->VtxBuffer.Size; ++i) {
        ImVec2& p = draw_list->VtxBuffer[i].pos;
        const float dx = p.x - center.x;
        const float dy = p.y - center.y;
        p = ImVec2(center.x + dx * c - dy * s, center.y + dx * s + dy * c);
    }
}

// Text scaled to fill `size` (world units) and centered on (cx, cy).
void draw_fitted_text(ImDrawList* draw_list, const std::string& text,
    double cx, double cy, const map_model::Size& size, double rotation, unsigned int color,
    float offset_x, float offset_y, float zoom)
{
    if (text.empty() || size.width <= 0 || size.height <= 0) return;
    const ImVec2 natural = ImGui::CalcTextSize(text.c_str());
    if (natural.x <= 0 || natural.y <= 0) return;

    const float fit = std::min((float)size.width / natural.x, (float)size.height / natural.y);
    const float font_px = ImGui::GetFontSize() * fit * zoom;
    const ImVec2 center = world_to_screen(cx, cy, offset_x, offset_y, zoom);
    const ImVec2 pos(center.x - natural.x * fit * zoom * 0.5f, center.y - natural.y * fit * zoom * 0.5f);

    const int first_vertex = draw_list->VtxBuffer.Size;
    draw_list->AddText(ImGui::GetFont(), font_px, pos, color, text.c_str());
    if (rotation != 0.0) rotate_vertices(draw_list, first_vertex, center, (float)rotation);
}

void draw_polyline(ImDrawList* draw_list, const std::vector<map_model::Point>& points,
    unsigned int color, float thickness, float offset_x, float offset_y, float zoom)
{
    for (std::size_t i = 0; i + 1 < points.size(); ++i) {
        draw_list->AddLine(
            world_to_screen(points[i].x, points[i].y, offset_x, offset_y, zoom),
            world_to_screen(points[i + 1].x, points[i + 1].y, offset_x, offset_y, zoom),
            color, thickness);
    }
}

// Triangle centered on the placement, tip pointing at the anchor.
void draw_arrowhead(ImDrawList* draw_list, const map_placement::Placement& p,
    const map_model::Point& anchor, unsigned int color, float offset_x, float offset_y, float zoom)
{
    const double bearing = map_placement::bearing_degrees({ p.x, p.y }, anchor) * pi / 180.0;
    const double half = std::max(p.box.width, p.box.height) * 0.5;
    const double fx = std::sin(bearing);
    const double fy = -std::cos(bearing);
    const map_model::Point tip{ p.x + fx * half, p.y + fy * half };
    const map_model::Point left{ p.x - fx * half - fy * half * 0.7, p.y - fy * half + fx * half * 0.7 };
    const map_model::Point right{ p.x - fx * half + fy * half * 0.7, p.y - fy * half - fx * half * 0.7 };
    draw_list->AddTriangleFilled(
        world_to_screen(tip.x, tip.y, offset_x, offset_y, zoom),
        world_to_screen(left.x, left.y, offset_x, offset_y, zoom),
        world_to_screen(right.x, right.y, offset_x, offset_y, zoom),
        color);
}

map_model::Point anchor_point(const map_model::Element& element) {
    struct Visitor {
        map_model::Point operator()(const map_model::PointLabel& a) const { return a.anchor; }
        map_model::Point operator()(const map_model::EventMarker& a) const { return a.anchor; }
        map_model::Point operator()(const map_model::ArrowEndpoint& a) const { return a.anchor; }
        map_model::Point operator()(const map_model::PathLabel& a) const {
            return a.path.empty() ? map_model::Point{} : a.path.front();
        }
    };
    return std::visit(Visitor{}, element.anchor);
}

unsigned int text_color(const map_model::Element& e) {
    if (const auto* path = std::get_if<map_model::PathLabel>(&e.anchor))
        return path->role == map_model::PathRole::Region ? region_color : river_color;
    return ink_color;
}

} // namespace

void render_map(ImDrawList* draw_list,
    const map_model::MapScene& scene,
    const map_placement::LayoutResult& layout,
    float offset_x, float offset_y, float zoom,
    const RenderOptions& options)
{
    if (!draw_list) return;

    const ImVec2 paper_min = world_to_screen(0, 0, offset_x, offset_y, zoom);
    const ImVec2 paper_max = world_to_screen(scene.canvas_width, scene.canvas_height, offset_x, offset_y, zoom);
    draw_list->AddRectFilled(paper_min, paper_max, paper_color);
    draw_list->AddRect(paper_min, paper_max, paper_border, 0.0f, 0, 2.0f);

    std::unordered_map<std::string, const map_model::Element*> elements;
    for (const auto& e : scene.elements) elements[e.id] = &e;

    // River courses; regions only carry a baseline path.
    for (const auto& p : layout.placements) {
        if (p.kind != map_model::ElementKind::PathLabel) continue;
        auto it = elements.find(p.element_id);
        if (it == elements.end()) continue;
        if (const auto* path = std::get_if<map_model::PathLabel>(&it->second->anchor)) {
            if (path->role == map_model::PathRole::River)
                draw_polyline(draw_list, path->path, river_color, 1.5f * zoom, offset_x, offset_y, zoom);
        }
    }

    if (options.show_campaigns) {
        for (const auto& c : scene.campaigns) {
            const unsigned int color = c.style == "retreat" ? retreat_color : invasion_color;
            draw_polyline(draw_list, c.points, color, 2.5f * zoom, offset_x, offset_y, zoom);
        }
    }

    if (options.show_fixtures) {
        for (const auto& f : scene.fixtures) {
            const ImVec2 c = world_to_screen(f.center.x, f.center.y, offset_x, offset_y, zoom);
            const float r = (float)std::max(f.size.width, f.size.height) * 0.5f * zoom;
            draw_list->AddCircleFilled(c, r, dot_color);
        }
    }

    for (const auto& p : layout.placements) {
        auto it = elements.find(p.element_id);
        if (it == elements.end()) continue;
        const map_model::Element& e = *it->second;

        if (!p.visible()) {
            if (!options.show_suppressed || e.text.empty()) continue;
            const map_model::Point at = anchor_point(e);
            draw_fitted_text(draw_list, e.text, at.x, at.y, e.footprint, 0.0, ghost_color,
                offset_x, offset_y, zoom);
            continue;
        }

        if (p.kind == map_model::ElementKind::ArrowEndpoint) {
            draw_arrowhead(draw_list, p, anchor_point(e), invasion_color, offset_x, offset_y, zoom);
        } else {
            const unsigned int color = text_color(e);
            draw_fitted_text(draw_list, e.text, p.x, p.y, e.footprint, p.rotation, color,
                offset_x, offset_y, zoom);
        }

        const bool forced = p.status == map_placement::PlacementStatus::Forced;
        if (forced || options.show_boxes) {
            draw_list->AddRect(
                world_to_screen(p.box.x, p.box.y, offset_x, offset_y, zoom),
                world_to_screen(map_placement::rect_right(p.box), map_placement::rect_bottom(p.box),
                    offset_x, offset_y, zoom),
                forced ? forced_color : box_color, 0.0f, 0, forced ? 2.0f : 1.0f);
        }
    }
}

} // namespace map_render
