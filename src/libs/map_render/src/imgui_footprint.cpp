#include <map_render/imgui_footprint.hpp>
#include "imgui.h"

namespace map_render {

map_model::Size ImGuiFootprintEstimator::measure(const std::string& text,
    const map_placement::TextStyle& style) const
{
    const float base = ImGui::GetFontSize();
    if (base <= 0.0f) return map_model::Size{};
    const ImVec2 size = ImGui::CalcTextSize(text.c_str());
    const double scale = style.font_size / static_cast<double>(base);
    return map_model::Size{ size.x * scale, size.y * scale };
}

} // namespace map_render
