#pragma once

#include <map_placement/footprint.hpp>

namespace map_render {

// Measures with ImGui::CalcTextSize in the current font, scaled to the
// requested size. Needs a live ImGui context with a built font atlas.
class ImGuiFootprintEstimator : public map_placement::FootprintEstimator {
public:
    map_model::Size measure(const std::string& text, const map_placement::TextStyle& style) const override;
};

} // namespace map_render
