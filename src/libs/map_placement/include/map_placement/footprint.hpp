#pragma once

#include <map_model/types.hpp>
#include <string>

namespace map_placement {

struct TextStyle {
    double font_size = 9.0; // points, treated as pixels at 1:1
};

// Supplied capability: text + style -> estimated box size.
// The placement core never measures text itself.
class FootprintEstimator {
public:
    virtual ~FootprintEstimator() = default;
    virtual map_model::Size measure(const std::string& text, const TextStyle& style) const = 0;
};

// Average-glyph approximation: 0.6 em per character, 1.2 em line height.
class HeuristicFootprintEstimator : public FootprintEstimator {
public:
    map_model::Size measure(const std::string& text, const TextStyle& style) const override;
};

constexpr double subtext_gap = 2.0;

// Text stacked over subtext, separated by `subtext_gap`. Empty subtext adds nothing.
map_model::Size measure_block(const FootprintEstimator& estimator,
    const std::string& text, const TextStyle& style,
    const std::string& subtext, const TextStyle& subtext_style);

} // namespace map_placement
