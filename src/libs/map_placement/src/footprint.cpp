#include <map_placement/footprint.hpp>
#include <algorithm>

namespace map_placement {

namespace {

const double char_width_em = 0.6;
const double line_height_em = 1.2;

} // namespace

map_model::Size HeuristicFootprintEstimator::measure(const std::string& text, const TextStyle& style) const {
    return map_model::Size{
        static_cast<double>(text.size()) * style.font_size * char_width_em,
        style.font_size * line_height_em
    };
}

map_model::Size measure_block(const FootprintEstimator& estimator,
    const std::string& text, const TextStyle& style,
    const std::string& subtext, const TextStyle& subtext_style)
{
    map_model::Size size = estimator.measure(text, style);
    if (subtext.empty()) return size;
    const map_model::Size sub = estimator.measure(subtext, subtext_style);
    size.width = std::max(size.width, sub.width);
    size.height += subtext_gap + sub.height;
    return size;
}

} // namespace map_placement
