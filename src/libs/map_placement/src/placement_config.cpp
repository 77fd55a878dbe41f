#include <map_placement/placement_config.hpp>
#include <map_placement/placement_constants.hpp>
#include <variant>

namespace map_placement {

const char* fallback_policy_name(FallbackPolicy policy) {
    switch (policy) {
    case FallbackPolicy::ForceLeastOverlap: return "force-least-overlap";
    case FallbackPolicy::Suppress: return "suppress";
    }
    return "force-least-overlap";
}

std::optional<FallbackPolicy> fallback_policy_from_name(const std::string& name) {
    if (name == "force-least-overlap") return FallbackPolicy::ForceLeastOverlap;
    if (name == "suppress") return FallbackPolicy::Suppress;
    return std::nullopt;
}

PlacementConfig default_placement_config() {
    using map_model::ElementKind;
    PlacementConfig cfg;
    cfg.padding = defaults::padding;
    cfg.arrow_excludes_label_direction = true;

    cfg.kind(ElementKind::PointLabel) = KindConfig{
        defaults::city_radius(defaults::default_city_level), FallbackPolicy::ForceLeastOverlap, { 1.0 } };
    // River and campaign labels are optional decoration; drop them rather than cover a city.
    cfg.kind(ElementKind::PathLabel) = KindConfig{ 0.0, FallbackPolicy::Suppress, { 1.0 } };
    cfg.kind(ElementKind::EventMarker) = KindConfig{
        defaults::event_radius, FallbackPolicy::ForceLeastOverlap, { 1.0 } };
    cfg.kind(ElementKind::ArrowEndpoint) = KindConfig{
        defaults::arrow_endpoint_radius, FallbackPolicy::ForceLeastOverlap, { 1.0 } };

    for (int level = 1; level <= 4; ++level)
        cfg.level_radius[level] = defaults::city_radius(level);
    cfg.pair_threshold = defaults::pair_threshold;
    cfg.pair_event_tiers = { 1.0, 1.3, 1.6 };
    return cfg;
}

double clearance_radius(const PlacementConfig& config, const map_model::Element& element) {
    const map_model::ElementKind k = map_model::kind_of(element);
    if (const auto* label = std::get_if<map_model::PointLabel>(&element.anchor)) {
        const auto it = config.level_radius.find(defaults::clamp_city_level(label->level));
        if (it != config.level_radius.end()) return it->second;
    }
    return config.kind(k).radius;
}

} // namespace map_placement
