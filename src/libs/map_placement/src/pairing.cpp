#include <map_placement/pairing.hpp>
#include <map_placement/candidate_generator.hpp>
#include <map_placement/geometry.hpp>
#include <map_placement/log.hpp>
#include <variant>

namespace map_placement {

namespace {

std::vector<Candidate> paired_event_candidates(const map_model::Element& event, const PlacementConfig& config) {
    PlacementConfig tiered = config;
    tiered.kind(map_model::ElementKind::EventMarker).radius_tiers = config.pair_event_tiers;
    return generate_candidates(event, tiered);
}

LabelPair combine(std::size_t city_index, std::size_t event_index,
    const std::vector<map_model::Element>& elements, const PlacementConfig& config)
{
    LabelPair pair;
    pair.city = city_index;
    pair.event = event_index;

    const auto cities = generate_candidates(elements[city_index], config);
    const auto events = paired_event_candidates(elements[event_index], config);
    bool have_fallback = false;
    for (const auto& c : cities) {
        const Rect city_box = inflate(c.box, config.padding);
        for (const auto& e : events) {
            if (intersects(city_box, inflate(e.box, config.padding))) continue;
            if (!have_fallback && c.tier >= 1) {
                pair.fallback_index = pair.candidates.size();
                have_fallback = true;
            }
            pair.candidates.push_back(PairedCandidate{ c, e });
        }
    }
    return pair;
}

} // namespace

std::vector<LabelPair> detect_pairs(const std::vector<map_model::Element>& elements,
    const PlacementConfig& config)
{
    std::vector<LabelPair> out;
    if (config.pair_threshold <= 0.0) return out;

    auto log = placement_logger();
    std::vector<bool> paired(elements.size(), false);
    for (std::size_t c = 0; c < elements.size(); ++c) {
        const auto* city = std::get_if<map_model::PointLabel>(&elements[c].anchor);
        if (!city || elements[c].offset) continue;

        for (std::size_t e = 0; e < elements.size(); ++e) {
            if (paired[e]) continue;
            const auto* event = std::get_if<map_model::EventMarker>(&elements[e].anchor);
            if (!event || elements[e].offset) continue;
            if (distance(city->anchor, event->anchor) >= config.pair_threshold) continue;

            LabelPair pair = combine(c, e, elements, config);
            if (pair.candidates.empty()) {
                log->warn("pair city={} event={} has no compatible positions, placing separately",
                    elements[c].id, elements[e].id);
                continue;
            }
            log->info("paired city={} event={} distance={:.1f} combinations={}",
                elements[c].id, elements[e].id, distance(city->anchor, event->anchor), pair.candidates.size());
            paired[e] = true;
            out.push_back(std::move(pair));
            break;
        }
    }
    return out;
}

} // namespace map_placement
