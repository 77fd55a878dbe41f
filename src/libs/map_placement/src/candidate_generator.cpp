#include <map_placement/candidate_generator.hpp>
#include <map_placement/anchor.hpp>
#include <map_placement/geometry.hpp>
#include <map_placement/log.hpp>
#include <algorithm>
#include <variant>

namespace map_placement {

namespace {

// Manual offset: left edge at anchor + offset, vertically centered there.
Candidate offset_candidate(const map_model::Point& anchor, const map_model::Point& offset,
    const map_model::Size& footprint, double rotation)
{
    const double left = anchor.x + offset.x;
    const double mid_y = anchor.y + offset.y;
    Candidate cand;
    cand.x = left + footprint.width * 0.5;
    cand.y = mid_y;
    cand.rotation = rotation;
    cand.box = rotation == 0.0
        ? Rect{ left, mid_y - footprint.height * 0.5, footprint.width, footprint.height }
        : rotated_bounds(cand.x, cand.y, footprint.width, footprint.height, rotation);
    return cand;
}

std::vector<Candidate> tiered_point_candidates(const map_model::Point& anchor, double radius,
    const map_model::Size& footprint, BoxAlignment alignment, double rotation,
    const std::vector<double>& tiers)
{
    std::vector<Candidate> out;
    if (tiers.empty()) {
        return point_anchor_candidates(anchor, radius, footprint, alignment, rotation, 0);
    }
    for (std::size_t t = 0; t < tiers.size(); ++t) {
        auto ring = point_anchor_candidates(anchor, radius * tiers[t], footprint, alignment,
            rotation, static_cast<int>(t));
        out.insert(out.end(), ring.begin(), ring.end());
    }
    return out;
}

struct Generator {
    const map_model::Element& element;
    const PlacementConfig& config;
    const ResolvedDirections* resolved;

    double rotation() const { return element.rotation.value_or(0.0); }

    const KindConfig& kind() const { return config.kind(map_model::kind_of(element)); }

    std::vector<Candidate> operator()(const map_model::PointLabel& a) const {
        if (element.offset) return { offset_candidate(a.anchor, *element.offset, element.footprint, rotation()) };
        return tiered_point_candidates(a.anchor, clearance_radius(config, element), element.footprint,
            BoxAlignment::AwayFromAnchor, rotation(), kind().radius_tiers);
    }

    std::vector<Candidate> operator()(const map_model::PathLabel& a) const {
        if (element.offset) {
            if (a.path.empty()) return {};
            return { offset_candidate(a.path.front(), *element.offset, element.footprint, rotation()) };
        }
        const double* rotation_override = element.rotation ? &*element.rotation : nullptr;
        return path_anchor_candidates(a.path, element.footprint, rotation_override);
    }

    std::vector<Candidate> operator()(const map_model::EventMarker& a) const {
        if (element.offset) return { offset_candidate(a.anchor, *element.offset, element.footprint, rotation()) };
        return tiered_point_candidates(a.anchor, clearance_radius(config, element), element.footprint,
            BoxAlignment::AwayFromAnchor, rotation(), kind().radius_tiers);
    }

    std::vector<Candidate> operator()(const map_model::ArrowEndpoint& a) const {
        if (element.offset) return { offset_candidate(a.anchor, *element.offset, element.footprint, rotation()) };
        auto out = tiered_point_candidates(a.anchor, clearance_radius(config, element), element.footprint,
            BoxAlignment::Centered, rotation(), kind().radius_tiers);

        if (!config.arrow_excludes_label_direction || a.label_id.empty()) return out;

        const auto taken = taken_direction(a.label_id);
        if (!taken) return out;
        out.erase(std::remove_if(out.begin(), out.end(), [&](const Candidate& c) {
            return c.direction == *taken;
        }), out.end());
        return out;
    }

    std::optional<Compass> taken_direction(const std::string& label_id) const {
        if (resolved) {
            const auto it = resolved->find(label_id);
            if (it != resolved->end()) return it->second;
        }
        placement_logger()->warn(
            "arrow_endpoint id={} label={} unresolved, no direction excluded", element.id, label_id);
        return std::nullopt;
    }
};

} // namespace

std::vector<Candidate> generate_candidates(const map_model::Element& element,
    const PlacementConfig& config, const ResolvedDirections* resolved)
{
    std::vector<Candidate> out = std::visit(Generator{ element, config, resolved }, element.anchor);
    for (std::size_t i = 0; i < out.size(); ++i) out[i].rank = static_cast<int>(i);
    return out;
}

} // namespace map_placement
