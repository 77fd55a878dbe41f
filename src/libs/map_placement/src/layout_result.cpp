#include <map_placement/layout_result.hpp>

namespace map_placement {

const char* status_name(PlacementStatus status) {
    switch (status) {
    case PlacementStatus::Placed: return "placed";
    case PlacementStatus::Forced: return "forced";
    case PlacementStatus::Suppressed: return "suppressed";
    }
    return "suppressed";
}

const char* reason_name(SuppressReason reason) {
    switch (reason) {
    case SuppressReason::None: return "none";
    case SuppressReason::NoFreeCandidate: return "no_free_candidate";
    case SuppressReason::NoCandidates: return "no_candidates";
    case SuppressReason::OutsideFrame: return "outside_frame";
    }
    return "none";
}

bool operator==(const Placement& a, const Placement& b) {
    return a.element_id == b.element_id
        && a.kind == b.kind
        && a.status == b.status
        && a.x == b.x
        && a.y == b.y
        && a.rotation == b.rotation
        && a.box == b.box
        && a.overlap_area == b.overlap_area
        && a.reason == b.reason
        && a.candidate_rank == b.candidate_rank
        && a.direction == b.direction
        && a.group == b.group;
}

const Placement* LayoutResult::find(const std::string& element_id) const {
    for (const auto& p : placements) {
        if (p.element_id == element_id) return &p;
    }
    return nullptr;
}

bool operator==(const LayoutResult& a, const LayoutResult& b) {
    return a.placements == b.placements
        && a.forced_count == b.forced_count
        && a.suppressed_count == b.suppressed_count
        && a.forced_ids == b.forced_ids
        && a.suppressed_ids == b.suppressed_ids;
}

std::vector<Obstacle> fixed_obstacles(const LayoutResult& result) {
    std::vector<Obstacle> out;
    for (const auto& p : result.placements) {
        if (p.status != PlacementStatus::Placed) continue;
        out.push_back(Obstacle{ p.element_id, p.box, p.group });
    }
    return out;
}

} // namespace map_placement
