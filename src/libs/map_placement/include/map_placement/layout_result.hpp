#pragma once

#include <map_model/types.hpp>
#include <map_placement/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace map_placement {

enum class PlacementStatus {
    Placed,
    Forced,
    Suppressed
};

enum class SuppressReason {
    None,
    NoFreeCandidate, // every candidate overlapped, fallback is suppress
    NoCandidates,    // the element produced no candidates at all
    OutsideFrame     // every candidate left the frame
};

const char* status_name(PlacementStatus status);
const char* reason_name(SuppressReason reason);

struct Placement {
    std::string element_id;
    map_model::ElementKind kind = map_model::ElementKind::PointLabel;
    PlacementStatus status = PlacementStatus::Suppressed;
    // Center of the footprint and its rotation; meaningless when suppressed.
    double x = 0;
    double y = 0;
    double rotation = 0;
    Rect box;                 // unpadded, axis-aligned
    double overlap_area = 0;  // forced only; summed over padded boxes
    SuppressReason reason = SuppressReason::None;
    int candidate_rank = -1;
    std::optional<Compass> direction;
    std::string group;

    bool visible() const { return status != PlacementStatus::Suppressed; }
};

bool operator==(const Placement& a, const Placement& b);

struct LayoutResult {
    std::vector<Placement> placements; // input order
    std::size_t forced_count = 0;
    std::size_t suppressed_count = 0;
    std::vector<std::string> forced_ids;
    std::vector<std::string> suppressed_ids;

    const Placement* find(const std::string& element_id) const;
    std::size_t placed_count() const { return placements.size() - forced_count - suppressed_count; }
};

bool operator==(const LayoutResult& a, const LayoutResult& b);

// Boxes of the Placed entries, as obstacles for a later pass.
std::vector<Obstacle> fixed_obstacles(const LayoutResult& result);

} // namespace map_placement
