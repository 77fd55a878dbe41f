#include <map_placement/placement_manager.hpp>
#include <map_placement/candidate_generator.hpp>
#include <map_placement/geometry.hpp>
#include <map_placement/log.hpp>
#include <map_placement/occupied_space.hpp>
#include <map_placement/pairing.hpp>
#include <algorithm>
#include <utility>

namespace map_placement {

namespace {

Placement suppressed(const map_model::Element& element, SuppressReason reason) {
    Placement p;
    p.element_id = element.id;
    p.kind = map_model::kind_of(element);
    p.status = PlacementStatus::Suppressed;
    p.reason = reason;
    p.group = element.group;
    return p;
}

Placement accepted(const map_model::Element& element, const Candidate& c, PlacementStatus status,
    double overlap)
{
    Placement p;
    p.element_id = element.id;
    p.kind = map_model::kind_of(element);
    p.status = status;
    p.x = c.x;
    p.y = c.y;
    p.rotation = c.rotation;
    p.box = c.box;
    p.overlap_area = overlap;
    p.candidate_rank = c.rank;
    p.direction = c.direction;
    p.group = element.group;
    return p;
}

std::vector<Candidate> inside_frame(std::vector<Candidate> candidates, const Rect& frame) {
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&](const Candidate& c) {
        return !contains(frame, c.box);
    }), candidates.end());
    return candidates;
}

class Pass {
public:
    Pass(const PlacementConfig& config, const std::vector<Obstacle>& obstacles)
        : config_(config)
        , space_(config.padding)
    {
        for (const auto& o : obstacles) space_.insert(o.id, o.box, o.group);
    }

    Placement place(const map_model::Element& element) {
        Placement p = place_element(element);
        resolved_[element.id] = p.visible() ? p.direction : std::nullopt;
        return p;
    }

    // Places a city label and its event marker together. Falls back to
    // placing them one by one when the frame leaves no combination, or when
    // either kind suppresses instead of forcing.
    void place_pair(const std::vector<map_model::Element>& elements, const LabelPair& pair,
        std::vector<Placement>& out)
    {
        auto log = placement_logger();
        const map_model::Element& city = elements[pair.city];
        const map_model::Element& event = elements[pair.event];

        std::vector<std::size_t> usable;
        for (std::size_t i = 0; i < pair.candidates.size(); ++i) {
            const PairedCandidate& pc = pair.candidates[i];
            if (config_.frame && (!contains(*config_.frame, pc.city.box) || !contains(*config_.frame, pc.event.box)))
                continue;
            usable.push_back(i);
        }
        if (usable.empty()) {
            log->debug("pair city={} event={} left the frame, placing separately", city.id, event.id);
            place_separately(elements, pair, out);
            return;
        }

        for (std::size_t i : usable) {
            const PairedCandidate& pc = pair.candidates[i];
            if (space_.conflicts(pc.city.box, city.group) || space_.conflicts(pc.event.box, event.group)) continue;
            out[pair.city] = commit(city, pc.city);
            out[pair.event] = commit(event, pc.event);
            return;
        }

        if (config_.kind(map_model::ElementKind::PointLabel).fallback != FallbackPolicy::ForceLeastOverlap ||
            config_.kind(map_model::ElementKind::EventMarker).fallback != FallbackPolicy::ForceLeastOverlap) {
            place_separately(elements, pair, out);
            return;
        }

        std::size_t chosen = usable.front();
        if (std::find(usable.begin(), usable.end(), pair.fallback_index) != usable.end())
            chosen = pair.fallback_index;
        const PairedCandidate& pc = pair.candidates[chosen];
        out[pair.city] = commit(city, pc.city);
        out[pair.event] = commit(event, pc.event);
    }

private:
    void place_separately(const std::vector<map_model::Element>& elements, const LabelPair& pair,
        std::vector<Placement>& out)
    {
        out[pair.city] = place(elements[pair.city]);
        out[pair.event] = place(elements[pair.event]);
    }

    // Commits one member of a pair at `c`, forced when it overlaps what is
    // already placed.
    Placement commit(const map_model::Element& element, const Candidate& c) {
        auto log = placement_logger();
        const map_model::ElementKind kind = map_model::kind_of(element);
        const bool blocked = space_.conflicts(c.box, element.group);
        const double overlap = blocked ? space_.total_overlap(c.box, element.group) : 0.0;
        if (blocked) {
            log->warn("forced id={} kind={} rank={} overlap_area={:.2f} paired=true",
                element.id, map_model::kind_name(kind), c.rank, overlap);
        } else {
            log->debug("placed id={} kind={} rank={} x={:.2f} y={:.2f} paired=true",
                element.id, map_model::kind_name(kind), c.rank, c.x, c.y);
        }
        space_.insert(element.id, c.box, element.group);
        Placement p = accepted(element, c, blocked ? PlacementStatus::Forced : PlacementStatus::Placed, overlap);
        resolved_[element.id] = p.direction;
        return p;
    }

    Placement place_element(const map_model::Element& element) {
        auto log = placement_logger();
        const map_model::ElementKind kind = map_model::kind_of(element);

        std::vector<Candidate> candidates = generate_candidates(element, config_, &resolved_);
        if (candidates.empty()) {
            log->warn("suppressed id={} kind={} reason=no_candidates", element.id, map_model::kind_name(kind));
            return suppressed(element, SuppressReason::NoCandidates);
        }
        if (config_.frame) {
            candidates = inside_frame(std::move(candidates), *config_.frame);
            if (candidates.empty()) {
                log->warn("suppressed id={} kind={} reason=outside_frame", element.id, map_model::kind_name(kind));
                return suppressed(element, SuppressReason::OutsideFrame);
            }
        }

        for (const auto& c : candidates) {
            if (space_.conflicts(c.box, element.group)) continue;
            space_.insert(element.id, c.box, element.group);
            log->debug("placed id={} kind={} rank={} x={:.2f} y={:.2f}",
                element.id, map_model::kind_name(kind), c.rank, c.x, c.y);
            return accepted(element, c, PlacementStatus::Placed, 0.0);
        }

        if (config_.kind(kind).fallback == FallbackPolicy::Suppress) {
            log->warn("suppressed id={} kind={} reason=no_free_candidate candidates={}",
                element.id, map_model::kind_name(kind), candidates.size());
            return suppressed(element, SuppressReason::NoFreeCandidate);
        }

        // Strict comparison: equal cost keeps the earlier candidate.
        std::size_t best = 0;
        double best_overlap = space_.total_overlap(candidates[0].box, element.group);
        for (std::size_t i = 1; i < candidates.size(); ++i) {
            const double overlap = space_.total_overlap(candidates[i].box, element.group);
            if (overlap < best_overlap) {
                best = i;
                best_overlap = overlap;
            }
        }
        const Candidate& c = candidates[best];
        const auto blockers = space_.conflicting_ids(c.box, element.group);
        log->warn("forced id={} kind={} rank={} overlap_area={:.2f} blockers={}",
            element.id, map_model::kind_name(kind), c.rank, best_overlap, blockers.size());
        space_.insert(element.id, c.box, element.group);
        return accepted(element, c, PlacementStatus::Forced, best_overlap);
    }

    const PlacementConfig& config_;
    OccupiedSpace space_;
    ResolvedDirections resolved_;
};

} // namespace

PlacementManager::PlacementManager(PlacementConfig config)
    : config_(std::move(config))
{
}

void PlacementManager::add_obstacle(const Obstacle& obstacle) {
    obstacles_.push_back(obstacle);
}

void PlacementManager::add_obstacles(const std::vector<Obstacle>& obstacles) {
    obstacles_.insert(obstacles_.end(), obstacles.begin(), obstacles.end());
}

LayoutResult PlacementManager::resolve(const std::vector<map_model::Element>& elements) const {
    const std::vector<LabelPair> pairs = detect_pairs(elements, config_);
    std::vector<const LabelPair*> pair_of(elements.size(), nullptr);
    for (const auto& pair : pairs) {
        pair_of[pair.city] = &pair;
        pair_of[pair.event] = &pair;
    }

    // A unit is a lone element or a pair, keyed by its first member's index.
    // A pair sorts by the larger of its two priorities.
    struct Unit {
        std::size_t index;
        int priority;
        const LabelPair* pair;
    };
    std::vector<Unit> units;
    units.reserve(elements.size());
    for (std::size_t i = 0; i < elements.size(); ++i) {
        const LabelPair* pair = pair_of[i];
        if (!pair) {
            units.push_back(Unit{ i, elements[i].priority, nullptr });
        } else if (i == std::min(pair->city, pair->event)) {
            units.push_back(Unit{ i,
                std::max(elements[pair->city].priority, elements[pair->event].priority), pair });
        }
    }
    std::stable_sort(units.begin(), units.end(), [](const Unit& a, const Unit& b) {
        return a.priority < b.priority;
    });

    Pass pass(config_, obstacles_);
    LayoutResult result;
    result.placements.resize(elements.size());
    for (const Unit& unit : units) {
        if (unit.pair)
            pass.place_pair(elements, *unit.pair, result.placements);
        else
            result.placements[unit.index] = pass.place(elements[unit.index]);
    }

    for (const auto& p : result.placements) {
        if (p.status == PlacementStatus::Forced) {
            ++result.forced_count;
            result.forced_ids.push_back(p.element_id);
        } else if (p.status == PlacementStatus::Suppressed) {
            ++result.suppressed_count;
            result.suppressed_ids.push_back(p.element_id);
        }
    }

    placement_logger()->info("resolve elements={} obstacles={} placed={} forced={} suppressed={}",
        elements.size(), obstacles_.size(), result.placed_count(), result.forced_count,
        result.suppressed_count);
    return result;
}

LayoutResult resolve_layout(const std::vector<map_model::Element>& elements,
    const PlacementConfig& config, const std::vector<Obstacle>& obstacles)
{
    PlacementManager manager(config);
    manager.add_obstacles(obstacles);
    return manager.resolve(elements);
}

std::vector<Obstacle> obstacles_from_fixtures(const std::vector<map_model::Fixture>& fixtures) {
    std::vector<Obstacle> out;
    out.reserve(fixtures.size());
    for (const auto& f : fixtures) {
        out.push_back(Obstacle{
            f.id, rect_from_center(f.center.x, f.center.y, f.size.width, f.size.height), f.group });
    }
    return out;
}

} // namespace map_placement
