#include <map_placement/overlap_audit.hpp>
#include <map_placement/geometry.hpp>

namespace map_placement {

namespace {

bool same_group(const std::string& a, const std::string& b) {
    return !a.empty() && a == b;
}

} // namespace

std::vector<OverlapPair> detect_overlaps(const LayoutResult& result,
    const std::vector<Obstacle>& obstacles, double padding)
{
    std::vector<const Placement*> visible;
    for (const auto& p : result.placements) {
        if (p.visible()) visible.push_back(&p);
    }

    std::vector<OverlapPair> pairs;
    for (std::size_t i = 0; i < visible.size(); ++i) {
        const Rect a = inflate(visible[i]->box, padding);
        for (std::size_t j = i + 1; j < visible.size(); ++j) {
            if (same_group(visible[i]->group, visible[j]->group)) continue;
            const Rect b = inflate(visible[j]->box, padding);
            if (!intersects(a, b)) continue;
            pairs.push_back(OverlapPair{ visible[i]->element_id, visible[j]->element_id, overlap_area(a, b) });
        }
        for (const auto& o : obstacles) {
            if (same_group(visible[i]->group, o.group)) continue;
            const Rect b = inflate(o.box, padding);
            if (!intersects(a, b)) continue;
            pairs.push_back(OverlapPair{ visible[i]->element_id, o.id, overlap_area(a, b) });
        }
    }
    return pairs;
}

std::size_t log_overlaps(const std::vector<OverlapPair>& pairs,
    const std::shared_ptr<spdlog::logger>& logger)
{
    for (const auto& pair : pairs) {
        logger->warn("overlap pair={}|{} area={:.2f}", pair.first, pair.second, pair.area);
    }
    return pairs.size();
}

} // namespace map_placement
