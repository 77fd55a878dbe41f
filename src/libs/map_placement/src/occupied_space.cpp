#include <map_placement/occupied_space.hpp>
#include <map_placement/geometry.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>

namespace map_placement {

namespace {

// Tree bounds are float; the exact test below runs on the double boxes.
constexpr float tree_slack = 0.5f;

b2AABB to_aabb(const Rect& r) {
    b2AABB aabb;
    aabb.lowerBound = b2Vec2{ static_cast<float>(r.x) - tree_slack, static_cast<float>(r.y) - tree_slack };
    aabb.upperBound = b2Vec2{
        static_cast<float>(rect_right(r)) + tree_slack,
        static_cast<float>(rect_bottom(r)) + tree_slack
    };
    return aabb;
}

bool same_group(const std::string& a, const std::string& b) {
    return !a.empty() && a == b;
}

struct QueryContext {
    std::vector<std::size_t>* hits;
};

} // namespace

OccupiedSpace::OccupiedSpace(double padding)
    : padding_(padding)
    , tree_(b2DynamicTree_Create())
{
}

OccupiedSpace::~OccupiedSpace() {
    b2DynamicTree_Destroy(&tree_);
}

void OccupiedSpace::insert(const std::string& id, const Rect& box, const std::string& group) {
    const Rect padded = inflate(box, padding_);
    const std::size_t index = entries_.size();
    entries_.push_back(Entry{ id, padded, group });
    b2DynamicTree_CreateProxy(&tree_, to_aabb(padded), 1, static_cast<uint64_t>(index));
}

std::vector<std::size_t> OccupiedSpace::query(const Rect& padded, const std::string& group) const {
    std::vector<std::size_t> hits;
    QueryContext ctx{ &hits };
    b2DynamicTree_Query(&tree_, to_aabb(padded), std::numeric_limits<uint64_t>::max(),
        [](auto, auto user_data, void* context) -> bool {
            static_cast<QueryContext*>(context)->hits->push_back(static_cast<std::size_t>(user_data));
            return true;
        },
        &ctx);

    hits.erase(std::remove_if(hits.begin(), hits.end(), [&](std::size_t i) {
        const Entry& e = entries_[i];
        return same_group(e.group, group) || !intersects(e.padded, padded);
    }), hits.end());
    std::sort(hits.begin(), hits.end());
    return hits;
}

bool OccupiedSpace::conflicts(const Rect& box, const std::string& group) const {
    return !query(inflate(box, padding_), group).empty();
}

double OccupiedSpace::total_overlap(const Rect& box, const std::string& group) const {
    const Rect padded = inflate(box, padding_);
    double total = 0.0;
    for (std::size_t i : query(padded, group)) total += overlap_area(entries_[i].padded, padded);
    return total;
}

std::vector<std::string> OccupiedSpace::conflicting_ids(const Rect& box, const std::string& group) const {
    std::vector<std::string> ids;
    for (std::size_t i : query(inflate(box, padding_), group)) ids.push_back(entries_[i].id);
    return ids;
}

} // namespace map_placement
