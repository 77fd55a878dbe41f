#pragma once

#include <map_placement/types.hpp>
#include <box2d/box2d.h>
#include <cstddef>
#include <string>
#include <vector>

namespace map_placement {

// Boxes committed during one pass, indexed by a box2d dynamic AABB tree.
// Every stored box is grown by `padding`; queries are padded the same way.
class OccupiedSpace {
public:
    struct Entry {
        std::string id;
        Rect padded;
        std::string group;
    };

    explicit OccupiedSpace(double padding);
    ~OccupiedSpace();

    OccupiedSpace(const OccupiedSpace&) = delete;
    OccupiedSpace& operator=(const OccupiedSpace&) = delete;

    void insert(const std::string& id, const Rect& box, const std::string& group);

    // True when the padded query meets any stored box outside `group`.
    bool conflicts(const Rect& box, const std::string& group) const;

    // Summed intersection area of the padded query with stored boxes outside `group`.
    double total_overlap(const Rect& box, const std::string& group) const;

    // Ids of stored boxes the padded query meets, in insertion order.
    std::vector<std::string> conflicting_ids(const Rect& box, const std::string& group) const;

    std::size_t size() const { return entries_.size(); }
    double padding() const { return padding_; }
    const std::vector<Entry>& entries() const { return entries_; }

private:
    std::vector<std::size_t> query(const Rect& padded, const std::string& group) const;

    double padding_ = 0.0;
    std::vector<Entry> entries_;
    b2DynamicTree tree_;
};

} // namespace map_placement
