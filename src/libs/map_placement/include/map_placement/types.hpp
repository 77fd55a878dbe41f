#pragma once

#include <optional>
#include <string>

namespace map_placement {

// Axis-aligned box in output pixels (y down). (x, y) is the top-left corner.
struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

inline bool operator==(const Rect& a, const Rect& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

// Compass positions around a point anchor. Enumerator order is Imhof rank.
enum class Compass {
    NE,
    E,
    NW,
    W,
    SE,
    SW,
    N,
    S
};

// Box committed before the pass starts. Blocks candidates, gets no status.
struct Obstacle {
    std::string id;
    Rect box;
    std::string group;
};

struct Candidate {
    double x = 0;            // center of the (unrotated) footprint
    double y = 0;
    double rotation = 0;     // degrees
    Rect box;                // unpadded, axis-aligned
    int rank = 0;            // position in the element's candidate list
    std::optional<Compass> direction;
    int segment = -1;        // path labels only
    int tier = 0;            // distance tier for point anchors
};

} // namespace map_placement
