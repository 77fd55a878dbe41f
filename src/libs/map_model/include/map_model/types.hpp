#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace map_model {

// Output pixel space, y grows downward.
struct Point {
    double x = 0;
    double y = 0;
};

inline bool operator==(const Point& a, const Point& b) {
    return a.x == b.x && a.y == b.y;
}

struct Size {
    double width = 0;
    double height = 0;
};

// City label around a point anchor. `level` 1..4 selects the clearance radius.
struct PointLabel {
    Point anchor;
    int level = 2;
};

// What a path label names. Regions are drawn without their baseline.
enum class PathRole {
    River,
    Region
};

inline const char* path_role_name(PathRole role) {
    return role == PathRole::Region ? "region" : "river";
}

inline std::optional<PathRole> path_role_from_name(const std::string& s) {
    if (s == "river") return PathRole::River;
    if (s == "region") return PathRole::Region;
    return std::nullopt;
}

// River / region / campaign label following a polyline.
struct PathLabel {
    std::vector<Point> path;
    PathRole role = PathRole::River;
};

// Event text around an event location.
struct EventMarker {
    Point anchor;
};

// Arrowhead touching a city's anchor circle. `label_id` names the label
// sharing the anchor; its chosen direction is not offered to the arrowhead.
struct ArrowEndpoint {
    Point anchor;
    std::string label_id;
};

using Anchor = std::variant<PointLabel, PathLabel, EventMarker, ArrowEndpoint>;

// Index order matches the Anchor alternatives.
enum class ElementKind {
    PointLabel,
    PathLabel,
    EventMarker,
    ArrowEndpoint
};

struct Element {
    std::string id;
    Anchor anchor;
    int priority = 0;        // lower is placed first
    Size footprint;
    std::string group;       // same non-empty group never conflicts
    std::optional<Point> offset;
    std::optional<double> rotation; // degrees
    std::string text;
};

inline ElementKind kind_of(const Element& e) {
    return static_cast<ElementKind>(e.anchor.index());
}

inline const char* kind_name(ElementKind kind) {
    switch (kind) {
    case ElementKind::PointLabel: return "point_label";
    case ElementKind::PathLabel: return "path_label";
    case ElementKind::EventMarker: return "event_marker";
    case ElementKind::ArrowEndpoint: return "arrow_endpoint";
    }
    return "point_label";
}

inline std::optional<ElementKind> kind_from_name(const std::string& s) {
    if (s == "point_label") return ElementKind::PointLabel;
    if (s == "path_label") return ElementKind::PathLabel;
    if (s == "event_marker") return ElementKind::EventMarker;
    if (s == "arrow_endpoint") return ElementKind::ArrowEndpoint;
    return std::nullopt;
}

} // namespace map_model
