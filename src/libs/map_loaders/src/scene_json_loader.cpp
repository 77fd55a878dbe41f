#include <map_loaders/json_loader.hpp>
#include <map_placement/placement_constants.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <fstream>
#include <set>

namespace map_loaders {

namespace {

using map_model::ElementKind;
namespace defaults = map_placement::defaults;

std::nullopt_t reject(const std::string& what) {
    spdlog::warn("map scene rejected: {}", what);
    return std::nullopt;
}

std::optional<map_model::Point> parse_point(const nlohmann::json& j) {
    if (!j.is_array() || j.size() != 2 || !j[0].is_number() || !j[1].is_number()) return std::nullopt;
    return map_model::Point{ j[0].get<double>(), j[1].get<double>() };
}

std::optional<std::vector<map_model::Point>> parse_points(const nlohmann::json& j) {
    if (!j.is_array()) return std::nullopt;
    std::vector<map_model::Point> out;
    for (const auto& p : j) {
        auto pt = parse_point(p);
        if (!pt) return std::nullopt;
        out.push_back(*pt);
    }
    return out;
}

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

double default_font_size(ElementKind kind, int level, map_model::PathRole role) {
    switch (kind) {
    case ElementKind::PointLabel: return defaults::city_font(level);
    case ElementKind::PathLabel:
        return role == map_model::PathRole::Region ? defaults::region_font_size : defaults::river_font_size;
    case ElementKind::EventMarker: return defaults::event_font_size;
    case ElementKind::ArrowEndpoint: return defaults::arrowhead_size;
    }
    return defaults::city_font(defaults::default_city_level);
}

std::optional<map_model::Anchor> parse_anchor(const nlohmann::json& e, ElementKind kind, int level,
    map_model::PathRole role)
{
    if (kind == ElementKind::PathLabel) {
        if (!e.contains("path")) return std::nullopt;
        auto path = parse_points(e["path"]);
        if (!path) return std::nullopt;
        return map_model::Anchor{ map_model::PathLabel{ std::move(*path), role } };
    }

    if (!e.contains("anchor")) return std::nullopt;
    auto at = parse_point(e["anchor"]);
    if (!at) return std::nullopt;
    switch (kind) {
    case ElementKind::PointLabel: return map_model::Anchor{ map_model::PointLabel{ *at, level } };
    case ElementKind::EventMarker: return map_model::Anchor{ map_model::EventMarker{ *at } };
    case ElementKind::ArrowEndpoint:
        return map_model::Anchor{ map_model::ArrowEndpoint{ *at, string_or(e, "label_id", "") } };
    case ElementKind::PathLabel: break;
    }
    return std::nullopt;
}

map_model::Size measure_footprint(const nlohmann::json& e, ElementKind kind, int level,
    map_model::PathRole role, const std::string& text, const map_placement::FootprintEstimator& estimator)
{
    if (kind == ElementKind::ArrowEndpoint && text.empty())
        return map_model::Size{ defaults::arrowhead_size, defaults::arrowhead_size };

    map_placement::TextStyle style;
    style.font_size = e.contains("font_size") && e["font_size"].is_number()
        ? e["font_size"].get<double>() : default_font_size(kind, level, role);
    map_placement::TextStyle sub_style;
    sub_style.font_size = e.contains("subtext_font_size") && e["subtext_font_size"].is_number()
        ? e["subtext_font_size"].get<double>() : defaults::event_subtext_font_size;
    return map_placement::measure_block(estimator, text, style, string_or(e, "subtext", ""), sub_style);
}

std::optional<map_model::Element> parse_element(const nlohmann::json& e,
    const map_placement::FootprintEstimator& estimator)
{
    if (!e.is_object()) return reject("element is not an object");
    if (!e.contains("id") || !e["id"].is_string()) return reject("element without string id");
    map_model::Element el;
    el.id = e["id"].get<std::string>();

    if (!e.contains("kind") || !e["kind"].is_string()) return reject("element " + el.id + " without kind");
    const auto kind = map_model::kind_from_name(e["kind"].get<std::string>());
    if (!kind) return reject("element " + el.id + " has unknown kind " + e["kind"].get<std::string>());

    int level = defaults::default_city_level;
    if (e.contains("level")) {
        if (!e["level"].is_number_integer()) return reject("element " + el.id + " level is not an integer");
        level = e["level"].get<int>();
    }

    map_model::PathRole role = map_model::PathRole::River;
    if (e.contains("role")) {
        const auto parsed = e["role"].is_string()
            ? map_model::path_role_from_name(e["role"].get<std::string>()) : std::nullopt;
        if (*kind != ElementKind::PathLabel || !parsed)
            return reject("element " + el.id + " has an invalid role");
        role = *parsed;
    }

    auto anchor = parse_anchor(e, *kind, level, role);
    if (!anchor) return reject("element " + el.id + " has a malformed anchor or path");
    el.anchor = std::move(*anchor);

    if (e.contains("priority")) {
        if (!e["priority"].is_number_integer()) return reject("element " + el.id + " priority is not an integer");
        el.priority = e["priority"].get<int>();
    } else {
        el.priority = role == map_model::PathRole::Region
            ? defaults::priority::region : defaults::default_priority(*kind, level);
    }

    el.text = string_or(e, "text", "");
    el.group = string_or(e, "group", "");

    if (e.contains("offset")) {
        auto off = parse_point(e["offset"]);
        if (!off) return reject("element " + el.id + " offset is not [dx, dy]");
        el.offset = *off;
    }
    if (e.contains("rotation")) {
        if (!e["rotation"].is_number()) return reject("element " + el.id + " rotation is not a number");
        el.rotation = e["rotation"].get<double>();
    }

    const bool has_w = e.contains("width") && e["width"].is_number();
    const bool has_h = e.contains("height") && e["height"].is_number();
    if (has_w && has_h) {
        el.footprint = map_model::Size{ e["width"].get<double>(), e["height"].get<double>() };
    } else {
        el.footprint = measure_footprint(e, *kind, level, role, el.text, estimator);
        if (has_w) el.footprint.width = e["width"].get<double>();
        if (has_h) el.footprint.height = e["height"].get<double>();
    }
    // Also catches empty text measured to zero width.
    if (!(std::isfinite(el.footprint.width) && el.footprint.width > 0.0) ||
        !(std::isfinite(el.footprint.height) && el.footprint.height > 0.0))
        return reject("element " + el.id + " has an empty or non-finite footprint");
    return el;
}

std::optional<map_model::Fixture> parse_fixture(const nlohmann::json& f) {
    if (!f.is_object() || !f.contains("id") || !f["id"].is_string()) return reject("fixture without string id");
    map_model::Fixture fx;
    fx.id = f["id"].get<std::string>();
    auto center = f.contains("center") ? parse_point(f["center"]) : std::nullopt;
    if (!center) return reject("fixture " + fx.id + " center is not [x, y]");
    fx.center = *center;
    auto size = f.contains("size") ? parse_point(f["size"]) : std::nullopt;
    if (!size) return reject("fixture " + fx.id + " size is not [w, h]");
    fx.size = map_model::Size{ size->x, size->y };
    fx.group = string_or(f, "group", "");
    return fx;
}

std::optional<map_model::CampaignPath> parse_campaign(const nlohmann::json& c) {
    if (!c.is_object() || !c.contains("id") || !c["id"].is_string()) return reject("campaign without string id");
    map_model::CampaignPath path;
    path.id = c["id"].get<std::string>();
    auto points = c.contains("points") ? parse_points(c["points"]) : std::nullopt;
    if (!points) return reject("campaign " + path.id + " points are malformed");
    path.points = std::move(*points);
    path.style = string_or(c, "style", "invasion");
    return path;
}

std::optional<map_model::MapScene> parse_scene_json(const nlohmann::json& j,
    const map_placement::FootprintEstimator& estimator)
{
    map_model::MapScene scene;
    if (!j.is_object()) return reject("top level is not an object");
    if (!j.contains("elements") || !j["elements"].is_array()) return reject("missing elements array");

    std::set<std::string> ids;
    for (const auto& e : j["elements"]) {
        auto el = parse_element(e, estimator);
        if (!el) return std::nullopt;
        if (!ids.insert(el->id).second) return reject("duplicate element id " + el->id);
        scene.elements.push_back(std::move(*el));
    }
    if (j.contains("fixtures")) {
        if (!j["fixtures"].is_array()) return reject("fixtures is not an array");
        for (const auto& f : j["fixtures"]) {
            auto fx = parse_fixture(f);
            if (!fx) return std::nullopt;
            scene.fixtures.push_back(std::move(*fx));
        }
    }
    if (j.contains("campaigns")) {
        if (!j["campaigns"].is_array()) return reject("campaigns is not an array");
        for (const auto& c : j["campaigns"]) {
            auto path = parse_campaign(c);
            if (!path) return std::nullopt;
            scene.campaigns.push_back(std::move(*path));
        }
    }

    if (j.contains("name") && j["name"].is_string()) scene.name = j["name"].get<std::string>();
    if (j.contains("canvas_width") && j["canvas_width"].is_number()) scene.canvas_width = j["canvas_width"].get<double>();
    if (j.contains("canvas_height") && j["canvas_height"].is_number()) scene.canvas_height = j["canvas_height"].get<double>();

    return scene;
}

} // namespace

std::optional<map_model::MapScene> load_map_from_json(std::istream& in,
    const map_placement::FootprintEstimator& estimator)
{
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_scene_json(j, estimator);
    } catch (const nlohmann::json::exception& e) {
        return reject(e.what());
    }
}

std::optional<map_model::MapScene> load_map_from_json_file(const std::string& path,
    const map_placement::FootprintEstimator& estimator)
{
    std::ifstream f(path);
    if (!f) return reject("cannot open " + path);
    return load_map_from_json(f, estimator);
}

} // namespace map_loaders
