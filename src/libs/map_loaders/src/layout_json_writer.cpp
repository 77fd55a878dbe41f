#include <map_loaders/json_loader.hpp>
#include <map_placement/anchor.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace map_loaders {

namespace {

nlohmann::json placement_to_json(const map_placement::Placement& p) {
    nlohmann::json j;
    j["id"] = p.element_id;
    j["kind"] = map_model::kind_name(p.kind);
    j["status"] = map_placement::status_name(p.status);
    if (!p.visible()) {
        j["reason"] = map_placement::reason_name(p.reason);
        return j;
    }
    j["x"] = p.x;
    j["y"] = p.y;
    j["rotation"] = p.rotation;
    j["box"] = { { "x", p.box.x }, { "y", p.box.y }, { "width", p.box.width }, { "height", p.box.height } };
    j["overlap_area"] = p.overlap_area;
    j["candidate_rank"] = p.candidate_rank;
    if (p.direction) j["direction"] = map_placement::compass_name(*p.direction);
    return j;
}

} // namespace

nlohmann::json layout_to_json(const map_placement::LayoutResult& result) {
    nlohmann::json j;
    j["placements"] = nlohmann::json::array();
    for (const auto& p : result.placements) j["placements"].push_back(placement_to_json(p));
    j["forced_count"] = result.forced_count;
    j["suppressed_count"] = result.suppressed_count;
    j["forced"] = result.forced_ids;
    j["suppressed"] = result.suppressed_ids;
    return j;
}

std::string layout_to_json_string(const map_placement::LayoutResult& result, int indent) {
    return layout_to_json(result).dump(indent);
}

bool write_layout_json_file(const map_placement::LayoutResult& result, const std::string& path) {
    std::ofstream f(path);
    if (!f) {
        spdlog::warn("cannot write layout to {}", path);
        return false;
    }
    f << layout_to_json_string(result) << '\n';
    return static_cast<bool>(f);
}

} // namespace map_loaders
