#include <map_loaders/json_loader.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>

namespace map_loaders {

namespace {

using map_placement::KindConfig;
using map_placement::PlacementConfig;

std::nullopt_t reject(const std::string& what) {
    spdlog::warn("placement config rejected: {}", what);
    return std::nullopt;
}

std::optional<map_placement::Rect> parse_rect(const nlohmann::json& j) {
    for (const char* key : { "x", "y", "width", "height" }) {
        if (!j.contains(key) || !j[key].is_number()) return std::nullopt;
    }
    return map_placement::Rect{
        j["x"].get<double>(), j["y"].get<double>(), j["width"].get<double>(), j["height"].get<double>() };
}

bool parse_kind(const nlohmann::json& j, KindConfig& kind) {
    if (!j.is_object()) return false;
    if (j.contains("radius")) {
        if (!j["radius"].is_number()) return false;
        kind.radius = j["radius"].get<double>();
    }
    if (j.contains("fallback")) {
        if (!j["fallback"].is_string()) return false;
        auto policy = map_placement::fallback_policy_from_name(j["fallback"].get<std::string>());
        if (!policy) return false;
        kind.fallback = *policy;
    }
    if (j.contains("radius_tiers")) {
        if (!j["radius_tiers"].is_array() || j["radius_tiers"].empty()) return false;
        std::vector<double> tiers;
        for (const auto& t : j["radius_tiers"]) {
            if (!t.is_number()) return false;
            tiers.push_back(t.get<double>());
        }
        kind.radius_tiers = std::move(tiers);
    }
    return true;
}

std::optional<int> parse_level_key(const std::string& key) {
    int level = 0;
    const char* first = key.data();
    const char* last = key.data() + key.size();
    const auto [ptr, ec] = std::from_chars(first, last, level);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return level;
}

std::optional<PlacementConfig> parse_config_json(const nlohmann::json& j) {
    PlacementConfig cfg = map_placement::default_placement_config();
    if (!j.is_object()) return reject("top level is not an object");

    if (j.contains("padding")) {
        if (!j["padding"].is_number()) return reject("padding is not a number");
        cfg.padding = j["padding"].get<double>();
    }
    if (j.contains("arrow_excludes_label_direction")) {
        if (!j["arrow_excludes_label_direction"].is_boolean())
            return reject("arrow_excludes_label_direction is not a boolean");
        cfg.arrow_excludes_label_direction = j["arrow_excludes_label_direction"].get<bool>();
    }
    if (j.contains("frame") && !j["frame"].is_null()) {
        auto frame = parse_rect(j["frame"]);
        if (!frame) return reject("frame needs numeric x, y, width, height");
        cfg.frame = *frame;
    }
    if (j.contains("kinds")) {
        if (!j["kinds"].is_object()) return reject("kinds is not an object");
        for (const auto& item : j["kinds"].items()) {
            const std::string& name = item.key();
            const auto kind = map_model::kind_from_name(name);
            if (!kind) return reject("unknown kind " + name);
            if (!parse_kind(item.value(), cfg.kind(*kind))) return reject("malformed settings for kind " + name);
        }
    }
    if (j.contains("pair_threshold")) {
        if (!j["pair_threshold"].is_number() || j["pair_threshold"].get<double>() < 0.0)
            return reject("pair_threshold is not a non-negative number");
        cfg.pair_threshold = j["pair_threshold"].get<double>();
    }
    if (j.contains("pair_event_tiers")) {
        const auto& tiers = j["pair_event_tiers"];
        if (!tiers.is_array() || tiers.empty()) return reject("pair_event_tiers is not a non-empty array");
        cfg.pair_event_tiers.clear();
        for (const auto& t : tiers) {
            if (!t.is_number()) return reject("pair_event_tiers holds a non-number");
            cfg.pair_event_tiers.push_back(t.get<double>());
        }
    }
    if (j.contains("level_radius")) {
        if (!j["level_radius"].is_object()) return reject("level_radius is not an object");
        for (const auto& item : j["level_radius"].items()) {
            const auto level = parse_level_key(item.key());
            if (!level || !item.value().is_number())
                return reject("malformed level_radius entry " + item.key());
            cfg.level_radius[*level] = item.value().get<double>();
        }
    }
    return cfg;
}

} // namespace

std::optional<PlacementConfig> load_placement_config_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_config_json(j);
    } catch (const nlohmann::json::exception& e) {
        return reject(e.what());
    }
}

std::optional<PlacementConfig> load_placement_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return reject("cannot open " + path);
    return load_placement_config_from_json(f);
}

} // namespace map_loaders
