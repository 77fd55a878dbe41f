#include <gtest/gtest.h>
#include <map_loaders/debug_map.hpp>
#include <map_loaders/json_loader.hpp>
#include <map_placement/placement_manager.hpp>
#include <algorithm>
#include <set>
#include <sstream>

using namespace map_loaders;

namespace {

std::optional<map_model::MapScene> load_scene(const std::string& text) {
    std::istringstream in(text);
    return load_map_from_json(in, map_placement::HeuristicFootprintEstimator{});
}

std::optional<map_placement::PlacementConfig> load_config(const std::string& text) {
    std::istringstream in(text);
    return load_placement_config_from_json(in);
}

} // namespace

TEST(JsonLoaderTest, LoadsElementsFixturesAndCampaigns) {
    const auto scene = load_scene(R"({
        "name": "test", "canvas_width": 400, "canvas_height": 300,
        "elements": [
            {"id": "ulm", "kind": "point_label", "anchor": [100, 120], "text": "Ulm", "group": "city:ulm"},
            {"id": "danube", "kind": "path_label", "path": [[0, 0], [50, 10]], "text": "Danube", "width": 30, "height": 5},
            {"id": "head", "kind": "arrow_endpoint", "anchor": [100, 120], "label_id": "ulm", "priority": 3}
        ],
        "fixtures": [{"id": "dot:ulm", "center": [100, 120], "size": [4, 4], "group": "city:ulm"}],
        "campaigns": [{"id": "march", "points": [[0, 0], [100, 120]]}]
    })");
    ASSERT_TRUE(scene.has_value());
    EXPECT_EQ(scene->name, "test");
    EXPECT_DOUBLE_EQ(scene->canvas_width, 400.0);
    ASSERT_EQ(scene->elements.size(), 3u);

    const auto& ulm = scene->elements[0];
    EXPECT_EQ(map_model::kind_of(ulm), map_model::ElementKind::PointLabel);
    EXPECT_EQ(std::get<map_model::PointLabel>(ulm.anchor).level, 2);
    EXPECT_EQ(ulm.priority, 20);
    EXPECT_EQ(ulm.group, "city:ulm");
    EXPECT_NEAR(ulm.footprint.width, 16.2, 1e-9);
    EXPECT_NEAR(ulm.footprint.height, 10.8, 1e-9);

    const auto& danube = scene->elements[1];
    EXPECT_EQ(std::get<map_model::PathLabel>(danube.anchor).path.size(), 2u);
    EXPECT_EQ(danube.priority, 60);
    EXPECT_DOUBLE_EQ(danube.footprint.width, 30.0);
    EXPECT_DOUBLE_EQ(danube.footprint.height, 5.0);

    const auto& head = scene->elements[2];
    EXPECT_EQ(std::get<map_model::ArrowEndpoint>(head.anchor).label_id, "ulm");
    EXPECT_EQ(head.priority, 3);
    EXPECT_DOUBLE_EQ(head.footprint.width, 5.5);
    EXPECT_DOUBLE_EQ(head.footprint.height, 5.5);

    ASSERT_EQ(scene->fixtures.size(), 1u);
    EXPECT_EQ(scene->fixtures[0].group, "city:ulm");
    ASSERT_EQ(scene->campaigns.size(), 1u);
    EXPECT_EQ(scene->campaigns[0].style, "invasion");
}

TEST(JsonLoaderTest, EventSubtextIsStackedUnderTheText) {
    const auto scene = load_scene(R"({"elements": [
        {"id": "b", "kind": "event_marker", "anchor": [0, 0], "text": "Battle", "subtext": "1805"}
    ]})");
    ASSERT_TRUE(scene.has_value());
    const auto& e = scene->elements[0];
    EXPECT_EQ(e.priority, 40);
    EXPECT_NEAR(e.footprint.width, 32.4, 1e-9);
    EXPECT_NEAR(e.footprint.height, 21.2, 1e-9);
}

TEST(JsonLoaderTest, OffsetAndRotationAreRead) {
    const auto scene = load_scene(R"({"elements": [
        {"id": "c", "kind": "point_label", "anchor": [10, 10], "text": "X", "offset": [5, -2], "rotation": 30, "level": 1}
    ]})");
    ASSERT_TRUE(scene.has_value());
    const auto& e = scene->elements[0];
    ASSERT_TRUE(e.offset.has_value());
    EXPECT_DOUBLE_EQ(e.offset->x, 5.0);
    EXPECT_DOUBLE_EQ(e.offset->y, -2.0);
    ASSERT_TRUE(e.rotation.has_value());
    EXPECT_DOUBLE_EQ(*e.rotation, 30.0);
    EXPECT_EQ(e.priority, 0);
    EXPECT_NEAR(e.footprint.height, 12.0, 1e-9);
}

TEST(JsonLoaderTest, MalformedScenesAreRejected) {
    EXPECT_FALSE(load_scene("{ not json").has_value());
    EXPECT_FALSE(load_scene(R"({"fixtures": []})").has_value());
    EXPECT_FALSE(load_scene(R"({"elements": [{"id": "x", "kind": "castle", "anchor": [0, 0]}]})").has_value());
    EXPECT_FALSE(load_scene(R"({"elements": [{"kind": "point_label", "anchor": [0, 0]}]})").has_value());
    EXPECT_FALSE(load_scene(R"({"elements": [{"id": "x", "kind": "point_label"}]})").has_value());
    EXPECT_FALSE(load_scene(R"({"elements": [{"id": "x", "kind": "path_label", "anchor": [0, 0]}]})").has_value());
    EXPECT_FALSE(load_scene(R"({"elements": [{"id": "x", "kind": "point_label", "anchor": [0, 0], "level": "big"}]})").has_value());
    EXPECT_FALSE(load_scene(R"({"elements": [], "fixtures": {}})").has_value());
}

TEST(JsonLoaderTest, UnusableFootprintsAreRejected) {
    EXPECT_FALSE(load_scene(R"({"elements": [
        {"id": "x", "kind": "point_label", "anchor": [0, 0], "width": -5, "height": 4}]})").has_value());
    EXPECT_FALSE(load_scene(R"({"elements": [
        {"id": "x", "kind": "point_label", "anchor": [0, 0], "width": 0, "height": 4}]})").has_value());
    EXPECT_FALSE(load_scene(R"({"elements": [
        {"id": "x", "kind": "point_label", "anchor": [0, 0], "width": 8, "height": 0}]})").has_value());
    EXPECT_FALSE(load_scene(R"({"elements": [
        {"id": "x", "kind": "point_label", "anchor": [0, 0], "text": ""}]})").has_value());
    EXPECT_FALSE(load_scene(R"({"elements": [
        {"id": "x", "kind": "event_marker", "anchor": [0, 0], "font_size": 0, "text": "Battle"}]})").has_value());
    EXPECT_TRUE(load_scene(R"({"elements": [
        {"id": "x", "kind": "point_label", "anchor": [0, 0], "text": "", "width": 8, "height": 4}]})").has_value());
}

TEST(JsonLoaderTest, DuplicateIdsAreRejected) {
    EXPECT_FALSE(load_scene(R"({"elements": [
        {"id": "ulm", "kind": "point_label", "anchor": [0, 0], "text": "Ulm"},
        {"id": "ulm", "kind": "event_marker", "anchor": [0, 0], "text": "Battle of Ulm"}
    ]})").has_value());
}

TEST(JsonLoaderTest, RegionRoleSetsPriorityAndFont) {
    const auto scene = load_scene(R"({"elements": [
        {"id": "bavaria", "kind": "path_label", "role": "region", "path": [[0, 0], [100, 0]], "text": "BAVARIA"},
        {"id": "danube", "kind": "path_label", "path": [[0, 0], [100, 0]], "text": "Danube"}
    ]})");
    ASSERT_TRUE(scene.has_value());
    const auto& bavaria = scene->elements[0];
    EXPECT_EQ(std::get<map_model::PathLabel>(bavaria.anchor).role, map_model::PathRole::Region);
    EXPECT_EQ(bavaria.priority, 70);
    EXPECT_NEAR(bavaria.footprint.width, 84.0, 1e-9);
    EXPECT_NEAR(bavaria.footprint.height, 24.0, 1e-9);

    const auto& danube = scene->elements[1];
    EXPECT_EQ(std::get<map_model::PathLabel>(danube.anchor).role, map_model::PathRole::River);
    EXPECT_EQ(danube.priority, 60);
}

TEST(JsonLoaderTest, InvalidRolesAreRejected) {
    EXPECT_FALSE(load_scene(R"({"elements": [
        {"id": "x", "kind": "path_label", "role": "lake", "path": [[0, 0], [9, 0]], "text": "Lake"}]})").has_value());
    EXPECT_FALSE(load_scene(R"({"elements": [
        {"id": "x", "kind": "point_label", "role": "region", "anchor": [0, 0], "text": "Ulm"}]})").has_value());
}

TEST(JsonLoaderTest, MissingFileIsRejected) {
    EXPECT_FALSE(load_map_from_json_file("/nonexistent/scene.json", map_placement::HeuristicFootprintEstimator{}).has_value());
    EXPECT_FALSE(load_placement_config_from_json_file("/nonexistent/config.json").has_value());
}

TEST(JsonLoaderTest, ConfigKeepsDefaultsForMissingKeys) {
    const auto cfg = load_config(R"({"padding": 2.5, "kinds": {"event_marker": {"fallback": "suppress"}}})");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_DOUBLE_EQ(cfg->padding, 2.5);
    EXPECT_TRUE(cfg->arrow_excludes_label_direction);
    EXPECT_FALSE(cfg->frame.has_value());

    const auto& event = cfg->kind(map_model::ElementKind::EventMarker);
    EXPECT_EQ(event.fallback, map_placement::FallbackPolicy::Suppress);
    EXPECT_DOUBLE_EQ(event.radius, 12.0);
    EXPECT_EQ(cfg->kind(map_model::ElementKind::PathLabel).fallback, map_placement::FallbackPolicy::Suppress);
    EXPECT_EQ(cfg->level_radius.at(1), 8.0);
}

TEST(JsonLoaderTest, ConfigReadsFrameTiersAndLevels) {
    const auto cfg = load_config(R"({
        "frame": {"x": 0, "y": 0, "width": 100, "height": 50},
        "arrow_excludes_label_direction": false,
        "kinds": {"point_label": {"radius": 3, "radius_tiers": [1, 2]}},
        "level_radius": {"1": 10, "5": 2}
    })");
    ASSERT_TRUE(cfg.has_value());
    ASSERT_TRUE(cfg->frame.has_value());
    EXPECT_EQ(*cfg->frame, (map_placement::Rect{ 0, 0, 100, 50 }));
    EXPECT_FALSE(cfg->arrow_excludes_label_direction);
    const auto& point = cfg->kind(map_model::ElementKind::PointLabel);
    EXPECT_DOUBLE_EQ(point.radius, 3.0);
    EXPECT_EQ(point.radius_tiers, (std::vector<double>{ 1.0, 2.0 }));
    EXPECT_DOUBLE_EQ(cfg->level_radius.at(1), 10.0);
    EXPECT_DOUBLE_EQ(cfg->level_radius.at(2), 6.0);
    EXPECT_DOUBLE_EQ(cfg->level_radius.at(5), 2.0);
}

TEST(JsonLoaderTest, ConfigReadsPairingSettings) {
    const auto defaults = load_config("{}");
    ASSERT_TRUE(defaults.has_value());
    EXPECT_DOUBLE_EQ(defaults->pair_threshold, 10.0);
    EXPECT_EQ(defaults->pair_event_tiers, (std::vector<double>{ 1.0, 1.3, 1.6 }));

    const auto cfg = load_config(R"({"pair_threshold": 0, "pair_event_tiers": [1, 2]})");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_DOUBLE_EQ(cfg->pair_threshold, 0.0);
    EXPECT_EQ(cfg->pair_event_tiers, (std::vector<double>{ 1.0, 2.0 }));

    EXPECT_FALSE(load_config(R"({"pair_threshold": -1})").has_value());
    EXPECT_FALSE(load_config(R"({"pair_threshold": "near"})").has_value());
    EXPECT_FALSE(load_config(R"({"pair_event_tiers": []})").has_value());
    EXPECT_FALSE(load_config(R"({"pair_event_tiers": [1, "far"]})").has_value());
}

TEST(JsonLoaderTest, MalformedConfigsAreRejected) {
    EXPECT_FALSE(load_config(R"({"padding": "wide"})").has_value());
    EXPECT_FALSE(load_config(R"({"kinds": {"point_label": {"fallback": "hide"}}})").has_value());
    EXPECT_FALSE(load_config(R"({"kinds": {"castle": {}}})").has_value());
    EXPECT_FALSE(load_config(R"({"kinds": {"point_label": {"radius_tiers": []}}})").has_value());
    EXPECT_FALSE(load_config(R"({"level_radius": {"two": 6}})").has_value());
    EXPECT_FALSE(load_config(R"({"frame": {"x": 0}})").has_value());
    EXPECT_TRUE(load_config(R"({"frame": null})").has_value());
}

TEST(JsonLoaderTest, LayoutJsonListsStatusPerElement) {
    const auto scene = load_scene(R"({"elements": [
        {"id": "a", "kind": "point_label", "anchor": [0, 0], "width": 20, "height": 6},
        {"id": "p", "kind": "path_label", "path": [[5, 5]], "width": 20, "height": 4}
    ]})");
    ASSERT_TRUE(scene.has_value());
    const auto result = map_placement::resolve_layout(scene->elements);
    const nlohmann::json j = layout_to_json(result);

    ASSERT_EQ(j["placements"].size(), 2u);
    EXPECT_EQ(j["placements"][0]["id"], "a");
    EXPECT_EQ(j["placements"][0]["status"], "placed");
    EXPECT_EQ(j["placements"][0]["direction"], "NE");
    EXPECT_EQ(j["placements"][0]["candidate_rank"], 0);
    EXPECT_TRUE(j["placements"][0].contains("box"));
    EXPECT_EQ(j["placements"][1]["status"], "suppressed");
    EXPECT_EQ(j["placements"][1]["reason"], "no_candidates");
    EXPECT_FALSE(j["placements"][1].contains("box"));
    EXPECT_EQ(j["suppressed_count"], 1);
    EXPECT_EQ(j["suppressed"], nlohmann::json::array({ "p" }));
}

TEST(JsonLoaderTest, BundledDataFilesLoad) {
    const std::string dir = MAP_DECLUTTER_DATA_DIR;
    const auto scene = load_map_from_json_file(dir + "/example_map.json", map_placement::HeuristicFootprintEstimator{});
    ASSERT_TRUE(scene.has_value());
    EXPECT_EQ(scene->elements.size(), 15u);
    EXPECT_EQ(scene->fixtures.size(), 7u);

    const auto cfg = load_placement_config_from_json_file(dir + "/placement_config.json");
    ASSERT_TRUE(cfg.has_value());
    ASSERT_TRUE(cfg->frame.has_value());
    EXPECT_EQ(cfg->kind(map_model::ElementKind::PointLabel).radius_tiers.size(), 3u);

    const auto result = map_placement::resolve_layout(scene->elements, *cfg,
        map_placement::obstacles_from_fixtures(scene->fixtures));
    EXPECT_EQ(result.placements.size(), scene->elements.size());
}

TEST(JsonLoaderTest, DebugMapHasUniqueIds) {
    const auto scene = generate_debug_map(map_placement::HeuristicFootprintEstimator{});
    std::set<std::string> ids;
    for (const auto& e : scene.elements) {
        EXPECT_TRUE(ids.insert(e.id).second) << e.id;
        EXPECT_GT(e.footprint.width, 0.0) << e.id;
    }
    EXPECT_FALSE(scene.fixtures.empty());
    EXPECT_EQ(scene.campaigns.size(), 2u);
}

TEST(JsonLoaderTest, RegionsAreMarkedByRoleNotPriority) {
    const auto scene = generate_debug_map(map_placement::HeuristicFootprintEstimator{});
    std::set<std::string> regions;
    for (const auto& e : scene.elements) {
        const auto* path = std::get_if<map_model::PathLabel>(&e.anchor);
        if (path && path->role == map_model::PathRole::Region) regions.insert(e.id);
    }
    EXPECT_EQ(regions, (std::set<std::string>{ "bavaria" }));

    const std::string dir = MAP_DECLUTTER_DATA_DIR;
    const auto bundled = load_map_from_json_file(dir + "/example_map.json", map_placement::HeuristicFootprintEstimator{});
    ASSERT_TRUE(bundled.has_value());
    const auto it = std::find_if(bundled->elements.begin(), bundled->elements.end(),
        [](const map_model::Element& e) { return e.id == "bavaria"; });
    ASSERT_NE(it, bundled->elements.end());
    EXPECT_EQ(std::get<map_model::PathLabel>(it->anchor).role, map_model::PathRole::Region);
    EXPECT_EQ(it->priority, 70);
}
