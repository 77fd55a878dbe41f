#include <gtest/gtest.h>
#include <map_placement/geometry.hpp>
#include <map_placement/pairing.hpp>
#include <map_placement/placement_manager.hpp>

using namespace map_placement;

namespace {

map_model::Element city(const std::string& id, map_model::Point at, map_model::Size footprint = { 20, 6 },
    const std::string& group = "")
{
    map_model::Element e;
    e.id = id;
    e.anchor = map_model::PointLabel{ at, 2 };
    e.priority = 20;
    e.footprint = footprint;
    e.group = group;
    return e;
}

map_model::Element event(const std::string& id, map_model::Point at, map_model::Size footprint = { 40, 10 }) {
    map_model::Element e;
    e.id = id;
    e.anchor = map_model::EventMarker{ at };
    e.priority = 40;
    e.footprint = footprint;
    return e;
}

// City radius 1, event radius 5, one event tier, no padding.
PlacementConfig tight_config() {
    PlacementConfig cfg = default_placement_config();
    cfg.padding = 0.0;
    cfg.level_radius.clear();
    cfg.kind(map_model::ElementKind::PointLabel).radius = 1.0;
    cfg.kind(map_model::ElementKind::PointLabel).radius_tiers = { 1.0 };
    cfg.kind(map_model::ElementKind::EventMarker).radius = 5.0;
    cfg.kind(map_model::ElementKind::EventMarker).radius_tiers = { 1.0 };
    cfg.pair_event_tiers = { 1.0 };
    return cfg;
}

// A 10x10 city label with an event on the same spot. Everything below the
// anchor and the top-left corner are taken by the city's own fixtures, so
// the event has a free spot only in the top-right quadrant.
std::vector<map_model::Element> crowded_town() {
    return { city("town", { 0, 0 }, { 10, 10 }, "city:town"), event("fight", { 0, 0 }, { 10, 10 }) };
}

std::vector<Obstacle> town_fixtures() {
    return {
        Obstacle{ "below", { -30, -3, 60, 30 }, "city:town" },
        Obstacle{ "corner", { -30, -30, 28, 30 }, "city:town" },
    };
}

} // namespace

TEST(PairingTest, CityPairsWithANearbyEvent) {
    const PlacementConfig cfg = default_placement_config();
    const std::vector<map_model::Element> elements{ city("ulm", { 0, 0 }), event("battle_ulm", { 3, 0 }) };
    const auto pairs = detect_pairs(elements, cfg);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].city, 0u);
    EXPECT_EQ(pairs[0].event, 1u);
    ASSERT_FALSE(pairs[0].candidates.empty());
    for (const auto& pc : pairs[0].candidates) {
        EXPECT_FALSE(intersects(inflate(pc.city.box, cfg.padding), inflate(pc.event.box, cfg.padding)));
    }
}

TEST(PairingTest, DistantEventIsNotPaired) {
    const std::vector<map_model::Element> elements{ city("ulm", { 0, 0 }), event("battle", { 50, 0 }) };
    EXPECT_TRUE(detect_pairs(elements, default_placement_config()).empty());
}

TEST(PairingTest, ThresholdIsExclusive) {
    PlacementConfig cfg = default_placement_config();
    cfg.pair_threshold = 10.0;
    EXPECT_TRUE(detect_pairs({ city("ulm", { 0, 0 }), event("battle", { 10, 0 }) }, cfg).empty());
    EXPECT_EQ(detect_pairs({ city("ulm", { 0, 0 }), event("battle", { 9.5, 0 }) }, cfg).size(), 1u);
}

TEST(PairingTest, ZeroThresholdDisablesPairing) {
    PlacementConfig cfg = default_placement_config();
    cfg.pair_threshold = 0.0;
    EXPECT_TRUE(detect_pairs({ city("ulm", { 0, 0 }), event("battle", { 0, 0 }) }, cfg).empty());
}

TEST(PairingTest, EachCityTakesOnlyTheFirstNearbyEvent) {
    const std::vector<map_model::Element> elements{
        event("siege", { 1, 0 }),
        city("ulm", { 0, 0 }),
        event("battle", { 0, 1 }),
    };
    const auto pairs = detect_pairs(elements, default_placement_config());
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].city, 1u);
    EXPECT_EQ(pairs[0].event, 0u);
}

TEST(PairingTest, AnEventJoinsOnlyOneCity) {
    const std::vector<map_model::Element> elements{
        city("a", { 0, 0 }),
        city("b", { 2, 0 }),
        event("battle", { 1, 0 }),
    };
    const auto pairs = detect_pairs(elements, default_placement_config());
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].city, 0u);
}

TEST(PairingTest, ElementsWithAnOffsetAreNotPaired) {
    map_model::Element pinned = city("ulm", { 0, 0 });
    pinned.offset = map_model::Point{ 4, 0 };
    EXPECT_TRUE(detect_pairs({ pinned, event("battle", { 0, 0 }) }, default_placement_config()).empty());
}

TEST(PairingTest, FallbackStartsAtTheSecondCityTier) {
    PlacementConfig cfg = tight_config();
    const auto single_tier = detect_pairs(crowded_town(), cfg);
    ASSERT_EQ(single_tier.size(), 1u);
    EXPECT_EQ(single_tier[0].fallback_index, 0u);

    cfg.kind(map_model::ElementKind::PointLabel).radius_tiers = { 1.0, 2.0 };
    const auto two_tiers = detect_pairs(crowded_town(), cfg);
    ASSERT_EQ(two_tiers.size(), 1u);
    const LabelPair& pair = two_tiers[0];
    ASSERT_LT(pair.fallback_index, pair.candidates.size());
    EXPECT_EQ(pair.candidates[pair.fallback_index].city.tier, 1);
    for (std::size_t i = 0; i < pair.fallback_index; ++i)
        EXPECT_EQ(pair.candidates[i].city.tier, 0);
}

TEST(PairingTest, PairedCityMovesToMakeRoomForItsEvent) {
    const LayoutResult r = resolve_layout(crowded_town(), tight_config(), town_fixtures());

    const Placement* town = r.find("town");
    const Placement* fight = r.find("fight");
    EXPECT_EQ(town->status, PlacementStatus::Placed);
    EXPECT_EQ(*town->direction, Compass::NW);
    EXPECT_EQ(town->candidate_rank, 2);
    EXPECT_EQ(fight->status, PlacementStatus::Placed);
    EXPECT_EQ(*fight->direction, Compass::NE);
    EXPECT_EQ(fight->candidate_rank, 0);
    EXPECT_EQ(r.forced_count, 0u);
}

TEST(PairingTest, UnpairedEventIsForcedBehindItsCity) {
    PlacementConfig cfg = tight_config();
    cfg.pair_threshold = 0.0;
    const LayoutResult r = resolve_layout(crowded_town(), cfg, town_fixtures());

    EXPECT_EQ(r.find("town")->status, PlacementStatus::Placed);
    EXPECT_EQ(*r.find("town")->direction, Compass::NE);
    EXPECT_EQ(r.find("fight")->status, PlacementStatus::Forced);
}

TEST(PairingTest, BlockedPairIsForcedAtTheFallbackCombination) {
    PlacementConfig cfg = tight_config();
    cfg.kind(map_model::ElementKind::PointLabel).radius_tiers = { 1.0, 2.0 };
    const LayoutResult r = resolve_layout(crowded_town(), cfg, { Obstacle{ "sea", { -100, -100, 200, 200 }, "" } });

    const Placement* town = r.find("town");
    const Placement* fight = r.find("fight");
    EXPECT_EQ(town->status, PlacementStatus::Forced);
    EXPECT_EQ(town->candidate_rank, 8);
    EXPECT_EQ(*town->direction, Compass::NE);
    EXPECT_DOUBLE_EQ(town->overlap_area, 100.0);
    EXPECT_EQ(fight->status, PlacementStatus::Forced);
    EXPECT_EQ(fight->candidate_rank, 2);
    EXPECT_EQ(*fight->direction, Compass::NW);
    EXPECT_DOUBLE_EQ(fight->overlap_area, 100.0);
    EXPECT_FALSE(intersects(town->box, fight->box));
}

TEST(PairingTest, SuppressingEventsAreNotForcedAsAPair) {
    PlacementConfig cfg = tight_config();
    cfg.kind(map_model::ElementKind::EventMarker).fallback = FallbackPolicy::Suppress;
    const LayoutResult r = resolve_layout(crowded_town(), cfg, { Obstacle{ "sea", { -100, -100, 200, 200 }, "" } });

    EXPECT_EQ(r.find("town")->status, PlacementStatus::Forced);
    EXPECT_EQ(r.find("fight")->status, PlacementStatus::Suppressed);
    EXPECT_EQ(r.find("fight")->reason, SuppressReason::NoFreeCandidate);
}
