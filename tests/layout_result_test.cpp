#include <gtest/gtest.h>
#include <map_placement/layout_result.hpp>

using namespace map_placement;

namespace {

Placement make(const std::string& id, PlacementStatus status, Rect box = {}, const std::string& group = "") {
    Placement p;
    p.element_id = id;
    p.status = status;
    p.box = box;
    p.group = group;
    if (status != PlacementStatus::Suppressed) {
        p.candidate_rank = 0;
        p.direction = Compass::NE;
    } else {
        p.reason = SuppressReason::NoFreeCandidate;
    }
    return p;
}

} // namespace

TEST(LayoutResultTest, StatusAndReasonNames) {
    EXPECT_STREQ(status_name(PlacementStatus::Placed), "placed");
    EXPECT_STREQ(status_name(PlacementStatus::Forced), "forced");
    EXPECT_STREQ(status_name(PlacementStatus::Suppressed), "suppressed");
    EXPECT_STREQ(reason_name(SuppressReason::None), "none");
    EXPECT_STREQ(reason_name(SuppressReason::NoFreeCandidate), "no_free_candidate");
    EXPECT_STREQ(reason_name(SuppressReason::NoCandidates), "no_candidates");
    EXPECT_STREQ(reason_name(SuppressReason::OutsideFrame), "outside_frame");
}

TEST(LayoutResultTest, FindByElementId) {
    LayoutResult r;
    r.placements = { make("a", PlacementStatus::Placed), make("b", PlacementStatus::Suppressed) };
    r.suppressed_count = 1;
    ASSERT_NE(r.find("b"), nullptr);
    EXPECT_FALSE(r.find("b")->visible());
    EXPECT_TRUE(r.find("a")->visible());
    EXPECT_EQ(r.find("missing"), nullptr);
    EXPECT_EQ(r.placed_count(), 1u);
}

TEST(LayoutResultTest, FixedObstaclesKeepOnlyPlacedBoxes) {
    LayoutResult r;
    r.placements = {
        make("a", PlacementStatus::Placed, { 0, 0, 10, 5 }, "city:a"),
        make("b", PlacementStatus::Forced, { 20, 0, 10, 5 }),
        make("c", PlacementStatus::Suppressed),
        make("d", PlacementStatus::Placed, { 40, 0, 10, 5 }),
    };
    const auto fixed = fixed_obstacles(r);
    ASSERT_EQ(fixed.size(), 2u);
    EXPECT_EQ(fixed[0].id, "a");
    EXPECT_EQ(fixed[0].box, (Rect{ 0, 0, 10, 5 }));
    EXPECT_EQ(fixed[0].group, "city:a");
    EXPECT_EQ(fixed[1].id, "d");
}

TEST(LayoutResultTest, EqualityComparesEveryField) {
    const Placement a = make("a", PlacementStatus::Placed, { 0, 0, 10, 5 });
    Placement b = a;
    EXPECT_TRUE(a == b);
    b.direction = Compass::E;
    EXPECT_FALSE(a == b);
    b = a;
    b.overlap_area = 0.5;
    EXPECT_FALSE(a == b);

    LayoutResult x;
    x.placements = { a };
    LayoutResult y = x;
    EXPECT_TRUE(x == y);
    y.forced_ids.push_back("a");
    EXPECT_FALSE(x == y);
}
