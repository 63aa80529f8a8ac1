#include <gtest/gtest.h>

#include "wallpanel/constraints.hpp"
#include "wallpanel/geometry.hpp"
#include "wallpanel/opening.hpp"
#include "wallpanel/panel.hpp"

#include "test_helpers.hpp"

namespace wallpanel {
namespace {

TEST(Snap, RoundsToIncrement) {
    EXPECT_DOUBLE_EQ(snap_down(119.9375, 1.0), 119.0);
    EXPECT_DOUBLE_EQ(snap_up(101.625, 1.0), 102.0);
    EXPECT_DOUBLE_EQ(snap_down(2.25, 0.5), 2.0);
    EXPECT_DOUBLE_EQ(snap_up(2.25, 0.5), 2.5);
}

TEST(Snap, ExactMultiplesAreStable) {
    EXPECT_DOUBLE_EQ(snap_down(5.0, 1.0), 5.0);
    EXPECT_DOUBLE_EQ(snap_up(5.0, 1.0), 5.0);
    EXPECT_NEAR(snap_down(0.3, 0.1), 0.3, 1e-12);
}

TEST(Snap, NonPositiveIncrementIsIdentity) {
    EXPECT_DOUBLE_EQ(snap_down(7.3, 0.0), 7.3);
    EXPECT_DOUBLE_EQ(snap_up(7.3, -1.0), 7.3);
}

TEST(Rects, TouchingIsNotOverlap) {
    const Rect a{0.0, 0.0, 10.0, 10.0};
    EXPECT_FALSE(rects_overlap(a, Rect{10.0, 0.0, 5.0, 5.0}));
    EXPECT_FALSE(rects_overlap(a, Rect{0.0, 10.0, 5.0, 5.0}));
    EXPECT_TRUE(rects_overlap(a, Rect{9.5, 9.5, 5.0, 5.0}));
    EXPECT_FALSE(rect_intersection(a, Rect{10.0, 0.0, 5.0, 5.0}).has_value());

    const auto inter = rect_intersection(a, Rect{5.0, -2.0, 10.0, 4.0});
    ASSERT_TRUE(inter.has_value());
    EXPECT_DOUBLE_EQ(inter->x, 5.0);
    EXPECT_DOUBLE_EQ(inter->y, 0.0);
    EXPECT_DOUBLE_EQ(inter->w, 5.0);
    EXPECT_DOUBLE_EQ(inter->h, 2.0);
}

TEST(ClearanceZone, ExpandsByMargins) {
    const Opening o = test_support::door("D1", 100.0);
    const ClearanceZone z = clearance_zone(o, o.clearance);
    EXPECT_DOUBLE_EQ(z.left, 94.0);
    EXPECT_DOUBLE_EQ(z.right, 142.0);
    EXPECT_DOUBLE_EQ(z.bottom, 0.0);
    EXPECT_DOUBLE_EQ(z.top, 92.0);
    EXPECT_DOUBLE_EQ(z.width(), 48.0);
}

TEST(ClearanceZone, LeftAndBottomClampButRightAndTopDoNot) {
    // Opening near the wall origin; its zone runs past a 12 in wide wall.
    const Opening o = test_support::make_opening("W1", OpeningType::kWindow, 2.0, 3.0, 10.0, 8.0, OpeningClearance{6.0, 8.0, 6.0});
    EXPECT_DOUBLE_EQ(left_clearance_zone(o, o.clearance), 0.0);
    EXPECT_DOUBLE_EQ(bottom_clearance_zone(o, o.clearance), 0.0);
    EXPECT_DOUBLE_EQ(right_clearance_zone(o, o.clearance), 18.0);
    EXPECT_DOUBLE_EQ(top_clearance_zone(o, o.clearance), 19.0);
}

TEST(PanelValidity, AspectRule) {
    const PanelConstraints c;
    EXPECT_TRUE(is_valid_panel(119.0, 108.0, c));
    EXPECT_TRUE(is_valid_panel(138.0, 300.0, c));
    EXPECT_FALSE(is_valid_panel(139.0, 300.0, c));  // both sides above short_max
    EXPECT_FALSE(is_valid_panel(23.0, 108.0, c));
    EXPECT_FALSE(is_valid_panel(60.0, 349.0, c));

    PanelConstraints wide;
    wide.max_width = 348.0;
    EXPECT_TRUE(is_valid_panel(240.0, 138.0, wide));
    EXPECT_FALSE(is_valid_panel(240.0, 139.0, wide));
}

TEST(PanelValidity, MaxWidthDependsOnHeight) {
    PanelConstraints c;
    c.max_width = 348.0;
    EXPECT_DOUBLE_EQ(max_width_for_height(108.0, c), 348.0);
    EXPECT_DOUBLE_EQ(max_width_for_height(200.0, c), 138.0);
    c.max_width = 120.0;
    EXPECT_DOUBLE_EQ(max_width_for_height(108.0, c), 120.0);
}

TEST(PanelName, ZeroPadded) {
    EXPECT_EQ(format_panel_name(1), "P01");
    EXPECT_EQ(format_panel_name(12), "P12");
    EXPECT_EQ(format_panel_name(123), "P123");
}

TEST(OpeningType, ParsesLooseLabels) {
    EXPECT_EQ(parse_opening_type("Single Door"), OpeningType::kDoor);
    EXPECT_EQ(parse_opening_type("Curtain Wall"), OpeningType::kStorefront);
    EXPECT_EQ(parse_opening_type("STOREFRONT"), OpeningType::kStorefront);
    EXPECT_EQ(parse_opening_type("Fixed Window"), OpeningType::kWindow);
    EXPECT_EQ(parse_opening_type("Louver"), OpeningType::kUnknown);
    EXPECT_STREQ(opening_type_label(OpeningType::kStorefront), "Storefront/Curtain");
}

}  // namespace
}  // namespace wallpanel
