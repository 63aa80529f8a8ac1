#include <gtest/gtest.h>

#include <vector>

#include "wallpanel/classifier.hpp"
#include "wallpanel/config.hpp"

#include "test_helpers.hpp"

namespace wallpanel {
namespace {

using test_support::make_opening;

TEST(Classifier, DoorWithinMaxWidthIsCutout) {
    const OptimizerConfig cfg = preset_config("vertical");
    const auto co = classify_opening(test_support::door("D1", 100.0), cfg.panel, cfg.policy);
    EXPECT_TRUE(co.is_cutout());
    EXPECT_DOUBLE_EQ(co.clearance.jamb_min, 6.0);
    EXPECT_DOUBLE_EQ(co.zone.left, 94.0);
    EXPECT_DOUBLE_EQ(co.zone.right, 142.0);
}

TEST(Classifier, SpanAtMaxWidthIsStillCutout) {
    const OptimizerConfig cfg = preset_config("vertical");
    const OpeningClearance win{4.0, 6.0, 4.0};
    const auto fits = classify_opening(make_opening("W1", OpeningType::kWindow, 50.0, 30.0, 130.0, 48.0, win),
                                       cfg.panel, cfg.policy);
    EXPECT_TRUE(fits.is_cutout());

    const auto wide = classify_opening(make_opening("W2", OpeningType::kWindow, 50.0, 30.0, 131.0, 48.0, win),
                                       cfg.panel, cfg.policy);
    EXPECT_TRUE(wide.is_blocker());
}

TEST(Classifier, BlockerUsesPanelSpacingAsClearance) {
    const OptimizerConfig cfg = preset_config("vertical");
    const auto co = classify_opening(make_opening("W3", OpeningType::kWindow, 50.0, 30.0, 140.0, 48.0),
                                     cfg.panel, cfg.policy);
    ASSERT_TRUE(co.is_blocker());
    EXPECT_DOUBLE_EQ(co.clearance.jamb_min, 0.125);
    EXPECT_DOUBLE_EQ(co.clearance.header_min, 0.125);
    EXPECT_DOUBLE_EQ(co.clearance.sill_min, 0.125);
    EXPECT_DOUBLE_EQ(co.zone.left, 49.875);
    EXPECT_DOUBLE_EQ(co.zone.right, 190.125);
    EXPECT_DOUBLE_EQ(co.zone.bottom, 29.875);
    EXPECT_DOUBLE_EQ(co.zone.top, 78.125);
}

TEST(Classifier, StorefrontPolicyBothWays) {
    OptimizerConfig cfg = preset_config("vertical");
    const Opening sf =
        make_opening("S1", OpeningType::kStorefront, 60.0, 0.0, 50.0, 80.0, OpeningClearance{0.75, 0.75, 0.75});

    EXPECT_TRUE(classify_opening(sf, cfg.panel, cfg.policy).is_blocker());

    cfg.policy.storefront_always_blocks = false;
    const auto co = classify_opening(sf, cfg.panel, cfg.policy);
    EXPECT_TRUE(co.is_cutout());
    EXPECT_DOUBLE_EQ(co.clearance.jamb_min, 0.75);
    EXPECT_DOUBLE_EQ(co.zone.right, 110.75);
}

TEST(Classifier, RepeatedClassificationIsIdentical) {
    const OptimizerConfig cfg = preset_config("vertical");
    const std::vector<Opening> openings{
        test_support::door("D1", 20.0),
        make_opening("W1", OpeningType::kWindow, 80.0, 30.0, 140.0, 48.0),
        make_opening("S1", OpeningType::kStorefront, 300.0, 0.0, 60.0, 90.0, OpeningClearance{0.75, 0.75, 0.75}),
    };

    const auto first = classify_openings(openings, cfg.panel, cfg.policy);
    const auto second = classify_openings(openings, cfg.panel, cfg.policy);
    ASSERT_EQ(first.size(), openings.size());
    ASSERT_EQ(second.size(), openings.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].opening.id, openings[i].id);
        EXPECT_EQ(first[i].role, second[i].role);
        EXPECT_DOUBLE_EQ(first[i].zone.left, second[i].zone.left);
        EXPECT_DOUBLE_EQ(first[i].zone.right, second[i].zone.right);
        // Category clearance on the input is untouched.
        EXPECT_DOUBLE_EQ(first[i].opening.clearance.jamb_min, openings[i].clearance.jamb_min);
    }
    EXPECT_DOUBLE_EQ(openings[1].clearance.jamb_min, 6.0);
    EXPECT_EQ(select_role(first, OpeningRole::kBlocker).size(), 2u);
    EXPECT_EQ(select_role(first, OpeningRole::kCutout).size(), 1u);
}

}  // namespace
}  // namespace wallpanel
