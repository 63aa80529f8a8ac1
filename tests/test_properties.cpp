#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "wallpanel/config.hpp"
#include "wallpanel/wall_processor.hpp"

#include "test_helpers.hpp"

namespace wallpanel {
namespace {

using test_support::make_opening;

struct WallCase {
    std::string name;
    double width = 0.0;
    double height = 0.0;
    std::vector<Opening> openings;
};

std::vector<WallCase> sweep_cases() {
    const OpeningClearance win{4.0, 6.0, 4.0};
    const OpeningClearance sf{0.75, 0.75, 0.75};
    std::vector<WallCase> cases;
    for (const double width : {60.0, 130.0, 240.0, 377.5, 612.0}) {
        for (const double height : {96.0, 108.0, 144.0, 240.0}) {
            cases.push_back({"plain", width, height, {}});
            cases.push_back({"door-left", width, height, {test_support::door("D1", 8.0)}});
            if (width >= 240.0) {
                cases.push_back({"door-window", width, height, {
                    test_support::door("D1", 30.0),
                    make_opening("W1", OpeningType::kWindow, width - 90.0, 36.0, 48.0, 40.0, win),
                }});
                cases.push_back({"storefront", width, height, {
                    make_opening("S1", OpeningType::kStorefront, 40.0, 0.0, 150.0, std::min(84.0, height - 30.0), sf),
                    test_support::door("D1", width - 60.0),
                }});
                cases.push_back({"wide-window", width, height, {
                    make_opening("W1", OpeningType::kWindow, 70.0, 30.0, 150.0, 40.0, win),
                    make_opening("W2", OpeningType::kWindow, width - 40.0, 30.0, 36.0, 40.0, win),
                }});
            }
        }
    }
    return cases;
}

void expect_layout_invariants(const WallLayout& layout, const OptimizerConfig& cfg, const std::string& label) {
    const auto& panels = layout.panels;
    for (size_t i = 0; i < panels.size(); ++i) {
        const Panel& p = panels[i];
        EXPECT_TRUE(is_valid_panel(p.w, p.h, cfg.panel)) << label << " " << p.name << " " << p.w << "x" << p.h;
        EXPECT_EQ(p.name, format_panel_name(static_cast<int>(i) + 1)) << label;

        for (size_t j = i + 1; j < panels.size(); ++j) {
            EXPECT_FALSE(panels_overlap(p, panels[j])) << label << " " << p.name << " vs " << panels[j].name;
        }
        for (const auto& o : layout.openings) {
            if (o.is_blocker()) {
                EXPECT_FALSE(rects_overlap(p.rect(), o.zone.rect())) << label << " " << p.name << " in " << o.opening.id;
            }
        }
        const Rect local{0.0, 0.0, p.w, p.h};
        for (const auto& c : p.cutouts) {
            EXPECT_TRUE(rect_contains(local, Rect{c.x, c.y, c.w, c.h})) << label << " " << p.name << " cutout " << c.id;
        }
    }
}

bool same_panels(const std::vector<Panel>& a, const std::vector<Panel>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].name != b[i].name || a[i].x != b[i].x || a[i].y != b[i].y || a[i].w != b[i].w || a[i].h != b[i].h ||
            a[i].cutouts.size() != b[i].cutouts.size()) {
            return false;
        }
    }
    return true;
}

class LayoutSweep : public ::testing::TestWithParam<const char*> {};

TEST_P(LayoutSweep, InvariantsHoldAndRunsAreDeterministic) {
    const OptimizerConfig cfg = preset_config(GetParam());
    for (const auto& wc : sweep_cases()) {
        const std::string label = wc.name + " " + std::to_string(wc.width) + "x" + std::to_string(wc.height);
        const auto first = process_wall("W", wc.width, wc.height, wc.openings, cfg, test_support::quiet_log());
        const auto second = process_wall("W", wc.width, wc.height, wc.openings, cfg, test_support::quiet_log());
        expect_layout_invariants(first, cfg, label);
        EXPECT_TRUE(same_panels(first.panels, second.panels)) << label;
    }
}

INSTANTIATE_TEST_SUITE_P(Orientations, LayoutSweep, ::testing::Values("vertical", "horizontal"));

TEST(PlainWallCoverage, LastPanelReachesWallEnd) {
    const OptimizerConfig cfg = preset_config("vertical");
    const auto layout = process_wall("W", 377.5, 108.0, {}, cfg, test_support::quiet_log());
    ASSERT_FALSE(layout.panels.empty());
    EXPECT_DOUBLE_EQ(layout.panels.front().x, 0.0);
    EXPECT_GT(layout.panels.back().right(), 377.5 - cfg.panel.min_width);
}

}  // namespace
}  // namespace wallpanel
