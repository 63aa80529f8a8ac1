#pragma once

#include <cstddef>
#include <vector>

#include "wallpanel/panel.hpp"
#include "wallpanel/placement_context.hpp"
#include "wallpanel/region_splitter.hpp"

namespace wallpanel {

struct Band {
    double y_start = 0.0;
    double y_end = 0.0;

    double height() const { return y_end - y_start; }
};

// Horizontal orientation: strips of snap_down(min(remaining, short_max)) stacked bottom-up.
// Vertical orientation: one band spanning the full region height.
std::vector<Band> compute_bands(const Region& region, const PlacementContext& ctx);

// Width of the next panel on the way from start_x to target_x, chosen so that the run splits into
// N equal panels instead of leaving an unusable sliver at the end. The panel-count search is capped
// at 100; if nothing fits, max_w is returned.
double calculate_segment_layout(
    double start_x,
    double target_x,
    double max_w,
    double min_w,
    double increment,
    double spacing
);

// Greedy left-to-right placement over every band of the region. Appends to `panels` (names continue
// the wall-wide numbering) and returns how many panels were added.
size_t place_region_sequential(const Region& region, const PlacementContext& ctx, std::vector<Panel>& panels);

}  // namespace wallpanel
