#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "wallpanel/classifier.hpp"
#include "wallpanel/panel.hpp"
#include "wallpanel/placement_context.hpp"
#include "wallpanel/region_splitter.hpp"

namespace wallpanel {

struct GapFillRequest {
    // Horizontal limits of the surrounding region.
    double region_x_start = 0.0;
    double region_x_end = 0.0;

    // Vertical extent of the gap.
    double y_start = 0.0;
    double y_end = 0.0;

    // Clearance span of the opening that created the gap.
    double opening_left = 0.0;
    double opening_right = 0.0;

    // Fill the whole region width instead of the opening's span (storefronts, blocker spans).
    bool full_width = false;

    const char* label = "gap";
};

// Tiles the gap row by row bottom-up, packing each row left to right without slivers. A candidate
// panel that overlaps an existing panel or a blocker's clearance zone ends the row. Cutout openings
// may be covered; their cutouts are recorded. Returns the number of panels added.
size_t fill_vertical_gap(
    const GapFillRequest& req,
    const std::vector<ClassifiedOpening>& openings,
    const PlacementContext& ctx,
    std::vector<Panel>& panels
);

// Fills below and above every Cutout opening of the region that does not span the full wall height.
size_t fill_region_gaps(
    const Region& region,
    const std::vector<ClassifiedOpening>& openings,
    const PlacementContext& ctx,
    std::vector<Panel>& panels
);

// Fills below and above each blocker across its own clearance span (excluded from every region).
size_t fill_blocker_gaps(
    const std::vector<ClassifiedOpening>& openings,
    const PlacementContext& ctx,
    std::vector<Panel>& panels
);

}  // namespace wallpanel
