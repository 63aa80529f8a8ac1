#pragma once

#include <vector>

#include "wallpanel/classifier.hpp"
#include "wallpanel/constraints.hpp"
#include "wallpanel/logging.hpp"

namespace wallpanel {

// Vertical slice of the wall between blockers. `openings` holds the Cutout openings whose clearance
// zone intersects [x_start, x_end), sorted by opening x.
struct Region {
    double x_start = 0.0;
    double x_end = 0.0;
    double y_start = 0.0;
    double y_end = 0.0;
    std::vector<ClassifiedOpening> openings;
};

// Splits [0, wall_width] at every blocker's clearance edges. Segments narrower than min_width or
// lying inside a blocker span are dropped; blocker spans are filled separately.
std::vector<Region> split_regions(
    double wall_width,
    double wall_height,
    const std::vector<ClassifiedOpening>& openings,
    const PanelConstraints& c,
    const LogOptions& log = {}
);

}  // namespace wallpanel
