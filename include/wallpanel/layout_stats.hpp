#pragma once

#include <vector>

#include "wallpanel/wall_processor.hpp"

namespace wallpanel {

struct LayoutStats {
    int panel_count = 0;
    int cutout_count = 0;
    double panel_area = 0.0;  // gross panel area, cutouts not subtracted
    double wall_area = 0.0;

    // panel_area / wall_area; 0 for an empty wall.
    double coverage() const { return wall_area > 0.0 ? panel_area / wall_area : 0.0; }
};

LayoutStats layout_stats(const WallLayout& layout);

// Sums counts and areas over several walls.
LayoutStats total_stats(const std::vector<WallLayout>& layouts);

}  // namespace wallpanel
