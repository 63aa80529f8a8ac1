#pragma once

#include <cstddef>
#include <vector>

#include "wallpanel/classifier.hpp"
#include "wallpanel/panel.hpp"
#include "wallpanel/placement_context.hpp"
#include "wallpanel/region_splitter.hpp"

namespace wallpanel {

// Door-scale openings (strictly below both policy thresholds) get their seams moved.
inline bool is_small_opening(const Opening& o, const PlacementPolicy& policy) {
    return o.w < policy.small_opening_max_width && o.h < policy.small_opening_max_height;
}

// For each small Cutout opening of the region, finds the first pair of adjacent panels (same band)
// whose seam falls strictly inside the opening's raw horizontal span and moves that seam back to the
// opening's left edge, so the right-hand panel owns the whole opening. Only panels at index
// >= first_index whose x lies inside the region are considered. Cutouts of the two adjusted panels are
// recomputed. Returns the number of seams moved (at most one per opening).
size_t adjust_seams_for_small_openings(
    const Region& region,
    const PlacementContext& ctx,
    std::vector<Panel>& panels,
    size_t first_index = 0
);

}  // namespace wallpanel
