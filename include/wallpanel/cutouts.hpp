#pragma once

#include <vector>

#include "wallpanel/classifier.hpp"
#include "wallpanel/panel.hpp"

namespace wallpanel {

// Intersection of the panel with every Cutout opening's clearance zone, relative to the panel origin.
// Blockers never produce cutouts.
std::vector<Cutout> calculate_panel_cutouts(const Panel& panel, const std::vector<ClassifiedOpening>& openings);

}  // namespace wallpanel
