#pragma once

#include "wallpanel/constraints.hpp"
#include "wallpanel/logging.hpp"

namespace wallpanel {

// Everything a placement pass needs to know about the wall being processed.
struct PlacementContext {
    double wall_width = 0.0;
    double wall_height = 0.0;
    PanelConstraints constraints;
    PanelOrientation orientation = PanelOrientation::kVertical;
    PlacementPolicy policy;
    LogOptions log;
};

}  // namespace wallpanel
