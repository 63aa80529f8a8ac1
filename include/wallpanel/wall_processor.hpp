#pragma once

#include <string>
#include <vector>

#include "wallpanel/classifier.hpp"
#include "wallpanel/config.hpp"
#include "wallpanel/logging.hpp"
#include "wallpanel/opening.hpp"
#include "wallpanel/panel.hpp"

namespace wallpanel {

struct WallLayout {
    std::string wall_id;
    double width = 0.0;
    double height = 0.0;
    std::vector<Panel> panels;
    std::vector<ClassifiedOpening> openings;
};

// classify -> split into regions -> per region (sequential placement, gap fill, seam adjustment)
// -> fill above/below every blocker span. Panels are numbered P01.. in placement order.
// Never throws on well-formed input: degenerate walls and openings are logged and skipped.
WallLayout process_wall(
    const std::string& wall_id,
    double width,
    double height,
    const std::vector<Opening>& openings,
    const OptimizerConfig& cfg,
    const LogOptions& log = {}
);

}  // namespace wallpanel
