#pragma once

#include <string>

#include "wallpanel/config.hpp"
#include "wallpanel/opening.hpp"
#include "wallpanel/placement_context.hpp"

namespace wallpanel::test_support {

inline LogOptions quiet_log() {
    LogOptions log;
    log.verbosity = kLogSilent;
    return log;
}

inline PlacementContext make_context(double wall_w, double wall_h, const OptimizerConfig& cfg) {
    PlacementContext ctx;
    ctx.wall_width = wall_w;
    ctx.wall_height = wall_h;
    ctx.constraints = cfg.panel;
    ctx.orientation = cfg.orientation;
    ctx.policy = cfg.policy;
    ctx.log = quiet_log();
    return ctx;
}

inline Opening make_opening(
    const std::string& id,
    OpeningType type,
    double x,
    double y,
    double w,
    double h,
    OpeningClearance clearance = {}
) {
    Opening o;
    o.id = id;
    o.type = type;
    o.x = x;
    o.y = y;
    o.w = w;
    o.h = h;
    o.clearance = clearance;
    return o;
}

inline Opening door(const std::string& id, double x, double w = 36.0, double h = 84.0) {
    return make_opening(id, OpeningType::kDoor, x, 0.0, w, h, OpeningClearance{6.0, 8.0, 6.0});
}

}  // namespace wallpanel::test_support
