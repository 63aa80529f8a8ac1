#include "wallpanel/wall_processor.hpp"

#include "wallpanel/gap_filler.hpp"
#include "wallpanel/placement_context.hpp"
#include "wallpanel/region_splitter.hpp"
#include "wallpanel/seam_adjuster.hpp"
#include "wallpanel/sequential_placer.hpp"

namespace wallpanel {

WallLayout process_wall(
    const std::string& wall_id,
    double width,
    double height,
    const std::vector<Opening>& openings,
    const OptimizerConfig& cfg,
    const LogOptions& log
) {
    WallLayout out;
    out.wall_id = wall_id;
    out.width = width;
    out.height = height;

    if (!(width > 0.0) || !(height > 0.0)) {
        log_warn(log, "wall ", wall_id, " has non-positive size ", width, "x", height, "; skipped");
        return out;
    }

    std::vector<Opening> usable;
    usable.reserve(openings.size());
    for (const auto& o : openings) {
        if (!(o.w > 0.0) || !(o.h > 0.0)) {
            log_warn(log, "opening ", o.id, " has non-positive size ", o.w, "x", o.h, "; discarded");
            continue;
        }
        usable.push_back(o);
    }

    PlacementContext ctx;
    ctx.wall_width = width;
    ctx.wall_height = height;
    ctx.constraints = cfg.panel;
    ctx.orientation = cfg.orientation;
    ctx.policy = cfg.policy;
    ctx.log = log;

    out.openings = classify_openings(usable, cfg.panel, cfg.policy);
    for (const auto& o : out.openings) {
        log_trace(log, "opening ", o.opening.id, " (", opening_type_label(o.opening.type), ") -> ",
                  o.is_blocker() ? "blocker" : "cutout", " zone [", o.zone.left, ", ", o.zone.right, "]");
    }

    const auto regions = split_regions(width, height, out.openings, cfg.panel, log);
    for (const auto& region : regions) {
        const size_t first = out.panels.size();
        place_region_sequential(region, ctx, out.panels);
        fill_region_gaps(region, out.openings, ctx, out.panels);
        adjust_seams_for_small_openings(region, ctx, out.panels, first);
    }
    fill_blocker_gaps(out.openings, ctx, out.panels);

    log_trace(log, "wall ", wall_id, ": ", out.panels.size(), " panels");
    return out;
}

}  // namespace wallpanel
