#include "wallpanel/gap_filler.hpp"

#include <algorithm>
#include <utility>

#include "wallpanel/cutouts.hpp"
#include "wallpanel/sequential_placer.hpp"

namespace wallpanel {
namespace {

bool overlaps_any_panel(const Panel& cand, const std::vector<Panel>& panels) {
    return std::any_of(panels.begin(), panels.end(), [&](const Panel& p) { return panels_overlap(cand, p); });
}

const ClassifiedOpening* intruded_blocker(const Panel& cand, const std::vector<ClassifiedOpening>& openings) {
    for (const auto& o : openings) {
        if (o.is_blocker() && rects_overlap(cand.rect(), o.zone.rect())) {
            return &o;
        }
    }
    return nullptr;
}

// Column width for one row: same no-sliver policy as the sequential placer.
double column_width(double remaining, double max_w, const PanelConstraints& c) {
    double w = calculate_segment_layout(0.0, remaining, max_w, c.min_width, c.dimension_increment, c.panel_spacing);
    const double leftover = remaining - w;
    if (leftover > 0.0 && leftover < c.min_width + c.panel_spacing) {
        const double whole = snap_down(remaining, c.dimension_increment);
        if (whole <= max_w) {
            w = whole;
        }
    }
    return w;
}

}  // namespace

size_t fill_vertical_gap(
    const GapFillRequest& req,
    const std::vector<ClassifiedOpening>& openings,
    const PlacementContext& ctx,
    std::vector<Panel>& panels
) {
    const auto& c = ctx.constraints;
    const double spacing = c.panel_spacing;

    // Inset by spacing so the fill keeps a seam against its neighbours.
    double x0 = 0.0;
    double x1 = 0.0;
    if (req.full_width) {
        x0 = req.region_x_start + spacing;
        x1 = req.region_x_end - spacing;
    } else {
        x0 = std::max(req.opening_left + spacing, req.region_x_start);
        x1 = std::min(req.opening_right - spacing, req.region_x_end);
    }

    if (x1 - x0 < c.min_width || req.y_end - req.y_start < c.min_height) {
        return 0;
    }
    log_trace(ctx.log, "[FILL] gap ", req.label, ": ", x1 - x0, "W x ", req.y_end - req.y_start, "H at (", x0,
              ", ", req.y_start, ")");

    size_t added = 0;
    double y = req.y_start;
    while (y < req.y_end) {
        const double remaining_h = req.y_end - y;
        if (remaining_h < c.min_height) {
            break;
        }
        const double row_h = snap_down(std::min(remaining_h, c.max_height), c.dimension_increment);
        if (row_h < c.min_height) {
            break;
        }
        const double max_w = max_width_for_height(row_h, c);

        bool row_placed = false;
        double x = x0;
        while (x < x1) {
            const double remaining_w = x1 - x;
            if (remaining_w < c.min_width) {
                break;
            }
            const double w = column_width(remaining_w, max_w, c);
            if (!is_valid_panel(w, row_h, c)) {
                break;
            }

            Panel cand;
            cand.name = format_panel_name(static_cast<int>(panels.size()) + 1);
            cand.x = x;
            cand.y = y;
            cand.w = w;
            cand.h = row_h;

            if (overlaps_any_panel(cand, panels)) {
                log_trace(ctx.log, "  overlap at (", x, ", ", y, "), stopping row");
                break;
            }
            if (const auto* b = intruded_blocker(cand, openings)) {
                log_trace(ctx.log, "  clearance of blocker ", b->opening.id, " at (", x, ", ", y, "), stopping row");
                break;
            }

            cand.cutouts = calculate_panel_cutouts(cand, openings);
            log_trace(ctx.log, "  fill-", req.label, ": ", cand.name, " ", w, "x", row_h, " at (", x, ", ", y, ")");
            panels.push_back(std::move(cand));
            ++added;
            row_placed = true;
            x += w + spacing;
        }

        if (!row_placed) {
            break;
        }
        y += row_h + spacing;
    }
    return added;
}

size_t fill_region_gaps(
    const Region& region,
    const std::vector<ClassifiedOpening>& openings,
    const PlacementContext& ctx,
    std::vector<Panel>& panels
) {
    const auto& c = ctx.constraints;
    size_t added = 0;
    for (const auto& o : region.openings) {
        if (!o.is_cutout()) {
            continue;
        }
        const bool storefront = is_storefront_like(o.opening.type);
        if (!storefront && o.zone.bottom <= region.y_start && o.zone.top >= region.y_end) {
            continue;
        }

        GapFillRequest req;
        req.region_x_start = region.x_start;
        req.region_x_end = region.x_end;
        req.opening_left = o.zone.left;
        req.opening_right = o.zone.right;
        req.full_width = storefront;

        if (o.zone.bottom > region.y_start && o.zone.bottom - region.y_start >= c.min_height) {
            req.y_start = region.y_start;
            req.y_end = o.zone.bottom;
            req.label = "below";
            added += fill_vertical_gap(req, openings, ctx, panels);
        }
        if (o.zone.top < region.y_end && region.y_end - o.zone.top >= c.min_height) {
            req.y_start = o.zone.top;
            req.y_end = region.y_end;
            req.label = "above";
            added += fill_vertical_gap(req, openings, ctx, panels);
        }
    }
    if (added > 0) {
        log_trace(ctx.log, "gap filling (region ", region.x_start, "..", region.x_end, "): added ", added);
    }
    return added;
}

size_t fill_blocker_gaps(
    const std::vector<ClassifiedOpening>& openings,
    const PlacementContext& ctx,
    std::vector<Panel>& panels
) {
    const auto& c = ctx.constraints;
    size_t added = 0;
    for (const auto& o : openings) {
        if (!o.is_blocker()) {
            continue;
        }

        GapFillRequest req;
        req.region_x_start = std::clamp(o.zone.left, 0.0, ctx.wall_width);
        req.region_x_end = std::clamp(o.zone.right, 0.0, ctx.wall_width);
        req.opening_left = o.zone.left;
        req.opening_right = o.zone.right;
        req.full_width = true;

        if (o.zone.bottom >= c.min_height) {
            req.y_start = 0.0;
            req.y_end = o.zone.bottom;
            req.label = "below-blocker";
            added += fill_vertical_gap(req, openings, ctx, panels);
        }
        if (o.zone.top < ctx.wall_height && ctx.wall_height - o.zone.top >= c.min_height) {
            req.y_start = o.zone.top;
            req.y_end = ctx.wall_height;
            req.label = "above-blocker";
            added += fill_vertical_gap(req, openings, ctx, panels);
        }
    }
    if (added > 0) {
        log_trace(ctx.log, "gap filling (blocker spans): added ", added);
    }
    return added;
}

}  // namespace wallpanel
