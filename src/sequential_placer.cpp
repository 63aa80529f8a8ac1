#include "wallpanel/sequential_placer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "wallpanel/cutouts.hpp"

namespace wallpanel {
namespace {

// An opening counts as "ahead" only if its zone starts past the cursor by more than this.
constexpr double kAheadTol = 0.01;
// A seam lands inside a clearance zone only if it is deeper than this from either jamb.
constexpr double kSeamTol = 0.1;
// Cursor within this distance of (stop + spacing) means the panel ended at the opening.
constexpr double kHopTol = 1.0;
constexpr int kMaxSegmentPanels = 100;

bool crosses_band(const ClassifiedOpening& o, const Band& band) {
    return !(o.zone.top <= band.y_start || o.zone.bottom >= band.y_end);
}

const ClassifiedOpening* next_opening_ahead(const Region& region, const Band& band, double cursor) {
    const ClassifiedOpening* best = nullptr;
    for (const auto& o : region.openings) {
        if (!o.is_cutout() || o.zone.left <= cursor + kAheadTol || !crosses_band(o, band)) {
            continue;
        }
        if (best == nullptr || o.zone.left < best->zone.left) {
            best = &o;
        }
    }
    return best;
}

// Moves a seam that would land inside a clearance zone: back to the left jamb if that still leaves
// a valid width, else forward past the right jamb, else clamps to the band maximum.
double validate_seam(
    double cursor,
    double width,
    const Region& region,
    const Band& band,
    double max_w,
    const PlacementContext& ctx
) {
    const auto& c = ctx.constraints;
    const double seam = cursor + width;
    for (const auto& o : region.openings) {
        if (!crosses_band(o, band)) {
            continue;
        }
        if (!(o.zone.left + kSeamTol < seam && seam < o.zone.right - kSeamTol)) {
            continue;
        }
        log_trace(ctx.log, "[SEAM-FIX] seam at ", seam, " lands inside opening ", o.opening.id);

        const double to_left_jamb = o.zone.left - cursor;
        if (to_left_jamb >= c.min_width) {
            return snap_down(to_left_jamb, c.dimension_increment);
        }
        const double to_clear = snap_up(o.zone.right - cursor, c.dimension_increment);
        if (to_clear <= max_w) {
            log_trace(ctx.log, "  -> extending to right jamb (", to_clear, ")");
            return to_clear;
        }
        log_warn(ctx.log, "cannot clear opening ", o.opening.id, " (need ", to_clear, ", max ", max_w,
                 "); clamping to max width");
        return snap_down(max_w, c.dimension_increment);
    }
    return width;
}

void append_panel(
    std::vector<Panel>& panels,
    double x,
    double y,
    double w,
    double h,
    const std::vector<ClassifiedOpening>& openings
) {
    Panel p;
    p.name = format_panel_name(static_cast<int>(panels.size()) + 1);
    p.x = x;
    p.y = y;
    p.w = w;
    p.h = h;
    p.cutouts = calculate_panel_cutouts(p, openings);
    panels.push_back(std::move(p));
}

size_t place_band(const Region& region, const Band& band, const PlacementContext& ctx, std::vector<Panel>& panels) {
    const auto& c = ctx.constraints;
    const double inc = c.dimension_increment;
    const double spacing = c.panel_spacing;
    const double band_h = band.height();
    const double max_w = max_width_for_height(band_h, c);

    size_t added = 0;
    double cursor = std::max(0.0, region.x_start);

    while (cursor < region.x_end) {
        const double remaining = region.x_end - cursor;
        if (remaining < c.min_width) {
            break;
        }

        const ClassifiedOpening* next = next_opening_ahead(region, band, cursor);
        double stop = region.x_end;
        bool stop_is_opening = false;

        if (next != nullptr) {
            const double bridge_end = std::min(next->zone.right, region.x_end);
            const double bridge_dist = bridge_end - cursor;
            if (bridge_dist <= max_w) {
                // A bridge shorter than min_width is not placed; the stop/jump path below handles it.
                const double w = snap_down(bridge_dist, inc);
                if (w >= c.min_width && is_valid_panel(w, band_h, c)) {
                    append_panel(panels, cursor, band.y_start, w, band_h, region.openings);
                    ++added;
                    log_trace(ctx.log, "[BRIDGE] ", panels.back().name, ": ", w, "x", band_h, " spans opening ",
                              next->opening.id);
                    cursor += w + spacing;
                    continue;
                }
            }
            stop = next->zone.left;
            stop_is_opening = true;
        }

        const double dist_to_stop = stop - cursor;
        if (dist_to_stop < c.min_width) {
            if (!stop_is_opening) {
                break;
            }
            log_trace(ctx.log, "[JUMP] gap ", dist_to_stop, " before opening ", next->opening.id);
            cursor = next->zone.right;
            continue;
        }

        double w = calculate_segment_layout(cursor, stop, max_w, c.min_width, inc, spacing);
        w = validate_seam(cursor, w, region, band, max_w, ctx);
        w = std::min(w, snap_down(remaining, inc));

        if (!is_valid_panel(w, band_h, c)) {
            log_warn(ctx.log, "invalid panel ", w, "x", band_h, " at x=", cursor, "; band stopped");
            break;
        }

        append_panel(panels, cursor, band.y_start, w, band_h, region.openings);
        ++added;
        log_trace(ctx.log, "[PANEL] ", panels.back().name, ": ", w, "x", band_h, " at (", cursor, ", ",
                  band.y_start, ")");
        cursor += w + spacing;

        if (stop_is_opening && std::abs(cursor - (stop + spacing)) < kHopTol) {
            // The next panel may own the opening as a cutout if it can reach past the right jamb;
            // otherwise skip the opening's footprint entirely.
            const double own_end = std::min(next->zone.right, region.x_end);
            if (own_end - cursor > max_w) {
                log_trace(ctx.log, "[HOP] opening ", next->opening.id, " -> ", next->zone.right);
                cursor = next->zone.right;
            } else {
                log_trace(ctx.log, "[STOP] next panel owns opening ", next->opening.id);
            }
        }
    }
    return added;
}

}  // namespace

std::vector<Band> compute_bands(const Region& region, const PlacementContext& ctx) {
    const auto& c = ctx.constraints;
    std::vector<Band> bands;
    if (ctx.orientation != PanelOrientation::kHorizontal) {
        bands.push_back(Band{region.y_start, region.y_end});
        return bands;
    }

    double y = region.y_start;
    while (y < region.y_end) {
        const double bh = snap_down(std::min(region.y_end - y, c.short_max), c.dimension_increment);
        if (bh < c.min_height) {
            break;
        }
        bands.push_back(Band{y, y + bh});
        y += bh;
    }
    return bands;
}

double calculate_segment_layout(
    double start_x,
    double target_x,
    double max_w,
    double min_w,
    double increment,
    double spacing
) {
    const double total = target_x - start_x;
    if (total < min_w) {
        return total;
    }
    if (total <= max_w) {
        return snap_down(total, increment);
    }

    // n * w + (n - 1) * spacing = total
    for (int n = 1; n <= kMaxSegmentPanels; ++n) {
        const double candidate = (total - static_cast<double>(n - 1) * spacing) / static_cast<double>(n);
        if (candidate <= max_w) {
            if (candidate < min_w) {
                return max_w;
            }
            return snap_down(candidate, increment);
        }
    }
    return max_w;
}

size_t place_region_sequential(const Region& region, const PlacementContext& ctx, std::vector<Panel>& panels) {
    const auto bands = compute_bands(region, ctx);
    if (bands.empty()) {
        log_warn(ctx.log, "region ", region.x_start, "..", region.x_end, " has no usable band");
        return 0;
    }

    size_t added = 0;
    for (const auto& band : bands) {
        const double limit = std::min(ctx.constraints.max_height, ctx.constraints.long_max);
        if (band.height() > limit + kDimTol) {
            log_warn(ctx.log, "band height ", band.height(), " exceeds panel height limit ", limit);
        }
        added += place_band(region, band, ctx, panels);
    }
    return added;
}

}  // namespace wallpanel
