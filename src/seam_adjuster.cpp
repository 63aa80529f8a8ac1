#include "wallpanel/seam_adjuster.hpp"

#include <algorithm>
#include <cmath>

#include "wallpanel/cutouts.hpp"

namespace wallpanel {
namespace {

// Right panel must start within this distance of (left edge + spacing) to count as adjacent.
constexpr double kAdjacentTol = 1.0;

bool crosses_opening(const Panel& p, const Opening& o) {
    return !(p.top() <= o.y || p.y >= o.y + o.h);
}

}  // namespace

size_t adjust_seams_for_small_openings(
    const Region& region,
    const PlacementContext& ctx,
    std::vector<Panel>& panels,
    size_t first_index
) {
    const auto& c = ctx.constraints;
    const double spacing = c.panel_spacing;
    size_t adjusted = 0;

    for (const auto& co : region.openings) {
        const Opening& o = co.opening;
        if (!co.is_cutout() || !is_small_opening(o, ctx.policy)) {
            continue;
        }
        const double opening_right = o.x + o.w;

        std::vector<size_t> band;
        for (size_t i = first_index; i < panels.size(); ++i) {
            const Panel& p = panels[i];
            if (p.x >= region.x_start && p.x < region.x_end && crosses_opening(p, o)) {
                band.push_back(i);
            }
        }
        std::stable_sort(band.begin(), band.end(), [&](size_t a, size_t b) { return panels[a].x < panels[b].x; });

        for (size_t k = 0; k + 1 < band.size(); ++k) {
            Panel& left = panels[band[k]];
            Panel& right = panels[band[k + 1]];
            if (std::abs(left.y - right.y) > kDimTol || std::abs(left.h - right.h) > kDimTol) {
                continue;
            }

            const double seam = left.right() + spacing;
            if (std::abs(right.x - seam) > kAdjacentTol) {
                continue;
            }
            if (!(o.x < seam && seam < opening_right)) {
                continue;
            }

            const double new_seam = snap_down(o.x, c.dimension_increment);
            if (new_seam <= left.x) {
                continue;
            }
            const double new_left_w = left.w - (seam - new_seam);
            const double new_right_w = right.right() - new_seam;
            if (new_left_w < c.min_width || new_right_w < c.min_width) {
                continue;
            }
            if (!is_valid_panel(new_right_w, right.h, c)) {
                continue;
            }

            log_trace(ctx.log, "[SEAM-ADJUST] seam ", seam, " -> ", new_seam, " for opening ", o.id, " (", left.name,
                      " ", left.w, " -> ", new_left_w, ", ", right.name, " ", right.w, " -> ", new_right_w, ")");
            left.w = new_left_w;
            right.x = new_seam;
            right.w = new_right_w;
            left.cutouts = calculate_panel_cutouts(left, region.openings);
            right.cutouts = calculate_panel_cutouts(right, region.openings);
            ++adjusted;
            break;
        }
    }
    return adjusted;
}

}  // namespace wallpanel
