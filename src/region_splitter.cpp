#include "wallpanel/region_splitter.hpp"

#include <algorithm>

namespace wallpanel {
namespace {

bool spans_overlap(double a0, double a1, double b0, double b1) {
    return !(a1 <= b0 || a0 >= b1);
}

std::vector<ClassifiedOpening> cutouts_in_span(
    const std::vector<ClassifiedOpening>& openings,
    double x_start,
    double x_end
) {
    std::vector<ClassifiedOpening> out;
    for (const auto& o : openings) {
        if (o.is_cutout() && spans_overlap(o.zone.left, o.zone.right, x_start, x_end)) {
            out.push_back(o);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ClassifiedOpening& a, const ClassifiedOpening& b) {
        return a.opening.x < b.opening.x;
    });
    return out;
}

}  // namespace

std::vector<Region> split_regions(
    double wall_width,
    double wall_height,
    const std::vector<ClassifiedOpening>& openings,
    const PanelConstraints& c,
    const LogOptions& log
) {
    std::vector<Region> regions;

    std::vector<const ClassifiedOpening*> blockers;
    for (const auto& o : openings) {
        if (o.is_blocker()) {
            blockers.push_back(&o);
        }
    }

    if (blockers.empty()) {
        Region r;
        r.x_start = 0.0;
        r.x_end = wall_width;
        r.y_start = 0.0;
        r.y_end = wall_height;
        r.openings = cutouts_in_span(openings, 0.0, wall_width);
        regions.push_back(std::move(r));
        return regions;
    }

    // Clearance zones may project past the wall end; region bounds never do.
    std::vector<double> xs{0.0, wall_width};
    for (const auto* b : blockers) {
        xs.push_back(std::clamp(b->zone.left, 0.0, wall_width));
        xs.push_back(std::clamp(b->zone.right, 0.0, wall_width));
    }
    std::sort(xs.begin(), xs.end());
    xs.erase(std::unique(xs.begin(), xs.end()), xs.end());

    for (size_t i = 0; i + 1 < xs.size(); ++i) {
        const double x0 = xs[i];
        const double x1 = xs[i + 1];

        const bool blocked = std::any_of(blockers.begin(), blockers.end(), [&](const ClassifiedOpening* b) {
            return spans_overlap(x0, x1, b->zone.left, b->zone.right);
        });
        if (blocked) {
            continue;
        }
        if (x1 - x0 < c.min_width) {
            log_warn(log, "[SKIP] segment ", x0, "..", x1, " narrower than min_width ", c.min_width);
            continue;
        }

        Region r;
        r.x_start = x0;
        r.x_end = x1;
        r.y_start = 0.0;
        r.y_end = wall_height;
        r.openings = cutouts_in_span(openings, x0, x1);
        regions.push_back(std::move(r));
    }
    return regions;
}

}  // namespace wallpanel
