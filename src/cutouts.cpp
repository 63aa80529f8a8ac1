#include "wallpanel/cutouts.hpp"

#include <utility>

namespace wallpanel {

std::vector<Cutout> calculate_panel_cutouts(const Panel& panel, const std::vector<ClassifiedOpening>& openings) {
    std::vector<Cutout> out;
    const Rect p = panel.rect();
    for (const auto& o : openings) {
        if (o.is_blocker()) {
            continue;
        }
        const auto hole = rect_intersection(p, o.zone.rect());
        if (!hole) {
            continue;
        }
        Cutout c;
        c.id = o.opening.id;
        c.type = opening_type_label(o.opening.type);
        c.x = hole->x - panel.x;
        c.y = hole->y - panel.y;
        c.w = hole->w;
        c.h = hole->h;
        out.push_back(std::move(c));
    }
    return out;
}

}  // namespace wallpanel
