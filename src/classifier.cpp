#include "wallpanel/classifier.hpp"

namespace wallpanel {
namespace {

OpeningClearance technical_gap(const PanelConstraints& c) {
    return OpeningClearance{c.panel_spacing, c.panel_spacing, c.panel_spacing};
}

}  // namespace

ClassifiedOpening classify_opening(const Opening& o, const PanelConstraints& c, const PlacementPolicy& policy) {
    ClassifiedOpening out;
    out.opening = o;

    bool blocker = false;
    if (is_storefront_like(o.type) && policy.storefront_always_blocks) {
        blocker = true;
    } else {
        const double required_span = o.w + 2.0 * o.clearance.jamb_min;
        blocker = required_span > c.max_width;
    }

    out.role = blocker ? OpeningRole::kBlocker : OpeningRole::kCutout;
    out.clearance = blocker ? technical_gap(c) : o.clearance;
    out.zone = clearance_zone(o, out.clearance);
    return out;
}

std::vector<ClassifiedOpening> classify_openings(
    const std::vector<Opening>& openings,
    const PanelConstraints& c,
    const PlacementPolicy& policy
) {
    std::vector<ClassifiedOpening> out;
    out.reserve(openings.size());
    for (const auto& o : openings) {
        out.push_back(classify_opening(o, c, policy));
    }
    return out;
}

std::vector<ClassifiedOpening> select_role(const std::vector<ClassifiedOpening>& openings, OpeningRole role) {
    std::vector<ClassifiedOpening> out;
    for (const auto& o : openings) {
        if (o.role == role) {
            out.push_back(o);
        }
    }
    return out;
}

}  // namespace wallpanel
