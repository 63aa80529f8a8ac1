#pragma once

#include <vector>

#include "wallpanel/constraints.hpp"
#include "wallpanel/opening.hpp"

namespace wallpanel {

enum class OpeningRole {
    kCutout = 0,   // covered by a panel, punched out afterwards
    kBlocker = 1,  // splits the wall; no panel may cover its clearance zone
};

// An opening together with the clearance and keep-out zone that apply for one placement run.
struct ClassifiedOpening {
    Opening opening;
    OpeningRole role = OpeningRole::kCutout;
    OpeningClearance clearance;
    ClearanceZone zone;

    bool is_blocker() const { return role == OpeningRole::kBlocker; }
    bool is_cutout() const { return role == OpeningRole::kCutout; }
};

// Pure function of the opening's category clearance; calling it repeatedly gives the same result.
//   storefront (policy) -> Blocker
//   w + 2*jamb <= max_width -> Cutout with the category clearance
//   otherwise -> Blocker
// Blockers use panel_spacing on every side as their clearance.
ClassifiedOpening classify_opening(const Opening& o, const PanelConstraints& c, const PlacementPolicy& policy);

// Preserves input order.
std::vector<ClassifiedOpening> classify_openings(
    const std::vector<Opening>& openings,
    const PanelConstraints& c,
    const PlacementPolicy& policy
);

std::vector<ClassifiedOpening> select_role(const std::vector<ClassifiedOpening>& openings, OpeningRole role);

}  // namespace wallpanel
