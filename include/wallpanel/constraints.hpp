#pragma once

#include <algorithm>

namespace wallpanel {

// Fabrication limits for a single panel (inches).
struct PanelConstraints {
    double min_width = 24.0;
    double max_width = 138.0;
    double min_height = 24.0;
    double max_height = 348.0;

    // Aspect rule: at least one side must be <= short_max, neither side may exceed long_max.
    double short_max = 138.0;
    double long_max = 348.0;

    double dimension_increment = 1.0;

    // Gap left between neighbouring panels (not subtracted from panel sizes).
    double panel_spacing = 0.125;
};

// Minimum keep-out margins around an opening (inches).
struct OpeningClearance {
    double jamb_min = 6.0;
    double header_min = 8.0;
    double sill_min = 6.0;
};

enum class PanelOrientation {
    kVertical = 0,
    kHorizontal = 1,
};

// Heuristic thresholds that are tunable per project.
struct PlacementPolicy {
    // Seam correction only applies to openings strictly smaller than this (door scale).
    double small_opening_max_width = 72.0;
    double small_opening_max_height = 120.0;

    // When set, storefront/curtain-wall openings always split the wall instead of becoming cutouts.
    bool storefront_always_blocks = true;
};

constexpr double kDimTol = 1e-9;

inline bool is_valid_panel(double w, double h, const PanelConstraints& c) {
    if (w < c.min_width - kDimTol || h < c.min_height - kDimTol) {
        return false;
    }
    if (w > c.max_width + kDimTol || h > c.max_height + kDimTol) {
        return false;
    }
    if (w > c.long_max + kDimTol || h > c.long_max + kDimTol) {
        return false;
    }
    return !(w > c.short_max + kDimTol && h > c.short_max + kDimTol);
}

// Widest panel allowed for a given height: tall panels must keep their width within short_max.
inline double max_width_for_height(double h, const PanelConstraints& c) {
    const double aspect_cap = (h > c.short_max) ? c.short_max : c.long_max;
    return std::min(c.max_width, aspect_cap);
}

}  // namespace wallpanel
