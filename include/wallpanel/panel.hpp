#pragma once

#include <string>
#include <vector>

#include "wallpanel/geometry.hpp"

namespace wallpanel {

// Hole punched through a panel, in panel-local coordinates (panel bottom-left = 0,0).
struct Cutout {
    std::string id;
    std::string type;
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
};

struct Panel {
    std::string name;
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
    std::vector<Cutout> cutouts;

    double right() const { return x + w; }
    double top() const { return y + h; }
    Rect rect() const { return Rect{x, y, w, h}; }
};

inline bool panels_overlap(const Panel& a, const Panel& b) { return rects_overlap(a.rect(), b.rect()); }

// 1 -> "P01", 12 -> "P12", 123 -> "P123".
std::string format_panel_name(int index);

}  // namespace wallpanel
