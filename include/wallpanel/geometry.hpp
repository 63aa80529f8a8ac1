#pragma once

#include <optional>

namespace wallpanel {

// Axis-aligned rectangle in wall-local inches, bottom-left origin.
struct Rect {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;

    double right() const { return x + w; }
    double top() const { return y + h; }
    double area() const { return w * h; }
};

// Returns true only when rectangles overlap with positive area (touching at an edge is NOT overlap).
bool rects_overlap(const Rect& a, const Rect& b);

// Positive-area intersection of two rectangles, or nullopt.
std::optional<Rect> rect_intersection(const Rect& a, const Rect& b);

bool rect_contains(const Rect& outer, const Rect& inner, double eps = 1e-9);

// Round down/up to the nearest multiple of `increment` (increment <= 0 leaves the value unchanged).
double snap_down(double value, double increment);
double snap_up(double value, double increment);

}  // namespace wallpanel
