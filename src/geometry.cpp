#include "wallpanel/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace wallpanel {
namespace {

// Absorbs binary representation error before flooring/ceiling (e.g. 2.9999999999 / 1.0).
constexpr double kSnapTol = 1e-9;

}  // namespace

bool rects_overlap(const Rect& a, const Rect& b) {
    return !(a.right() <= b.x || b.right() <= a.x || a.top() <= b.y || b.top() <= a.y);
}

std::optional<Rect> rect_intersection(const Rect& a, const Rect& b) {
    const double left = std::max(a.x, b.x);
    const double right = std::min(a.right(), b.right());
    const double bottom = std::max(a.y, b.y);
    const double top = std::min(a.top(), b.top());
    if (right > left && top > bottom) {
        return Rect{left, bottom, right - left, top - bottom};
    }
    return std::nullopt;
}

bool rect_contains(const Rect& outer, const Rect& inner, double eps) {
    return inner.x >= outer.x - eps && inner.y >= outer.y - eps && inner.right() <= outer.right() + eps &&
           inner.top() <= outer.top() + eps;
}

double snap_down(double value, double increment) {
    if (!(increment > 0.0)) {
        return value;
    }
    return std::floor(value / increment + kSnapTol) * increment;
}

double snap_up(double value, double increment) {
    if (!(increment > 0.0)) {
        return value;
    }
    return std::ceil(value / increment - kSnapTol) * increment;
}

}  // namespace wallpanel
