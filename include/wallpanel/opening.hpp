#pragma once

#include <string>
#include <string_view>

#include "wallpanel/constraints.hpp"
#include "wallpanel/geometry.hpp"

namespace wallpanel {

enum class OpeningType {
    kDoor = 0,
    kWindow = 1,
    kStorefront = 2,
    kUnknown = 3,
};

// Case-insensitive: "door" -> Door, "storefront"/"curtain" -> Storefront, "window" -> Window.
OpeningType parse_opening_type(std::string_view raw);

// Canonical label written into cutout records ("Door", "Window", "Storefront/Curtain", "Unknown").
const char* opening_type_label(OpeningType type);

inline bool is_storefront_like(OpeningType type) { return type == OpeningType::kStorefront; }

// Wall-local opening footprint. `clearance` is the category clearance and is never mutated;
// the effective clearance used for placement comes from classification.
struct Opening {
    std::string id;
    OpeningType type = OpeningType::kUnknown;
    double x = 0.0;  // left edge from wall start
    double y = 0.0;  // sill height
    double w = 0.0;
    double h = 0.0;
    OpeningClearance clearance;
};

// Keep-out rectangle around an opening. Left/bottom are clamped to the wall origin,
// right/top are NOT clamped against the wall extent.
struct ClearanceZone {
    double left = 0.0;
    double right = 0.0;
    double bottom = 0.0;
    double top = 0.0;

    double width() const { return right - left; }
    Rect rect() const { return Rect{left, bottom, right - left, top - bottom}; }
};

double left_clearance_zone(const Opening& o, const OpeningClearance& c);
double right_clearance_zone(const Opening& o, const OpeningClearance& c);
double bottom_clearance_zone(const Opening& o, const OpeningClearance& c);
double top_clearance_zone(const Opening& o, const OpeningClearance& c);

ClearanceZone clearance_zone(const Opening& o, const OpeningClearance& c);

}  // namespace wallpanel
