#include "wallpanel/opening.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace wallpanel {
namespace {

std::string lower_copy(std::string_view s) {
    std::string out(s);
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

}  // namespace

OpeningType parse_opening_type(std::string_view raw) {
    const std::string t = lower_copy(raw);
    if (t.find("door") != std::string::npos) {
        return OpeningType::kDoor;
    }
    if (t.find("storefront") != std::string::npos || t.find("curtain") != std::string::npos) {
        return OpeningType::kStorefront;
    }
    if (t.find("window") != std::string::npos) {
        return OpeningType::kWindow;
    }
    return OpeningType::kUnknown;
}

const char* opening_type_label(OpeningType type) {
    switch (type) {
        case OpeningType::kDoor:
            return "Door";
        case OpeningType::kWindow:
            return "Window";
        case OpeningType::kStorefront:
            return "Storefront/Curtain";
        case OpeningType::kUnknown:
            break;
    }
    return "Unknown";
}

double left_clearance_zone(const Opening& o, const OpeningClearance& c) {
    return std::max(0.0, o.x - c.jamb_min);
}

double right_clearance_zone(const Opening& o, const OpeningClearance& c) {
    return o.x + o.w + c.jamb_min;
}

double bottom_clearance_zone(const Opening& o, const OpeningClearance& c) {
    return std::max(0.0, o.y - c.sill_min);
}

double top_clearance_zone(const Opening& o, const OpeningClearance& c) {
    return o.y + o.h + c.header_min;
}

ClearanceZone clearance_zone(const Opening& o, const OpeningClearance& c) {
    return ClearanceZone{
        left_clearance_zone(o, c),
        right_clearance_zone(o, c),
        bottom_clearance_zone(o, c),
        top_clearance_zone(o, c),
    };
}

}  // namespace wallpanel
