#include "wallpanel/panel.hpp"

#include <iomanip>
#include <sstream>

namespace wallpanel {

std::string format_panel_name(int index) {
    std::ostringstream oss;
    oss << "P" << std::setw(2) << std::setfill('0') << index;
    return oss.str();
}

}  // namespace wallpanel
