#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wallpanel/panel.hpp"
#include "wallpanel/wall_processor.hpp"

namespace wallpanel {

// "<w>x<h>" with trailing zeros dropped, e.g. "119x108", "72.5x96".
std::string panel_type_label(const Panel& p);

// Compact JSON array of the panel's cutouts, "" when it has none.
std::string cutouts_json(const Panel& p);

// panel_name,panel_type,wall_id,x_in,y_in,width_in,height_in,area_in2,rotation_deg,x_ref,cutouts_json
void write_panels_csv(const std::vector<WallLayout>& layouts, std::ostream& out);

// {"walls": [{"wall_id", "width_in", "height_in", "panels": [{"name", "x", "y", "w", "h", "cutouts"}]}]}
nlohmann::json panels_to_json(const std::vector<WallLayout>& layouts);

// One wall as an SVG drawing in inches, y up: wall outline, clearance zones (blockers shaded),
// opening outlines dashed, panels labelled by name, cutouts in grey.
void write_layout_svg(const WallLayout& layout, std::ostream& out);

// File wrappers; throw std::runtime_error when the file cannot be written.
void write_panels_csv_file(const std::vector<WallLayout>& layouts, const std::string& path);
void write_panels_json_file(const std::vector<WallLayout>& layouts, const std::string& path);
void write_layout_svg_file(const WallLayout& layout, const std::string& path);

}  // namespace wallpanel
