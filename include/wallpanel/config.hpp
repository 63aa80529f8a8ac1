#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "wallpanel/constraints.hpp"
#include "wallpanel/opening.hpp"

namespace wallpanel {

// Full set of tunables for one optimization run. Passed explicitly to every entry point.
struct OptimizerConfig {
    std::string project_name = "Default";
    PanelConstraints panel;

    OpeningClearance door{6.0, 8.0, 6.0};
    OpeningClearance window{4.0, 6.0, 4.0};
    OpeningClearance storefront{0.75, 0.75, 0.75};

    PanelOrientation orientation = PanelOrientation::kVertical;
    PlacementPolicy policy;
};

// "vertical" | "horizontal"; throws std::invalid_argument otherwise.
OptimizerConfig preset_config(std::string_view name);

// Case-insensitive; throws std::invalid_argument on anything but vertical/horizontal.
PanelOrientation parse_orientation(std::string_view raw);
const char* orientation_name(PanelOrientation orientation);

// Door -> door set, Storefront -> storefront set, Window and Unknown -> window set.
const OpeningClearance& category_clearance(const OptimizerConfig& cfg, OpeningType type);

struct ConfigIssue {
    bool is_error = true;
    std::string message;
};

// Empty result = valid. Warnings (is_error == false) do not prevent a run.
std::vector<ConfigIssue> validate_config(const OptimizerConfig& cfg);
bool has_errors(const std::vector<ConfigIssue>& issues);

// JSON config. Missing keys take their defaults; non-numeric values are ignored.
// Throws std::runtime_error on a JSON syntax error.
OptimizerConfig load_config_json(std::istream& is);
void save_config_json(const OptimizerConfig& cfg, std::ostream& os);

// File wrappers; throw std::runtime_error when the file cannot be opened.
OptimizerConfig load_config_file(const std::string& path);
void save_config_file(const OptimizerConfig& cfg, const std::string& path);

}  // namespace wallpanel
