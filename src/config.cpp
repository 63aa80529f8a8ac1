#include "wallpanel/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace wallpanel {
namespace {

using json = nlohmann::json;

std::string lower_copy(std::string_view s) {
    std::string out(s);
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

double number_or(const json& j, const char* key, double fallback) {
    if (!j.is_object()) {
        return fallback;
    }
    const auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<double>();
}

bool bool_or(const json& j, const char* key, bool fallback) {
    if (!j.is_object()) {
        return fallback;
    }
    const auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

const json& section(const json& root, const char* key) {
    static const json kEmpty = json::object();
    const auto it = root.find(key);
    if (it == root.end() || !it->is_object()) {
        return kEmpty;
    }
    return *it;
}

OpeningClearance read_clearance(const json& j, const OpeningClearance& def) {
    OpeningClearance c;
    c.jamb_min = number_or(j, "jamb_min", def.jamb_min);
    c.header_min = number_or(j, "header_min", def.header_min);
    c.sill_min = number_or(j, "sill_min", def.sill_min);
    return c;
}

json clearance_to_json(const OpeningClearance& c) {
    return json{{"jamb_min", c.jamb_min}, {"header_min", c.header_min}, {"sill_min", c.sill_min}};
}

void check_positive(std::vector<ConfigIssue>& out, const char* name, double v) {
    if (!(v > 0.0)) {
        out.push_back(ConfigIssue{true, std::string(name) + " must be positive"});
    }
}

void check_clearance(std::vector<ConfigIssue>& out, const char* name, const OpeningClearance& c) {
    if (c.jamb_min < 0.0 || c.header_min < 0.0 || c.sill_min < 0.0) {
        out.push_back(ConfigIssue{true, std::string(name) + " clearances must be non-negative"});
    }
}

}  // namespace

OptimizerConfig preset_config(std::string_view name) {
    const std::string n = lower_copy(name);
    OptimizerConfig cfg;
    if (n == "vertical") {
        cfg.project_name = "Vertical";
        cfg.orientation = PanelOrientation::kVertical;
        return cfg;
    }
    if (n == "horizontal") {
        cfg.project_name = "Horizontal";
        cfg.orientation = PanelOrientation::kHorizontal;
        cfg.panel.min_width = 12.0;
        cfg.panel.max_width = 348.0;
        cfg.panel.min_height = 12.0;
        cfg.panel.max_height = 138.0;
        cfg.window = OpeningClearance{6.0, 8.0, 6.0};
        return cfg;
    }
    throw std::invalid_argument("unknown preset: " + std::string(name));
}

PanelOrientation parse_orientation(std::string_view raw) {
    const std::string n = lower_copy(raw);
    if (n == "vertical") {
        return PanelOrientation::kVertical;
    }
    if (n == "horizontal") {
        return PanelOrientation::kHorizontal;
    }
    throw std::invalid_argument("unknown orientation: " + std::string(raw));
}

const char* orientation_name(PanelOrientation orientation) {
    return orientation == PanelOrientation::kHorizontal ? "horizontal" : "vertical";
}

const OpeningClearance& category_clearance(const OptimizerConfig& cfg, OpeningType type) {
    switch (type) {
        case OpeningType::kDoor:
            return cfg.door;
        case OpeningType::kStorefront:
            return cfg.storefront;
        case OpeningType::kWindow:
        case OpeningType::kUnknown:
            break;
    }
    return cfg.window;
}

std::vector<ConfigIssue> validate_config(const OptimizerConfig& cfg) {
    const auto& p = cfg.panel;
    std::vector<ConfigIssue> out;
    check_positive(out, "min_width", p.min_width);
    check_positive(out, "max_width", p.max_width);
    check_positive(out, "min_height", p.min_height);
    check_positive(out, "max_height", p.max_height);
    check_positive(out, "short_max", p.short_max);
    check_positive(out, "long_max", p.long_max);
    check_positive(out, "dimension_increment", p.dimension_increment);
    if (p.panel_spacing < 0.0) {
        out.push_back(ConfigIssue{true, "panel_spacing must be non-negative"});
    }
    if (p.min_width >= p.max_width) {
        out.push_back(ConfigIssue{true, "min_width must be less than max_width"});
    }
    if (p.min_height >= p.max_height) {
        out.push_back(ConfigIssue{true, "min_height must be less than max_height"});
    }
    if (p.short_max > p.long_max) {
        out.push_back(ConfigIssue{true, "short_max must not exceed long_max"});
    }
    if (p.max_width > p.long_max) {
        out.push_back(ConfigIssue{false, "max_width exceeds long_max; widths are capped at long_max"});
    }
    check_clearance(out, "door", cfg.door);
    check_clearance(out, "window", cfg.window);
    check_clearance(out, "storefront", cfg.storefront);
    if (cfg.policy.small_opening_max_width < 0.0 || cfg.policy.small_opening_max_height < 0.0) {
        out.push_back(ConfigIssue{true, "placement_policy thresholds must be non-negative"});
    }
    return out;
}

bool has_errors(const std::vector<ConfigIssue>& issues) {
    return std::any_of(issues.begin(), issues.end(), [](const ConfigIssue& i) { return i.is_error; });
}

OptimizerConfig load_config_json(std::istream& is) {
    json root;
    try {
        root = json::parse(is);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("config parse error: ") + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("config root must be a JSON object");
    }

    OptimizerConfig cfg;
    const auto name_it = root.find("project_name");
    if (name_it != root.end() && name_it->is_string()) {
        cfg.project_name = name_it->get<std::string>();
    }

    // Defaults for a partially specified file differ from the vertical preset.
    const json& pc = section(root, "panel_constraints");
    cfg.panel.min_width = number_or(pc, "min_width", 24.0);
    cfg.panel.max_width = number_or(pc, "max_width", 348.0);
    cfg.panel.min_height = number_or(pc, "min_height", 24.0);
    cfg.panel.max_height = number_or(pc, "max_height", 144.0);
    cfg.panel.short_max = number_or(pc, "short_max", 138.0);
    cfg.panel.long_max = number_or(pc, "long_max", 348.0);
    cfg.panel.dimension_increment = number_or(pc, "dimension_increment", 1.0);
    cfg.panel.panel_spacing = number_or(pc, "panel_spacing", 0.125);

    cfg.door = read_clearance(section(root, "door_clearances"), OpeningClearance{6.0, 8.0, 6.0});
    cfg.window = read_clearance(section(root, "window_clearances"), OpeningClearance{6.0, 8.0, 6.0});
    cfg.storefront = read_clearance(section(root, "storefront_clearances"), OpeningClearance{0.75, 0.75, 0.75});

    const json& strategy = section(root, "optimization_strategy");
    const auto orient_it = strategy.find("panel_orientation");
    if (orient_it != strategy.end() && orient_it->is_string()) {
        cfg.orientation = parse_orientation(orient_it->get<std::string>());
    }

    const json& policy = section(root, "placement_policy");
    cfg.policy.small_opening_max_width = number_or(policy, "small_opening_max_width", cfg.policy.small_opening_max_width);
    cfg.policy.small_opening_max_height =
        number_or(policy, "small_opening_max_height", cfg.policy.small_opening_max_height);
    cfg.policy.storefront_always_blocks =
        bool_or(policy, "storefront_always_blocks", cfg.policy.storefront_always_blocks);
    return cfg;
}

void save_config_json(const OptimizerConfig& cfg, std::ostream& os) {
    const auto& p = cfg.panel;
    json root;
    root["project_name"] = cfg.project_name;
    root["panel_constraints"] = json{
        {"min_width", p.min_width},
        {"max_width", p.max_width},
        {"min_height", p.min_height},
        {"max_height", p.max_height},
        {"short_max", p.short_max},
        {"long_max", p.long_max},
        {"dimension_increment", p.dimension_increment},
        {"panel_spacing", p.panel_spacing},
    };
    root["door_clearances"] = clearance_to_json(cfg.door);
    root["window_clearances"] = clearance_to_json(cfg.window);
    root["storefront_clearances"] = clearance_to_json(cfg.storefront);
    root["optimization_strategy"] = json{{"panel_orientation", orientation_name(cfg.orientation)}};
    root["placement_policy"] = json{
        {"small_opening_max_width", cfg.policy.small_opening_max_width},
        {"small_opening_max_height", cfg.policy.small_opening_max_height},
        {"storefront_always_blocks", cfg.policy.storefront_always_blocks},
    };
    os << root.dump(2) << "\n";
}

OptimizerConfig load_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("failed to open config: " + path);
    }
    return load_config_json(f);
}

void save_config_file(const OptimizerConfig& cfg, const std::string& path) {
    std::ofstream f(path);
    if (!f) {
        throw std::runtime_error("failed to open config for write: " + path);
    }
    save_config_json(cfg, f);
    if (!f) {
        throw std::runtime_error("failed to write config: " + path);
    }
}

}  // namespace wallpanel
