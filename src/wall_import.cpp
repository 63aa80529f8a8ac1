#include "wallpanel/wall_import.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <sstream>
#include <string>
#include <utility>

namespace wallpanel {
namespace {

// Below 2^63, so the cast to long long is exact and defined.
constexpr double kMaxIntegralId = 9.2e18;

bool is_null_token(const std::string& s) {
    std::string l = s;
    for (auto& ch : l) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return l.empty() || l == "nan" || l == "none";
}

double cell_or(const CsvRow& row, const char* key, double fallback) {
    const auto it = row.find(key);
    if (it == row.end()) {
        return fallback;
    }
    return parse_cell_double(it->second, fallback);
}

std::string cell_text(const CsvRow& row, const char* key) {
    const auto it = row.find(key);
    return it == row.end() ? std::string() : trim_copy(it->second);
}

}  // namespace

double parse_cell_double(std::string_view cell, double fallback) {
    const std::string s = trim_copy(cell);
    if (is_null_token(s)) {
        return fallback;
    }
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(v)) {
        return fallback;
    }
    return v;
}

std::string normalize_element_id(std::string_view raw) {
    const std::string s = trim_copy(raw);
    // Decimal notation only; hex, inf and nan text is kept as written.
    if (s.empty() || s.find_first_not_of("0123456789+-.eE") != std::string::npos) {
        return s;
    }
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(v)) {
        return s;
    }
    if (std::floor(v) != v || std::fabs(v) >= kMaxIntegralId) {
        return s;
    }
    std::ostringstream oss;
    oss << static_cast<long long>(v);
    return oss.str();
}

std::string wall_id_from_row(const CsvRow& row) {
    for (const char* key : {"WallId", "ElementId", "Id"}) {
        const std::string v = cell_text(row, key);
        if (!is_null_token(v)) {
            return normalize_element_id(v);
        }
    }
    const std::string name = cell_text(row, "Name");
    if (!is_null_token(name)) {
        return name;
    }
    return "unknown";
}

std::vector<WallInput> import_walls(const CsvTable& table, ImportReport& report) {
    std::vector<WallInput> walls;
    walls.reserve(table.rows.size());
    for (size_t i = 0; i < table.rows.size(); ++i) {
        const auto& row = table.rows[i];
        WallInput w;
        w.id = wall_id_from_row(row);
        w.width_in = cell_or(row, "Length(ft)", 0.0) * kInchesPerFoot;
        w.height_in = cell_or(row, "UnconnectedHeight(ft)", 0.0) * kInchesPerFoot;
        if (!(w.width_in > 0.0) || !(w.height_in > 0.0)) {
            ++report.skipped_walls;
            report.warnings.push_back("wall row " + std::to_string(i + 1) + " (" + w.id +
                                      "): non-positive length or height, skipped");
            continue;
        }
        walls.push_back(std::move(w));
    }
    return walls;
}

std::vector<OpeningInput> import_openings(const CsvTable& table, ImportReport& report) {
    std::vector<OpeningInput> openings;
    openings.reserve(table.rows.size());
    for (size_t i = 0; i < table.rows.size(); ++i) {
        const auto& row = table.rows[i];
        OpeningInput o;
        o.id = cell_text(row, "OpeningId");
        o.host_wall_id = normalize_element_id(cell_text(row, "HostWallId"));

        const double width_ft = cell_or(row, "Width(ft)", 0.0);
        const double height_ft = cell_or(row, "Height(ft)", 0.0);
        if (!(width_ft > 0.0) || !(height_ft > 0.0)) {
            ++report.skipped_openings;
            report.warnings.push_back("opening row " + std::to_string(i + 1) + " (" + o.id +
                                      "): non-positive width or height, skipped");
            continue;
        }

        double left_ft = cell_or(row, "LeftEdgeAlongWall(ft)", 0.0);
        if (left_ft == 0.0) {
            const double pos_ft = cell_or(row, "PositionAlongWall(ft)", 0.0);
            if (pos_ft != 0.0) {
                left_ft = pos_ft - width_ft / 2.0;
            }
        }

        const std::string type_text = cell_text(row, "OpeningType");
        o.type = parse_opening_type(type_text.empty() ? std::string_view("Unknown") : std::string_view(type_text));
        o.x = left_ft * kInchesPerFoot;
        o.y = cell_or(row, "SillHeight(ft)", 0.0) * kInchesPerFoot;
        o.w = width_ft * kInchesPerFoot;
        o.h = height_ft * kInchesPerFoot;
        openings.push_back(std::move(o));
    }
    return openings;
}

Opening make_opening(const OpeningInput& in, const OptimizerConfig& cfg) {
    Opening o;
    o.id = in.id;
    o.type = in.type;
    o.x = in.x;
    o.y = in.y;
    o.w = in.w;
    o.h = in.h;
    o.clearance = category_clearance(cfg, in.type);
    return o;
}

}  // namespace wallpanel
