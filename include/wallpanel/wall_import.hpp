#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "wallpanel/config.hpp"
#include "wallpanel/csv_table.hpp"
#include "wallpanel/opening.hpp"

namespace wallpanel {

// Canonical wall record (inches).
struct WallInput {
    std::string id;
    double width_in = 0.0;
    double height_in = 0.0;
};

// Canonical opening record (inches, wall-local).
struct OpeningInput {
    std::string id;
    std::string host_wall_id;
    OpeningType type = OpeningType::kUnknown;
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
};

// Row-level problems collected while importing; never fatal.
struct ImportReport {
    std::vector<std::string> warnings;
    int skipped_walls = 0;
    int skipped_openings = 0;
};

constexpr double kInchesPerFoot = 12.0;

// Empty, "nan", "none" or non-numeric cells give `fallback`.
double parse_cell_double(std::string_view cell, double fallback = 0.0);

// "1234.0" -> "1234". Non-integral, out-of-range or non-decimal ids are returned trimmed and unchanged.
std::string normalize_element_id(std::string_view raw);

// Id from WallId / ElementId / Id, then Name, then "unknown".
std::string wall_id_from_row(const CsvRow& row);

std::vector<WallInput> import_walls(const CsvTable& table, ImportReport& report);
std::vector<OpeningInput> import_openings(const CsvTable& table, ImportReport& report);

// Attaches the category clearance from the configuration.
Opening make_opening(const OpeningInput& in, const OptimizerConfig& cfg);

}  // namespace wallpanel
