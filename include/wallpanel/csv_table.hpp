#pragma once

#include <istream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace wallpanel {

using CsvRow = std::map<std::string, std::string>;

struct CsvTable {
    std::vector<std::string> header;
    std::vector<CsvRow> rows;
};

// Header row + data rows. Quoted fields may contain commas, doubled quotes and newlines.
// Header keys are trimmed, a UTF-8 BOM is stripped, CRLF line ends are accepted.
// Rows shorter than the header get empty cells; extra cells are dropped.
CsvTable read_csv_rows(std::istream& in);

// Quotes the field if it contains a comma, quote or line break.
std::string csv_escape(std::string_view field);

std::string trim_copy(std::string_view s);

}  // namespace wallpanel
