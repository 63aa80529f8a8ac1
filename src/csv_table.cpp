#include "wallpanel/csv_table.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace wallpanel {
namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

// Reads one logical record (may span physical lines inside quotes). Returns false at EOF.
bool read_record(std::istream& in, std::vector<std::string>& fields) {
    fields.clear();
    if (in.peek() == std::char_traits<char>::eof()) {
        return false;
    }

    std::string cur;
    bool in_quotes = false;
    char ch = 0;
    while (in.get(ch)) {
        if (in_quotes) {
            if (ch == '"') {
                if (in.peek() == '"') {
                    in.get(ch);
                    cur.push_back('"');
                } else {
                    in_quotes = false;
                }
            } else {
                cur.push_back(ch);
            }
            continue;
        }
        if (ch == '"') {
            in_quotes = true;
        } else if (ch == ',') {
            fields.push_back(std::move(cur));
            cur.clear();
        } else if (ch == '\r') {
            if (in.peek() == '\n') {
                in.get(ch);
            }
            break;
        } else if (ch == '\n') {
            break;
        } else {
            cur.push_back(ch);
        }
    }
    fields.push_back(std::move(cur));
    return true;
}

bool blank_record(const std::vector<std::string>& fields) {
    for (const auto& f : fields) {
        if (!trim_copy(f).empty()) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string trim_copy(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

CsvTable read_csv_rows(std::istream& in) {
    CsvTable table;
    std::vector<std::string> fields;
    if (!read_record(in, fields)) {
        return table;
    }
    if (!fields.empty() && fields[0].compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
        fields[0].erase(0, kUtf8Bom.size());
    }
    for (const auto& f : fields) {
        table.header.push_back(trim_copy(f));
    }

    while (read_record(in, fields)) {
        if (blank_record(fields)) {
            continue;
        }
        CsvRow row;
        for (size_t i = 0; i < table.header.size(); ++i) {
            row[table.header[i]] = (i < fields.size()) ? fields[i] : std::string();
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out = "\"";
    for (const char ch : field) {
        if (ch == '"') {
            out.push_back('"');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

}  // namespace wallpanel
