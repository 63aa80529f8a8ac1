#include "wallpanel/panel_export.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "wallpanel/csv_table.hpp"

namespace wallpanel {
namespace {

using json = nlohmann::json;

std::string format_number(double v) {
    std::ostringstream oss;
    oss.precision(10);
    oss << v;
    return oss.str();
}

std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const char ch : s) {
        switch (ch) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '\'': out += "&apos;"; break;
            case '"': out += "&quot;"; break;
            default: out.push_back(ch); break;
        }
    }
    return out;
}

// Wall coordinates have y up; SVG has y down.
void svg_rect(std::ostream& out, double wall_h, double x, double y, double w, double h, const char* style) {
    out << "<rect x='" << format_number(x) << "' y='" << format_number(wall_h - (y + h)) << "' width='"
        << format_number(w) << "' height='" << format_number(h) << "' " << style << "/>\n";
}

}  // namespace

std::string panel_type_label(const Panel& p) {
    return format_number(p.w) + "x" + format_number(p.h);
}

std::string cutouts_json(const Panel& p) {
    if (p.cutouts.empty()) {
        return {};
    }
    json arr = json::array();
    for (const auto& c : p.cutouts) {
        arr.push_back(json{
            {"id", c.id},
            {"type", c.type},
            {"x_in", c.x},
            {"y_in", c.y},
            {"width_in", c.w},
            {"height_in", c.h},
        });
    }
    return arr.dump();
}

void write_panels_csv(const std::vector<WallLayout>& layouts, std::ostream& out) {
    out << "panel_name,panel_type,wall_id,x_in,y_in,width_in,height_in,area_in2,rotation_deg,x_ref,cutouts_json\n";
    for (const auto& layout : layouts) {
        for (const auto& p : layout.panels) {
            out << csv_escape(p.name) << "," << panel_type_label(p) << "," << csv_escape(layout.wall_id) << ","
                << format_number(p.x) << "," << format_number(p.y) << "," << format_number(p.w) << ","
                << format_number(p.h) << "," << format_number(p.w * p.h) << ",0,start," << csv_escape(cutouts_json(p))
                << "\n";
        }
    }
}

json panels_to_json(const std::vector<WallLayout>& layouts) {
    json walls = json::array();
    for (const auto& layout : layouts) {
        json panels = json::array();
        for (const auto& p : layout.panels) {
            json cutouts = json::array();
            for (const auto& c : p.cutouts) {
                cutouts.push_back(json{{"id", c.id}, {"type", c.type}, {"x", c.x}, {"y", c.y}, {"w", c.w}, {"h", c.h}});
            }
            panels.push_back(json{
                {"name", p.name},
                {"x", p.x},
                {"y", p.y},
                {"w", p.w},
                {"h", p.h},
                {"cutouts", std::move(cutouts)},
            });
        }
        walls.push_back(json{
            {"wall_id", layout.wall_id},
            {"width_in", layout.width},
            {"height_in", layout.height},
            {"panels", std::move(panels)},
        });
    }
    return json{{"walls", std::move(walls)}};
}

void write_layout_svg(const WallLayout& layout, std::ostream& out) {
    const double W = layout.width;
    const double H = layout.height;
    out << "<svg xmlns='http://www.w3.org/2000/svg' viewBox='0 0 " << format_number(W) << ' ' << format_number(H)
        << "'>\n";
    out << "<title>wall " << xml_escape(layout.wall_id) << "</title>\n";
    svg_rect(out, H, 0.0, 0.0, W, H, "fill='none' stroke='black' stroke-width='0.5'");

    for (const auto& o : layout.openings) {
        const auto& z = o.zone;
        svg_rect(out, H, z.left, z.bottom, z.right - z.left, z.top - z.bottom,
                 o.is_blocker() ? "fill='#f4c7c3' stroke='none'" : "fill='#fff2cc' stroke='none'");
    }
    for (const auto& p : layout.panels) {
        svg_rect(out, H, p.x, p.y, p.w, p.h, "fill='#dde8f5' stroke='#1f4e79' stroke-width='0.25'");
        for (const auto& c : p.cutouts) {
            svg_rect(out, H, p.x + c.x, p.y + c.y, c.w, c.h, "fill='#bfbfbf' stroke='none'");
        }
        out << "<text x='" << format_number(p.x + p.w / 2.0) << "' y='" << format_number(H - (p.y + p.h / 2.0))
            << "' font-size='6' text-anchor='middle'>" << xml_escape(p.name) << "</text>\n";
    }
    for (const auto& o : layout.openings) {
        const auto& r = o.opening;
        svg_rect(out, H, r.x, r.y, r.w, r.h, "fill='none' stroke='#c00000' stroke-width='0.5' stroke-dasharray='2,1'");
    }
    out << "</svg>\n";
}

void write_panels_csv_file(const std::vector<WallLayout>& layouts, const std::string& path) {
    std::ofstream f(path);
    if (!f) {
        throw std::runtime_error("failed to open output: " + path);
    }
    write_panels_csv(layouts, f);
    if (!f) {
        throw std::runtime_error("failed to write output: " + path);
    }
}

void write_panels_json_file(const std::vector<WallLayout>& layouts, const std::string& path) {
    std::ofstream f(path);
    if (!f) {
        throw std::runtime_error("failed to open output: " + path);
    }
    f << panels_to_json(layouts).dump(2) << "\n";
    if (!f) {
        throw std::runtime_error("failed to write output: " + path);
    }
}

void write_layout_svg_file(const WallLayout& layout, const std::string& path) {
    std::ofstream f(path);
    if (!f) {
        throw std::runtime_error("failed to open output: " + path);
    }
    write_layout_svg(layout, f);
    if (!f) {
        throw std::runtime_error("failed to write output: " + path);
    }
}

}  // namespace wallpanel
