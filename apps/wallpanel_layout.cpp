#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "wallpanel/batch.hpp"
#include "wallpanel/config.hpp"
#include "wallpanel/csv_table.hpp"
#include "wallpanel/layout_stats.hpp"
#include "wallpanel/panel_export.hpp"
#include "wallpanel/wall_import.hpp"

namespace {

struct Args {
    std::string walls_csv;
    std::string openings_csv;
    std::string config_json;
    std::string preset = "vertical";
    std::string orientation;  // overrides config when set
    double spacing = -1.0;    // overrides config when >= 0
    double increment = -1.0;  // overrides config when > 0
    std::string out_dir = ".";
    std::string output_name = "optimized_panel_placement.csv";
    std::string out_json;
    std::string svg_dir;  // one wall_<id>_layout.svg per wall when set
    int threads = 0;
    int verbose = wallpanel::kLogWarn;
    bool save_config = true;
};

void print_usage() {
    std::cout << "Usage: wallpanel_layout --walls walls.csv [--openings wall_openings.csv]\n"
              << "                        [--config cfg.json | --preset vertical|horizontal]\n"
              << "                        [--orientation vertical|horizontal] [--spacing in] [--increment in]\n"
              << "                        [--out-dir DIR] [--output-name name.csv] [--json panels.json]\n"
              << "                        [--svg-dir DIR] [--threads N] [--verbose 0|1|2] [--no-save-config]\n";
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need = [&](const char* flag) {
            if (i + 1 >= argc) {
                throw std::runtime_error(std::string("missing value for ") + flag);
            }
            return std::string(argv[++i]);
        };

        if (a == "--walls") {
            args.walls_csv = need("--walls");
        } else if (a == "--openings") {
            args.openings_csv = need("--openings");
        } else if (a == "--config") {
            args.config_json = need("--config");
        } else if (a == "--preset") {
            args.preset = need("--preset");
        } else if (a == "--orientation") {
            args.orientation = need("--orientation");
        } else if (a == "--spacing") {
            args.spacing = std::stod(need("--spacing"));
        } else if (a == "--increment") {
            args.increment = std::stod(need("--increment"));
        } else if (a == "--out-dir") {
            args.out_dir = need("--out-dir");
        } else if (a == "--output-name") {
            args.output_name = need("--output-name");
        } else if (a == "--json") {
            args.out_json = need("--json");
        } else if (a == "--svg-dir") {
            args.svg_dir = need("--svg-dir");
        } else if (a == "--threads") {
            args.threads = std::stoi(need("--threads"));
        } else if (a == "--verbose") {
            args.verbose = std::stoi(need("--verbose"));
        } else if (a == "--save-config") {
            args.save_config = true;
        } else if (a == "--no-save-config") {
            args.save_config = false;
        } else if (a == "-h" || a == "--help") {
            print_usage();
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    if (args.walls_csv.empty()) {
        throw std::runtime_error("missing --walls");
    }
    return args;
}

wallpanel::OptimizerConfig resolve_config(const Args& args) {
    wallpanel::OptimizerConfig cfg = args.config_json.empty() ? wallpanel::preset_config(args.preset)
                                                              : wallpanel::load_config_file(args.config_json);
    if (!args.orientation.empty()) {
        cfg.orientation = wallpanel::parse_orientation(args.orientation);
    }
    if (args.spacing >= 0.0) {
        cfg.panel.panel_spacing = args.spacing;
    }
    if (args.increment > 0.0) {
        cfg.panel.dimension_increment = args.increment;
    }
    return cfg;
}

std::string svg_file_name(const std::string& wall_id) {
    std::string safe = wall_id;
    for (char& ch : safe) {
        if (!std::isalnum(static_cast<unsigned char>(ch))) {
            ch = '_';
        }
    }
    return "wall_" + safe + "_layout.svg";
}

wallpanel::CsvTable read_table(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("failed to open: " + path);
    }
    return wallpanel::read_csv_rows(f);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        const wallpanel::OptimizerConfig cfg = resolve_config(args);

        const auto issues = wallpanel::validate_config(cfg);
        for (const auto& issue : issues) {
            std::cerr << (issue.is_error ? "config error: " : "config warning: ") << issue.message << "\n";
        }
        if (wallpanel::has_errors(issues)) {
            throw std::runtime_error("invalid configuration");
        }

        wallpanel::ImportReport report;
        const auto walls = wallpanel::import_walls(read_table(args.walls_csv), report);

        std::vector<wallpanel::OpeningInput> openings;
        if (!args.openings_csv.empty()) {
            std::ifstream f(args.openings_csv);
            if (f) {
                openings = wallpanel::import_openings(wallpanel::read_csv_rows(f), report);
            } else {
                std::cerr << "warning: openings file not found: " << args.openings_csv << "\n";
            }
        }
        if (args.verbose >= wallpanel::kLogWarn) {
            for (const auto& w : report.warnings) {
                std::cerr << "warning: " << w << "\n";
            }
        }
        std::cout << "Loaded " << walls.size() << " walls (" << report.skipped_walls << " skipped), "
                  << openings.size() << " openings (" << report.skipped_openings << " skipped)\n";
        std::cout << "Config: " << cfg.project_name << ", orientation=" << wallpanel::orientation_name(cfg.orientation)
                  << "\n";

        wallpanel::BatchOptions bopt;
        bopt.threads = args.threads;
        bopt.log.verbosity = args.verbose;
        const auto layouts = wallpanel::process_walls(walls, openings, cfg, bopt);

        std::cout << std::fixed << std::setprecision(3);
        for (const auto& l : layouts) {
            const auto st = wallpanel::layout_stats(l);
            std::cout << "wall " << l.wall_id << ": " << l.width << "x" << l.height << " in, " << st.panel_count
                      << " panels, " << st.cutout_count << " cutouts, coverage " << st.coverage() << "\n";
        }
        const auto total = wallpanel::total_stats(layouts);
        if (total.panel_count == 0) {
            throw std::runtime_error("no panels generated for any wall");
        }

        const std::filesystem::path out_dir(args.out_dir);
        std::filesystem::create_directories(out_dir);
        const std::filesystem::path csv_path = out_dir / args.output_name;
        wallpanel::write_panels_csv_file(layouts, csv_path.string());
        if (!args.out_json.empty()) {
            wallpanel::write_panels_json_file(layouts, args.out_json);
        }
        if (!args.svg_dir.empty()) {
            const std::filesystem::path svg_dir(args.svg_dir);
            std::filesystem::create_directories(svg_dir);
            for (const auto& l : layouts) {
                wallpanel::write_layout_svg_file(l, (svg_dir / svg_file_name(l.wall_id)).string());
            }
        }
        if (args.save_config) {
            wallpanel::save_config_file(cfg, (csv_path.parent_path() / "config_used.json").string());
        }

        std::cout << "total: " << total.panel_count << " panels, " << total.cutout_count << " cutouts, coverage "
                  << total.coverage() << "\n";
        std::cout << "wrote " << csv_path.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
