#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "wallpanel/config.hpp"

namespace {

struct Args {
    std::string preset;
    std::string check;
    std::string out;
};

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

        if (a == "--preset") {
            args.preset = need("--preset");
        } else if (a == "--check") {
            args.check = need("--check");
        } else if (a == "--out") {
            args.out = need("--out");
        } else if (a == "-h" || a == "--help") {
            std::cout << "Usage: wallpanel_config --preset vertical|horizontal [--out cfg.json]\n"
                      << "       wallpanel_config --check cfg.json\n";
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    if (args.preset.empty() == args.check.empty()) {
        throw std::runtime_error("exactly one of --preset or --check is required");
    }
    return args;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);

        if (!args.preset.empty()) {
            const auto cfg = wallpanel::preset_config(args.preset);
            if (args.out.empty()) {
                wallpanel::save_config_json(cfg, std::cout);
            } else {
                wallpanel::save_config_file(cfg, args.out);
                std::cout << "wrote " << args.out << "\n";
            }
            return 0;
        }

        const auto cfg = wallpanel::load_config_file(args.check);
        const auto issues = wallpanel::validate_config(cfg);
        for (const auto& issue : issues) {
            std::cout << (issue.is_error ? "error: " : "warning: ") << issue.message << "\n";
        }
        if (wallpanel::has_errors(issues)) {
            return 1;
        }
        std::cout << cfg.project_name << ": ok (" << wallpanel::orientation_name(cfg.orientation) << ")\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
