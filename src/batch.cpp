#include "wallpanel/batch.hpp"

#include <exception>
#include <map>
#include <string>
#include <utility>

#if defined(_OPENMP)
#include <omp.h>
#endif

namespace wallpanel {
namespace {

int omp_max_threads() {
#if defined(_OPENMP)
    return omp_get_max_threads();
#else
    return 1;
#endif
}

void omp_set_threads(int threads) {
#if defined(_OPENMP)
    if (threads > 0) {
        omp_set_num_threads(threads);
    }
#else
    (void)threads;
#endif
}

}  // namespace

std::vector<WallLayout> process_walls(
    const std::vector<WallInput>& walls,
    const std::vector<OpeningInput>& openings,
    const OptimizerConfig& cfg,
    const BatchOptions& opt
) {
    // Openings are grouped up front so workers only read shared state.
    std::map<std::string, std::vector<Opening>> by_wall;
    for (const auto& o : openings) {
        by_wall[o.host_wall_id].push_back(make_opening(o, cfg));
    }
    const std::vector<Opening> kNoOpenings;

    std::vector<WallLayout> results(walls.size());
    omp_set_threads(opt.threads > 0 ? opt.threads : omp_max_threads());

    const int n = static_cast<int>(walls.size());
#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; ++i) {
        const WallInput& wall = walls[static_cast<size_t>(i)];
        const auto it = by_wall.find(wall.id);
        const std::vector<Opening>& wall_openings = (it == by_wall.end()) ? kNoOpenings : it->second;

        LogOptions log = opt.log;
        log.prefix += "[wall " + wall.id + "]";
        try {
            results[static_cast<size_t>(i)] =
                process_wall(wall.id, wall.width_in, wall.height_in, wall_openings, cfg, log);
        } catch (const std::exception& e) {
            // Exceptions must not leave the parallel region.
            log_warn(log, "layout failed: ", e.what());
            WallLayout failed;
            failed.wall_id = wall.id;
            failed.width = wall.width_in;
            failed.height = wall.height_in;
            results[static_cast<size_t>(i)] = std::move(failed);
        }
    }
    return results;
}

}  // namespace wallpanel
