#pragma once

#include <vector>

#include "wallpanel/config.hpp"
#include "wallpanel/logging.hpp"
#include "wallpanel/wall_import.hpp"
#include "wallpanel/wall_processor.hpp"

namespace wallpanel {

struct BatchOptions {
    int threads = 0;  // <= 0 -> OpenMP default
    LogOptions log;   // prefix is extended with the wall id per worker
};

// Runs process_wall for every wall with the openings hosted on it. Walls are independent and run in
// parallel when built with OpenMP; result i always belongs to walls[i].
std::vector<WallLayout> process_walls(
    const std::vector<WallInput>& walls,
    const std::vector<OpeningInput>& openings,
    const OptimizerConfig& cfg,
    const BatchOptions& opt = {}
);

}  // namespace wallpanel
