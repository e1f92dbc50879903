#pragma once

#include "distance/distance_config.hpp"

namespace landscape {

/// Parameters of one double-ended connection run.
struct ConnectConfig {
    DistanceGraphConfig graph;             // distance graph + cache
    InitOptions init;                      // which minima to admit up front

    int max_attempts = 100;                // local connect calls before giving up
    double budget_seconds = 3600.0;        // wall-clock limit for the whole run
    bool merge_minima = false;             // merge near-identical minima instead of connecting
    double max_dist_merge = 0.1;           // only pairs closer than this are merge candidates
    int consistency_check_interval = 10;   // attempts between checkConsistency() passes; 0 = never
};

} // namespace landscape
