#pragma once

#include <cstddef>

namespace landscape {

/// Distance graph and distance cache parameters.
struct DistanceGraphConfig {
    double infinite_weight = 1e20;              // weight of pairs never to retry
    double zero_weight_tolerance = 1e-10;       // direct edge counts as zero below this
    double path_zero_tolerance = 1e-5;          // path sum counts as zero below this
    double unproductive_zero_tolerance = 1e-6;  // markUnproductive keeps weights below this
    bool defer_database_update = true;          // buffer new distances, write in bulk
    size_t db_update_min = 300;                 // buffered distances before a bulk write
    int verbosity = 0;                          // >1 logs every computed distance
    size_t repeated_inconsistency_warning = 3;  // consecutive bad checks before a warning
};

/// Which minima initialize() admits besides start and end.
enum class AdmissionMode {
    START_END_ONLY,
    RELEVANT,       // cached d(m,s) and d(m,e) both <= d(s,e)
    ALL             // every known minimum; expensive
};

struct InitOptions {
    AdmissionMode mode = AdmissionMode::RELEVANT;
    bool load_no_distances = false;  // skip warming the cache and any extra admission
};

} // namespace landscape
