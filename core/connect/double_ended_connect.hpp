#pragma once

#include "connect/connect_config.hpp"
#include "connect/local_connector.hpp"
#include "diagnostics/diagnostics.hpp"
#include "distance/distance_cache.hpp"
#include "distance/distance_function.hpp"
#include "distance/distance_graph.hpp"
#include "graph/connectivity_graph.hpp"
#include "storage/entity_store.hpp"

#include <cstddef>
#include <vector>

namespace landscape {

/// Result of a connection run.
struct ConnectResult {
    bool success = false;
    int attempts = 0;                     // LocalConnector::connect() calls
    int merges = 0;
    size_t transition_states_added = 0;
    size_t minima_added = 0;
    std::vector<MinimumId> path;          // start → end through transition states, if success
    double elapsed_seconds = 0.0;
    bool budget_exhausted = false;
};

// ─── Double-Ended Connect ──────────────────────────────────────
// Repeatedly asks the distance graph for the most promising unconnected
// pair on the way from start to end, runs the local connector on it and
// feeds the transition states it finds back into both graphs, until start
// and end share a component of the connectivity graph or the budget runs out.

class DoubleEndedConnect {
public:
    DoubleEndedConnect(EntityStore& store, const DistanceFunction& distance_fn,
                       LocalConnector& connector, DuplicatePredicate is_duplicate,
                       ConnectConfig config, Diagnostics& diagnostics);

    DoubleEndedConnect(const DoubleEndedConnect&) = delete;
    DoubleEndedConnect& operator=(const DoubleEndedConnect&) = delete;

    /// Throws std::invalid_argument if either minimum is not in the store.
    ConnectResult run(MinimumId start, MinimumId end);

    const ConnectivityGraph& connectivityGraph() const { return graph_; }
    const DistanceGraph& distanceGraph() const { return distance_graph_; }
    const DistanceCache& cache() const { return cache_; }
    const ConnectConfig& config() const { return config_; }

private:
    /// Merge a and b if they are close enough and the predicate agrees.
    /// Returns the surviving minimum, or 0 if nothing was merged.
    MinimumId tryMerge(MinimumId a, MinimumId b);

    /// Store a found transition state and its minima, update both graphs.
    void addFound(const FoundTransitionState& found, ConnectResult& result);

    Minimum fetch(MinimumId id) const;

    EntityStore& store_;
    LocalConnector& connector_;
    DuplicatePredicate is_duplicate_;
    ConnectConfig config_;
    Diagnostics& diagnostics_;

    ConnectivityGraph graph_;
    DistanceCache cache_;
    DistanceGraph distance_graph_;
};

} // namespace landscape
