#pragma once

#include "landscape/types.hpp"
#include "distance/distance_cache.hpp"
#include "distance/distance_config.hpp"
#include "diagnostics/diagnostics.hpp"
#include "graph/connectivity_graph.hpp"
#include "storage/entity_store.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace landscape {

/// Admission was aborted and rolled back. The graph, the cache and the
/// store are as they were before the call.
class AdmissionError : public std::runtime_error {
public:
    AdmissionError(MinimumId minimum, const std::string& cause)
        : std::runtime_error("Admission of minimum " + std::to_string(minimum) +
                             " rolled back: " + cause),
          minimum_(minimum) {}

    MinimumId minimum() const { return minimum_; }

private:
    MinimumId minimum_;
};

/// Lowest-weight path through the distance graph.
struct WeightedPath {
    std::vector<MinimumId> nodes;
    std::vector<double> weights;  // weights[i] joins nodes[i] and nodes[i+1]

    double totalWeight() const;

    /// The pair joined by the heaviest edge: the next pair worth trying to
    /// connect directly. Throws if the path has no edges.
    MinimumPair weakestLink() const;
    double weakestLinkWeight() const;
};

/// Outcome of one checkConsistency() pass.
struct ConsistencyReport {
    size_t edges_checked = 0;
    size_t redundant_zeroed = 0;       // connected, nonzero edge, zero path already
    size_t connected_repaired = 0;     // connected but no zero path
    size_t disconnected_repaired = 0;  // zero edge between unconnected minima

    size_t inconsistencies() const { return connected_repaired + disconnected_repaired; }
    bool consistent() const { return inconsistencies() == 0; }
};

// ─── Distance Graph ────────────────────────────────────────────
// Complete weighted graph over the admitted minima, used to choose
// which pair of minima to try to connect next. Edge weight between u
// and v is
//
//     0                 if u and v are known to be connected
//     infinite_weight   if connecting u and v was tried and failed
//     dist(u, v)^2      otherwise
//
// If u and v share a component of the connectivity graph, the lowest
// weight path between them must be 0; checkConsistency() restores that
// after the connectivity graph has changed underneath.

class DistanceGraph {
public:
    /// Weights and tolerances come from cache.config().
    DistanceGraph(EntityStore& store, const ConnectivityGraph& graph,
                  DistanceCache& cache, Diagnostics& diagnostics);

    void setConnectivityGraph(const ConnectivityGraph& graph) { graph_ = &graph; }

    /// Warm the cache, admit start and end, then admit further minima
    /// according to options.mode. Returns the number of minima admitted
    /// by this call.
    size_t initialize(const Minimum& start, const Minimum& end, InitOptions options = {});

    /// Add a node for `m` with an edge to every admitted node. Atomic:
    /// throws AdmissionError with nothing changed if any step fails.
    /// Returns false if `m` was already admitted.
    bool admit(const Minimum& m);

    /// Dijkstra over the edge weights. std::nullopt if no path joins a and
    /// b, which includes either of them not being admitted.
    std::optional<WeightedPath> shortestPath(MinimumId a, MinimumId b) const;

    /// Zero the edge between two admitted minima joined by a new
    /// transition state. Returns false if either is not admitted.
    bool markConnected(MinimumId a, MinimumId b);

    /// Set the edge to infinite_weight so the pair is not suggested again.
    /// Zero edges are left alone. Returns whether the weight changed.
    bool markUnproductive(MinimumId a, MinimumId b);

    /// Fold `drop` into `keep`. Each keep-x edge takes the lower of the
    /// keep-x and drop-x weights; `drop` leaves the graph and the cache.
    void merge(MinimumId keep, MinimumId drop);

    ConsistencyReport checkConsistency();

    size_t flushPending(bool force = false) { return cache_.flush(force); }

    double distToWeight(double dist) const { return dist * dist; }

    // ── Inspection ──
    bool hasNode(MinimumId id) const { return nodes_.count(id) > 0; }
    std::vector<MinimumId> getNodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const;
    std::optional<double> weight(MinimumId a, MinimumId b) const;

    const DistanceGraphConfig& config() const { return cache_.config(); }

private:
    size_t admitRelevant(const Minimum& start, const Minimum& end);
    void setWeight(MinimumId a, MinimumId b, double w);
    const Minimum& node(MinimumId id) const;

    // Connectivity-graph component label of every admitted node.
    std::unordered_map<MinimumId, size_t> componentLabels() const;

    EntityStore& store_;
    const ConnectivityGraph* graph_;
    DistanceCache& cache_;
    Diagnostics& diagnostics_;

    std::unordered_map<MinimumId, Minimum> nodes_;
    std::unordered_map<MinimumId, std::unordered_map<MinimumId, double>> adjacency_;
};

} // namespace landscape
