#pragma once

#include "landscape/types.hpp"

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace landscape {

class EntityStore;

// ─── Connectivity Graph ────────────────────────────────────────
// Undirected multigraph of known minima (nodes) and transition states
// (edges). Adjacency-list backed by unordered_maps for O(1) access.
// Degenerate transition states (both ends equal) are stored but never
// traversed.

class ConnectivityGraph {
public:
    ConnectivityGraph() = default;

    /// Build from every minimum and transition state in the store.
    static ConnectivityGraph fromStore(const EntityStore& store);

    // ── Minima ──
    bool addMinimum(MinimumId id);
    bool removeMinimum(MinimumId id);
    bool hasMinimum(MinimumId id) const { return adjacency_.count(id) > 0; }
    std::vector<MinimumId> getMinimumIds() const;
    size_t minimumCount() const { return adjacency_.size(); }

    // ── Transition states ──
    void addTransitionState(const TransitionState& ts);
    bool removeTransitionState(TransitionStateId id);
    const TransitionState* getTransitionState(TransitionStateId id) const;
    size_t transitionStateCount() const { return transition_states_.size(); }

    /// Repoint every transition state of `drop` onto `keep`, then remove `drop`.
    void mergeMinima(MinimumId keep, MinimumId drop);

    // ── Queries ──

    /// Minima joined to `id` by a single non-degenerate transition state.
    std::vector<MinimumId> neighbors(MinimumId id) const;

    /// false if either minimum is unknown.
    bool areConnected(MinimumId a, MinimumId b) const;

    /// All minima reachable from `id`, including itself. Empty if unknown.
    std::unordered_set<MinimumId> connectedComponent(MinimumId id) const;

    /// Number of connected components.
    size_t componentCount() const;

    /// Sequence of minima from `a` to `b` with the fewest transition states.
    /// Empty if they are not connected.
    std::vector<MinimumId> path(MinimumId a, MinimumId b) const;

    void forEachTransitionState(std::function<void(const TransitionState&)> fn) const;

private:
    // Breadth-first search from `start`; stops early once `target` is seen.
    // Returns the predecessor map of every visited minimum.
    std::unordered_map<MinimumId, MinimumId> bfs(MinimumId start, const MinimumId* target) const;

    std::unordered_map<TransitionStateId, TransitionState> transition_states_;

    // minimum id → ids of incident transition states
    std::unordered_map<MinimumId, std::unordered_set<TransitionStateId>> adjacency_;
};

} // namespace landscape
