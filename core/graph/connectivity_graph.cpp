#include "graph/connectivity_graph.hpp"
#include "storage/entity_store.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <string>

namespace landscape {

ConnectivityGraph ConnectivityGraph::fromStore(const EntityStore& store) {
    ConnectivityGraph g;
    for (const Minimum& m : store.minima()) {
        g.addMinimum(m.id);
    }
    for (const TransitionState& ts : store.transitionStates()) {
        g.addTransitionState(ts);
    }
    return g;
}

// ─── Minima ────────────────────────────────────────────────────

bool ConnectivityGraph::addMinimum(MinimumId id) {
    return adjacency_.emplace(id, std::unordered_set<TransitionStateId>{}).second;
}

bool ConnectivityGraph::removeMinimum(MinimumId id) {
    auto it = adjacency_.find(id);
    if (it == adjacency_.end()) return false;

    std::vector<TransitionStateId> incident(it->second.begin(), it->second.end());
    for (auto tsid : incident) {
        removeTransitionState(tsid);
    }
    adjacency_.erase(id);
    return true;
}

std::vector<MinimumId> ConnectivityGraph::getMinimumIds() const {
    std::vector<MinimumId> ids;
    ids.reserve(adjacency_.size());
    for (const auto& [id, _] : adjacency_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ─── Transition states ─────────────────────────────────────────

void ConnectivityGraph::addTransitionState(const TransitionState& ts) {
    if (!adjacency_.count(ts.minimum1))
        throw std::runtime_error("Minimum not found: " + std::to_string(ts.minimum1));
    if (!adjacency_.count(ts.minimum2))
        throw std::runtime_error("Minimum not found: " + std::to_string(ts.minimum2));
    if (transition_states_.count(ts.id))
        throw std::runtime_error("Transition state ID already exists: " + std::to_string(ts.id));

    transition_states_.emplace(ts.id, ts);
    adjacency_[ts.minimum1].insert(ts.id);
    adjacency_[ts.minimum2].insert(ts.id);
}

bool ConnectivityGraph::removeTransitionState(TransitionStateId id) {
    auto it = transition_states_.find(id);
    if (it == transition_states_.end()) return false;

    const TransitionState& ts = it->second;
    if (adjacency_.count(ts.minimum1)) adjacency_[ts.minimum1].erase(id);
    if (adjacency_.count(ts.minimum2)) adjacency_[ts.minimum2].erase(id);

    transition_states_.erase(it);
    return true;
}

const TransitionState* ConnectivityGraph::getTransitionState(TransitionStateId id) const {
    auto it = transition_states_.find(id);
    return it != transition_states_.end() ? &it->second : nullptr;
}

void ConnectivityGraph::mergeMinima(MinimumId keep, MinimumId drop) {
    if (keep == drop) return;
    if (!adjacency_.count(keep))
        throw std::runtime_error("Minimum not found: " + std::to_string(keep));
    auto drop_it = adjacency_.find(drop);
    if (drop_it == adjacency_.end()) return;

    for (auto tsid : drop_it->second) {
        TransitionState& ts = transition_states_.at(tsid);
        if (ts.minimum1 == drop) ts.minimum1 = keep;
        if (ts.minimum2 == drop) ts.minimum2 = keep;
        adjacency_[keep].insert(tsid);
    }
    adjacency_.erase(drop);
}

// ─── Queries ───────────────────────────────────────────────────

std::vector<MinimumId> ConnectivityGraph::neighbors(MinimumId id) const {
    auto it = adjacency_.find(id);
    if (it == adjacency_.end()) return {};

    std::unordered_set<MinimumId> result;
    for (auto tsid : it->second) {
        const TransitionState& ts = transition_states_.at(tsid);
        if (ts.degenerate()) continue;
        result.insert(ts.opposite(id));
    }
    return std::vector<MinimumId>(result.begin(), result.end());
}

std::unordered_map<MinimumId, MinimumId> ConnectivityGraph::bfs(MinimumId start,
                                                                 const MinimumId* target) const {
    std::unordered_map<MinimumId, MinimumId> parent;
    if (!adjacency_.count(start)) return parent;

    std::deque<MinimumId> queue;
    parent.emplace(start, start);
    queue.push_back(start);

    while (!queue.empty()) {
        MinimumId current = queue.front();
        queue.pop_front();
        if (target && current == *target) break;

        for (auto tsid : adjacency_.at(current)) {
            const TransitionState& ts = transition_states_.at(tsid);
            if (ts.degenerate()) continue;
            MinimumId next = ts.opposite(current);
            if (parent.emplace(next, current).second) {
                queue.push_back(next);
            }
        }
    }
    return parent;
}

bool ConnectivityGraph::areConnected(MinimumId a, MinimumId b) const {
    if (!hasMinimum(a) || !hasMinimum(b)) return false;
    if (a == b) return true;
    return bfs(a, &b).count(b) > 0;
}

std::unordered_set<MinimumId> ConnectivityGraph::connectedComponent(MinimumId id) const {
    std::unordered_set<MinimumId> component;
    for (const auto& [m, _] : bfs(id, nullptr)) {
        component.insert(m);
    }
    return component;
}

size_t ConnectivityGraph::componentCount() const {
    std::unordered_set<MinimumId> seen;
    size_t components = 0;
    for (const auto& [id, _] : adjacency_) {
        if (seen.count(id)) continue;
        components++;
        for (const auto& [m, _] : bfs(id, nullptr)) {
            seen.insert(m);
        }
    }
    return components;
}

std::vector<MinimumId> ConnectivityGraph::path(MinimumId a, MinimumId b) const {
    auto parent = bfs(a, &b);
    if (!parent.count(b)) return {};

    std::vector<MinimumId> result;
    for (MinimumId cur = b; ; cur = parent.at(cur)) {
        result.push_back(cur);
        if (cur == a) break;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

void ConnectivityGraph::forEachTransitionState(std::function<void(const TransitionState&)> fn) const {
    for (const auto& [_, ts] : transition_states_) {
        fn(ts);
    }
}

} // namespace landscape
