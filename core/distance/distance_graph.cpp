#include "distance/distance_graph.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>

namespace landscape {

// ─── WeightedPath ──────────────────────────────────────────────

double WeightedPath::totalWeight() const {
    double sum = 0.0;
    for (double w : weights) sum += w;
    return sum;
}

MinimumPair WeightedPath::weakestLink() const {
    if (weights.empty()) throw std::runtime_error("Path has no edges");
    auto it = std::max_element(weights.begin(), weights.end());
    size_t i = static_cast<size_t>(it - weights.begin());
    return MinimumPair(nodes[i], nodes[i + 1]);
}

double WeightedPath::weakestLinkWeight() const {
    if (weights.empty()) throw std::runtime_error("Path has no edges");
    return *std::max_element(weights.begin(), weights.end());
}

// ─── DistanceGraph ─────────────────────────────────────────────

DistanceGraph::DistanceGraph(EntityStore& store, const ConnectivityGraph& graph,
                             DistanceCache& cache, Diagnostics& diagnostics)
    : store_(store), graph_(&graph), cache_(cache), diagnostics_(diagnostics) {}

const Minimum& DistanceGraph::node(MinimumId id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        throw std::runtime_error("Minimum not in distance graph: " + std::to_string(id));
    return it->second;
}

void DistanceGraph::setWeight(MinimumId a, MinimumId b, double w) {
    adjacency_[a][b] = w;
    adjacency_[b][a] = w;
}

std::vector<MinimumId> DistanceGraph::getNodeIds() const {
    std::vector<MinimumId> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t DistanceGraph::edgeCount() const {
    size_t twice = 0;
    for (const auto& [_, nbrs] : adjacency_) twice += nbrs.size();
    return twice / 2;
}

std::optional<double> DistanceGraph::weight(MinimumId a, MinimumId b) const {
    auto it = adjacency_.find(a);
    if (it == adjacency_.end()) return std::nullopt;
    auto jt = it->second.find(b);
    if (jt == it->second.end()) return std::nullopt;
    return jt->second;
}

// ─── Admission ─────────────────────────────────────────────────

bool DistanceGraph::admit(const Minimum& m) {
    if (hasNode(m.id)) return false;

    std::unordered_map<MinimumId, double> edges;
    size_t mark = cache_.mark();
    try {
        Transaction txn(store_);

        // minima already joined by transition states need no distance
        auto component = graph_->connectedComponent(m.id);
        for (const auto& [other, _] : nodes_) {
            if (component.count(other)) edges.emplace(other, 0.0);
        }
        for (const auto& [other, minimum] : nodes_) {
            if (edges.count(other)) continue;
            edges.emplace(other, distToWeight(cache_.getOrCompute(m, minimum)));
        }

        cache_.flush(false);
        txn.commit();
    } catch (const std::exception& e) {
        cache_.rollbackTo(mark);
        diagnostics_.emit(DiagnosticKind::ADMISSION_ROLLED_BACK, m.id);
        SPDLOG_LOGGER_WARN(diagnostics_.loggerPtr(),
                           "admission of minimum {} rolled back: {}", m.id, e.what());
        throw AdmissionError(m.id, e.what());
    }
    cache_.release(mark);

    nodes_.emplace(m.id, m);
    adjacency_[m.id];
    for (const auto& [other, w] : edges) {
        setWeight(m.id, other, w);
    }
    diagnostics_.emit(DiagnosticKind::MINIMUM_ADMITTED, m.id, 0, static_cast<double>(edges.size()));
    SPDLOG_LOGGER_DEBUG(diagnostics_.loggerPtr(), "admitted minimum {} ({} nodes)",
                        m.id, nodes_.size());
    return true;
}

// ─── Initialization ────────────────────────────────────────────

size_t DistanceGraph::initialize(const Minimum& start, const Minimum& end, InitOptions options) {
    if (!options.load_no_distances) {
        SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(), "loading distances from database");
        cache_.warm();
    }

    cache_.getOrCompute(start, end);
    size_t admitted = 0;
    if (admit(start)) admitted++;
    if (admit(end)) admitted++;

    if (options.load_no_distances) return admitted;

    switch (options.mode) {
        case AdmissionMode::START_END_ONLY:
            break;
        case AdmissionMode::ALL:
            SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(),
                               "adding all minima to distance graph; this might take a while");
            for (MinimumId id : graph_->getMinimumIds()) {
                if (hasNode(id)) continue;
                auto m = store_.getMinimum(id);
                if (!m) continue;
                if (admit(*m)) admitted++;
            }
            break;
        case AdmissionMode::RELEVANT:
            SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(),
                               "adding relevant minima to distance graph");
            admitted += admitRelevant(start, end);
            break;
    }
    return admitted;
}

size_t DistanceGraph::admitRelevant(const Minimum& start, const Minimum& end) {
    double start_end = cache_.getOrCompute(start, end);

    // Filter on cached distances only; nothing is computed here.
    std::vector<MinimumId> relevant;
    size_t count = 0;
    for (MinimumId id : graph_->getMinimumIds()) {
        count++;
        if (hasNode(id)) continue;
        auto d1 = cache_.get(id, start.id);
        if (!d1 || *d1 > start_end) continue;
        auto d2 = cache_.get(id, end.id);
        if (!d2 || *d2 > start_end) continue;

        SPDLOG_LOGGER_DEBUG(diagnostics_.loggerPtr(),
                            "accepting minimum {} {} {} {}", id, *d1, *d2, start_end);
        relevant.push_back(id);
    }

    size_t admitted = 0;
    for (MinimumId id : relevant) {
        auto m = store_.getMinimum(id);
        if (!m) continue;
        if (admit(*m)) admitted++;
    }
    SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(), "found {} relevant minima out of {}",
                       relevant.size(), count);
    return admitted;
}

// ─── Shortest path ─────────────────────────────────────────────

std::optional<WeightedPath> DistanceGraph::shortestPath(MinimumId a, MinimumId b) const {
    // a minimum left out of the graph is a component of its own
    if (!hasNode(a) || !hasNode(b)) return std::nullopt;

    WeightedPath path;
    if (a == b) {
        path.nodes.push_back(a);
        return path;
    }

    using Entry = std::pair<double, MinimumId>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> queue;
    std::unordered_map<MinimumId, double> dist;
    std::unordered_map<MinimumId, MinimumId> parent;

    dist[a] = 0.0;
    queue.emplace(0.0, a);
    while (!queue.empty()) {
        auto [d, u] = queue.top();
        queue.pop();
        if (d > dist[u]) continue;
        if (u == b) break;

        for (const auto& [v, w] : adjacency_.at(u)) {
            double nd = d + w;
            auto it = dist.find(v);
            if (it == dist.end() || nd < it->second) {
                dist[v] = nd;
                parent[v] = u;
                queue.emplace(nd, v);
            }
        }
    }

    if (!parent.count(b)) return std::nullopt;

    for (MinimumId cur = b; cur != a; cur = parent.at(cur)) {
        path.nodes.push_back(cur);
    }
    path.nodes.push_back(a);
    std::reverse(path.nodes.begin(), path.nodes.end());

    path.weights.reserve(path.nodes.size() - 1);
    for (size_t i = 0; i + 1 < path.nodes.size(); i++) {
        path.weights.push_back(adjacency_.at(path.nodes[i]).at(path.nodes[i + 1]));
    }
    return path;
}

// ─── Mutation feed ─────────────────────────────────────────────

bool DistanceGraph::markConnected(MinimumId a, MinimumId b) {
    if (a == b || !hasNode(a) || !hasNode(b)) return false;
    setWeight(a, b, 0.0);
    return true;
}

bool DistanceGraph::markUnproductive(MinimumId a, MinimumId b) {
    auto w = weight(a, b);
    if (!w) return false;
    // never overwrite a known connection
    if (*w < config().unproductive_zero_tolerance) return false;
    if (*w == config().infinite_weight) return false;
    setWeight(a, b, config().infinite_weight);
    return true;
}

void DistanceGraph::merge(MinimumId keep, MinimumId drop) {
    if (keep == drop) return;

    auto drop_it = adjacency_.find(drop);
    if (drop_it != adjacency_.end()) {
        if (!hasNode(keep)) {
            auto m = store_.getMinimum(keep);
            if (!m) throw std::runtime_error("Minimum not found: " + std::to_string(keep));
            nodes_.emplace(keep, *m);
            adjacency_[keep];
        }

        std::unordered_map<MinimumId, double> drop_edges = std::move(drop_it->second);
        adjacency_.erase(drop);
        nodes_.erase(drop);

        for (const auto& [other, w_drop] : drop_edges) {
            adjacency_[other].erase(drop);
            if (other == keep) continue;
            auto w_keep = weight(keep, other);
            setWeight(keep, other, w_keep ? std::min(*w_keep, w_drop) : w_drop);
        }
    }

    cache_.repoint(keep, drop);
    diagnostics_.emit(DiagnosticKind::MINIMA_MERGED, keep, drop);
    SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(), "merged minimum {} into {}", drop, keep);
}

// ─── Consistency ───────────────────────────────────────────────

std::unordered_map<MinimumId, size_t> DistanceGraph::componentLabels() const {
    std::unordered_map<MinimumId, size_t> labels;
    size_t next = 0;
    for (MinimumId id : getNodeIds()) {
        if (labels.count(id)) continue;
        size_t label = next++;
        labels[id] = label;
        for (MinimumId member : graph_->connectedComponent(id)) {
            if (hasNode(member)) labels[member] = label;
        }
    }
    return labels;
}

ConsistencyReport DistanceGraph::checkConsistency() {
    SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(), "checking distance graph");
    const DistanceGraphConfig& cfg = config();
    ConsistencyReport report;

    auto labels = componentLabels();
    std::vector<std::pair<MinimumId, MinimumId>> edges;
    for (const auto& [u, nbrs] : adjacency_) {
        for (const auto& [v, _] : nbrs) {
            if (u < v) edges.emplace_back(u, v);
        }
    }
    std::sort(edges.begin(), edges.end());

    for (const auto& [u, v] : edges) {
        report.edges_checked++;
        double w = adjacency_.at(u).at(v);
        bool connected = labels.at(u) == labels.at(v);
        bool zero_weight = w < cfg.zero_weight_tolerance;

        if (connected && !zero_weight) {
            // only a problem if no zero-weight detour exists
            auto path = shortestPath(u, v);
            double path_weight = path ? path->totalWeight()
                                      : std::numeric_limits<double>::infinity();
            if (path_weight > cfg.path_zero_tolerance) {
                report.connected_repaired++;
                auto dist = cache_.get(u, v);
                SPDLOG_LOGGER_WARN(diagnostics_.loggerPtr(),
                    "problem: {} and {} are connected but weight {} dist {} path weight {}",
                    u, v, w, dist ? *dist : -1.0, path_weight);
                diagnostics_.emit(DiagnosticKind::INCONSISTENCY_REPAIRED, u, v, w);
            } else {
                report.redundant_zeroed++;
            }
            setWeight(u, v, 0.0);
        } else if (!connected && zero_weight) {
            report.disconnected_repaired++;
            double dist = cache_.getOrCompute(node(u), node(v));
            SPDLOG_LOGGER_WARN(diagnostics_.loggerPtr(),
                "problem: {} and {} are not connected but weight {} dist {}",
                u, v, w, dist);
            setWeight(u, v, distToWeight(dist));
            diagnostics_.emit(DiagnosticKind::INCONSISTENCY_REPAIRED, u, v, w);
        }
    }

    if (report.inconsistencies() > 0) {
        SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(), "found {} inconsistencies in distance graph",
                           report.inconsistencies());
    }
    diagnostics_.recordConsistencyPass(report.inconsistencies(),
                                       cfg.repeated_inconsistency_warning);
    return report;
}

} // namespace landscape
