#include "connect/double_ended_connect.hpp"
#include "connect/connect_budget.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace landscape {

DoubleEndedConnect::DoubleEndedConnect(EntityStore& store, const DistanceFunction& distance_fn,
                                       LocalConnector& connector, DuplicatePredicate is_duplicate,
                                       ConnectConfig config, Diagnostics& diagnostics)
    : store_(store),
      connector_(connector),
      is_duplicate_(std::move(is_duplicate)),
      config_(std::move(config)),
      diagnostics_(diagnostics),
      graph_(ConnectivityGraph::fromStore(store)),
      cache_(store, distance_fn, diagnostics, config_.graph),
      distance_graph_(store, graph_, cache_, diagnostics) {}

Minimum DoubleEndedConnect::fetch(MinimumId id) const {
    auto m = store_.getMinimum(id);
    if (!m) throw std::invalid_argument("Minimum not found: " + std::to_string(id));
    return *m;
}

ConnectResult DoubleEndedConnect::run(MinimumId start, MinimumId end) {
    ConnectResult result;
    ConnectBudget budget(config_.budget_seconds, config_.max_attempts);
    budget.start();

    Minimum start_min = fetch(start);
    Minimum end_min = fetch(end);
    graph_.addMinimum(start);
    graph_.addMinimum(end);

    size_t admitted = distance_graph_.initialize(start_min, end_min, config_.init);
    SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(),
                       "connecting {} and {}: {} minima in the distance graph",
                       start, end, admitted);

    while (!graph_.areConnected(start, end)) {
        ConnectBudget::Limit limit = budget.exhausted();
        if (limit != ConnectBudget::Limit::NONE) {
            SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(), "stopping: {} reached after {:.1f}s",
                               limitName(limit), budget.elapsedSeconds());
            result.budget_exhausted = true;
            break;
        }

        auto path = distance_graph_.shortestPath(start, end);
        if (!path || path->nodes.size() < 2) {
            SPDLOG_LOGGER_WARN(diagnostics_.loggerPtr(), "no path between {} and {}", start, end);
            break;
        }
        if (path->weakestLinkWeight() >= config_.graph.infinite_weight) {
            SPDLOG_LOGGER_WARN(diagnostics_.loggerPtr(),
                               "every path from {} to {} crosses an unproductive pair", start, end);
            break;
        }

        if (path->weakestLinkWeight() < config_.graph.zero_weight_tolerance) {
            // all-zero path between unconnected minima: the distance graph is stale
            if (distance_graph_.checkConsistency().consistent()) break;
            continue;
        }

        MinimumPair link = path->weakestLink();
        MinimumId a = link.first;
        MinimumId b = link.second;

        if (config_.merge_minima) {
            MinimumId keep = tryMerge(a, b);
            if (keep != 0) {
                result.merges++;
                if (start == a || start == b) start = keep;
                if (end == a || end == b) end = keep;
                continue;
            }
        }

        budget.recordAttempt();
        SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(),
                           "attempt {} ({} left): connecting {} and {} (weight {:.6g})",
                           budget.attempts(), budget.remainingAttempts(), a, b,
                           path->weakestLinkWeight());

        LocalConnectResult found = connector_.connect(fetch(a), fetch(b));
        for (const auto& ts : found.transition_states) {
            addFound(ts, result);
        }

        if (graph_.areConnected(a, b)) {
            // possibly joined through minima outside the distance graph
            distance_graph_.markConnected(a, b);
        } else {
            distance_graph_.markUnproductive(a, b);
            SPDLOG_LOGGER_DEBUG(diagnostics_.loggerPtr(), "{} and {} marked unproductive", a, b);
        }

        if (config_.consistency_check_interval > 0 &&
            budget.attempts() % config_.consistency_check_interval == 0) {
            distance_graph_.flushPending(true);
            distance_graph_.checkConsistency();
        }
    }

    distance_graph_.flushPending(true);

    result.attempts = budget.attempts();
    result.elapsed_seconds = budget.elapsedSeconds();
    result.success = graph_.areConnected(start, end);
    if (result.success) {
        result.path = graph_.path(start, end);
        SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(),
                           "found a path from {} to {} through {} minima after {} attempts",
                           start, end, result.path.size(), result.attempts);
    } else {
        SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(),
                           "failed to connect {} and {} after {} attempts",
                           start, end, result.attempts);
    }
    return result;
}

MinimumId DoubleEndedConnect::tryMerge(MinimumId a, MinimumId b) {
    auto dist = cache_.get(a, b);
    if (!dist || *dist >= config_.max_dist_merge) return 0;

    Minimum ma = fetch(a);
    Minimum mb = fetch(b);
    if (is_duplicate_ && !is_duplicate_(ma, mb)) return 0;

    MinimumId keep = ma.energy <= mb.energy ? a : b;
    MinimumId drop = keep == a ? b : a;

    store_.mergeMinima(keep, drop);
    graph_.mergeMinima(keep, drop);
    distance_graph_.merge(keep, drop);
    return keep;
}

void DoubleEndedConnect::addFound(const FoundTransitionState& found, ConnectResult& result) {
    Minimum m1 = store_.addMinimum(found.minimum1.energy, found.minimum1.coords);
    Minimum m2 = store_.addMinimum(found.minimum2.energy, found.minimum2.coords);

    std::vector<Minimum> created;
    for (const Minimum* m : {&m1, &m2}) {
        if (graph_.addMinimum(m->id)) {
            created.push_back(*m);
            result.minima_added++;
        }
    }

    TransitionState ts = store_.addTransitionState(found.energy, found.coords, m1.id, m2.id);
    graph_.addTransitionState(ts);
    result.transition_states_added++;

    for (const auto& m : created) {
        try {
            distance_graph_.admit(m);
        } catch (const AdmissionError& e) {
            // The minimum stays in the store and the connectivity graph.
            SPDLOG_LOGGER_ERROR(diagnostics_.loggerPtr(), "{}", e.what());
        }
    }

    distance_graph_.markConnected(m1.id, m2.id);
}

} // namespace landscape
