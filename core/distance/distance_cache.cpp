#include "distance/distance_cache.hpp"

#include <unordered_set>
#include <utility>

namespace landscape {

DistanceCache::DistanceCache(EntityStore& store, const DistanceFunction& distance_fn,
                             Diagnostics& diagnostics, DistanceGraphConfig config)
    : store_(store), distance_fn_(distance_fn),
      diagnostics_(diagnostics), config_(config) {}

std::optional<double> DistanceCache::get(MinimumId a, MinimumId b) const {
    auto it = distances_.find(MinimumPair(a, b));
    if (it == distances_.end()) return std::nullopt;
    return it->second;
}

double DistanceCache::getOrCompute(const Minimum& a, const Minimum& b) {
    if (a.id == b.id) return 0.0;
    if (auto known = get(a.id, b.id)) return *known;

    // realigned coordinates are not needed here
    double dist = distance_fn_.compute(a.coords, b.coords).distance;
    computed_++;
    if (config_.verbosity > 1) {
        SPDLOG_LOGGER_DEBUG(diagnostics_.loggerPtr(),
                            "calculated distance between {} {} {}", a.id, b.id, dist);
    }
    record(a.id, b.id, dist);
    diagnostics_.emit(DiagnosticKind::DISTANCE_COMPUTED, a.id, b.id, dist);
    return dist;
}

bool DistanceCache::record(MinimumId a, MinimumId b, double distance) {
    MinimumPair pair(a, b);
    if (!distances_.emplace(pair, distance).second) return false;

    if (config_.defer_database_update) {
        pending_.emplace(pair, distance);
    } else {
        try {
            store_.setDistanceBulk({DistanceEntry(pair, distance)});
        } catch (const StoreError&) {
            distances_.erase(pair);
            throw;
        }
    }
    if (open_marks_ > 0) journal_.push_back(pair);
    return true;
}

size_t DistanceCache::flush(bool force) {
    size_t n = pending_.size();
    if (n == 0) return 0;
    if (!force && n < config_.db_update_min) return 0;

    SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(), "updating database with {} new distances", n);
    std::vector<DistanceEntry> entries;
    entries.reserve(n);
    for (const auto& [pair, dist] : pending_) {
        entries.emplace_back(pair, dist);
    }
    store_.setDistanceBulk(entries);
    pending_.clear();
    if (open_marks_ > 0) {
        unconfirmed_.insert(unconfirmed_.end(), entries.begin(), entries.end());
    }
    diagnostics_.emit(DiagnosticKind::DISTANCES_FLUSHED, 0, 0, static_cast<double>(n));
    return n;
}

size_t DistanceCache::warm() {
    size_t loaded = 0;
    for (const DistanceEntry& entry : store_.distances()) {
        if (distances_.emplace(entry.pair, entry.distance).second) loaded++;
    }
    SPDLOG_LOGGER_INFO(diagnostics_.loggerPtr(), "loaded {} distances from database", loaded);
    return loaded;
}

void DistanceCache::repoint(MinimumId keep, MinimumId drop) {
    if (keep == drop) return;

    std::vector<std::pair<MinimumPair, double>> moved_pending;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->first.contains(drop)) {
            moved_pending.emplace_back(it->first, it->second);
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }

    std::vector<std::pair<MinimumPair, double>> moved;
    for (auto it = distances_.begin(); it != distances_.end();) {
        if (it->first.contains(drop)) {
            moved.emplace_back(it->first, it->second);
            it = distances_.erase(it);
        } else {
            ++it;
        }
    }

    std::unordered_set<MinimumPair, MinimumPairHash> inserted;
    for (const auto& [pair, dist] : moved) {
        MinimumId other = pair.other(drop);
        if (other == keep) continue;
        MinimumPair repointed(keep, other);
        if (distances_.emplace(repointed, dist).second) inserted.insert(repointed);
    }
    // Persisted entries are repointed by the store's own merge; only the
    // unwritten ones need to follow into the buffer.
    for (const auto& [pair, dist] : moved_pending) {
        MinimumPair repointed(keep, pair.other(drop));
        if (inserted.count(repointed)) pending_.emplace(repointed, dist);
    }
}

// ─── Journal ───────────────────────────────────────────────────

size_t DistanceCache::mark() {
    open_marks_++;
    return journal_.size();
}

void DistanceCache::rollbackTo(size_t mark) {
    while (journal_.size() > mark) {
        MinimumPair pair = journal_.back();
        journal_.pop_back();
        distances_.erase(pair);
        pending_.erase(pair);
    }
    // Entries flushed inside the scope were written to a store transaction
    // that is being rolled back with us; buffer the survivors again.
    for (const DistanceEntry& entry : unconfirmed_) {
        if (distances_.count(entry.pair)) pending_.emplace(entry.pair, entry.distance);
    }
    unconfirmed_.clear();
    release(mark);
}

void DistanceCache::release(size_t /*mark*/) {
    if (open_marks_ > 0) open_marks_--;
    if (open_marks_ == 0) {
        journal_.clear();
        unconfirmed_.clear();
    }
}

} // namespace landscape
