#pragma once

#include "landscape/types.hpp"
#include "distance/distance_config.hpp"
#include "distance/distance_function.hpp"
#include "diagnostics/diagnostics.hpp"
#include "storage/entity_store.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace landscape {

// ─── Distance Cache ────────────────────────────────────────────
// Memoized symmetric distances between minima. New distances are
// buffered and written to the entity store in bulk (see flush()), or
// written through immediately when defer_database_update is off.
//
// A known distance is never recomputed or overwritten.

class DistanceCache {
public:
    DistanceCache(EntityStore& store, const DistanceFunction& distance_fn,
                  Diagnostics& diagnostics, DistanceGraphConfig config = {});

    /// Cached distance, either ordering. Never computes.
    std::optional<double> get(MinimumId a, MinimumId b) const;
    bool contains(MinimumId a, MinimumId b) const { return get(a, b).has_value(); }

    /// Cached distance, or compute it with the distance function and record it.
    double getOrCompute(const Minimum& a, const Minimum& b);

    /// Store a distance. Returns false if the pair was already known.
    bool record(MinimumId a, MinimumId b, double distance);

    /// Write buffered distances to the store. Without `force` nothing is
    /// written until db_update_min entries are buffered. Returns the number
    /// written. On a store failure the buffer is kept.
    size_t flush(bool force = false);

    /// Load every distance persisted in the store. Returns the count loaded.
    size_t warm();

    /// Move every entry that mentions `drop` onto `keep`. Entries already
    /// known for `keep` win; the (keep, drop) entry is discarded.
    void repoint(MinimumId keep, MinimumId drop);

    // ── Journal, used to undo a failed admission ──

    /// Start recording new entries. Returns a mark for rollbackTo/release.
    size_t mark();
    /// Forget every entry recorded since `mark` and close the scope.
    void rollbackTo(size_t mark);
    /// Close the scope, keeping the entries.
    void release(size_t mark);

    size_t size() const { return distances_.size(); }
    size_t pendingCount() const { return pending_.size(); }
    size_t computeCount() const { return computed_; }

    const DistanceGraphConfig& config() const { return config_; }

private:
    EntityStore& store_;
    const DistanceFunction& distance_fn_;
    Diagnostics& diagnostics_;
    DistanceGraphConfig config_;

    std::unordered_map<MinimumPair, double, MinimumPairHash> distances_;
    std::unordered_map<MinimumPair, double, MinimumPairHash> pending_;

    std::vector<MinimumPair> journal_;
    std::vector<DistanceEntry> unconfirmed_;  // flushed while a mark was open
    size_t open_marks_ = 0;
    size_t computed_ = 0;
};

} // namespace landscape
