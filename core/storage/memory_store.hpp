#pragma once

#include "storage/entity_store.hpp"

#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace landscape {

// ─── Memory Store ──────────────────────────────────────────────
// In-process entity store. Every mutation made inside a transaction
// records its inverse; rollback() replays the inverses of the innermost
// savepoint in reverse order.

class MemoryStore : public EntityStore {
public:
    explicit MemoryStore(double energy_accuracy = 1e-3)
        : EntityStore(energy_accuracy) {}

    Minimum addMinimum(double energy, const std::vector<double>& coords) override;
    std::optional<Minimum> getMinimum(MinimumId id) const override;
    std::vector<Minimum> minima() const override;
    size_t minimumCount() const override { return minima_.size(); }

    TransitionState addTransitionState(double energy, const std::vector<double>& coords,
                                       MinimumId m1, MinimumId m2) override;
    std::vector<TransitionState> transitionStates() const override;

    void mergeMinima(MinimumId keep, MinimumId drop) override;

    void setDistanceBulk(const std::vector<DistanceEntry>& entries) override;
    std::optional<double> getDistance(MinimumId a, MinimumId b) const override;
    std::vector<DistanceEntry> distances() const override;

    void begin() override;
    void commit() override;
    void rollback() override;
    size_t transactionDepth() const override { return undo_stack_.size(); }

    size_t transitionStateCount() const { return transition_states_.size(); }
    size_t distanceCount() const { return distances_.size(); }

    /// Number of setDistanceBulk() calls that wrote at least one entry.
    size_t bulkWriteCount() const { return bulk_writes_; }

    /// Export everything to a line-oriented file:
    ///   M,id,energy,n,c1..cn
    ///   T,id,energy,min1,min2,n,c1..cn
    ///   D,min1,min2,distance
    void exportToFile(const std::string& path) const;

    /// Import records written by exportToFile (ids are preserved). Records
    /// with an existing id replace it. Throws StoreError and loads nothing
    /// if any record is malformed or a transition state names an unknown
    /// minimum.
    void importFromFile(const std::string& path);

    void clear();

private:
    void recordUndo(std::function<void()> undo);
    void putMinimum(const Minimum& m);
    void putTransitionState(const TransitionState& ts);
    void putDistance(const MinimumPair& pair, double distance);
    void eraseDistance(const MinimumPair& pair);

    MinimumId next_minimum_id_ = 1;
    TransitionStateId next_ts_id_ = 1;
    size_t bulk_writes_ = 0;

    std::map<MinimumId, Minimum> minima_;
    std::map<TransitionStateId, TransitionState> transition_states_;
    std::unordered_map<MinimumPair, double, MinimumPairHash> distances_;

    // One undo list per open savepoint, innermost last.
    std::vector<std::vector<std::function<void()>>> undo_stack_;
};

} // namespace landscape
