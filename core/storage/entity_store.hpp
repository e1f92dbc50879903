#pragma once

#include "landscape/types.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace landscape {

/// Raised when the backing store fails to read, write or manage a transaction.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// ─── Entity Store ──────────────────────────────────────────────
// Owns minima, transition states and persisted distances.
// Transactions nest: each begin() opens a savepoint that the matching
// commit() releases or rollback() discards.

class EntityStore {
public:
    explicit EntityStore(double energy_accuracy = 1e-3)
        : energy_accuracy_(energy_accuracy) {}
    virtual ~EntityStore() = default;

    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    // ── Minima ──

    /// Add a minimum. If a stored minimum lies within energyAccuracy()
    /// of `energy`, that minimum is returned instead.
    virtual Minimum addMinimum(double energy, const std::vector<double>& coords) = 0;
    virtual std::optional<Minimum> getMinimum(MinimumId id) const = 0;
    virtual std::vector<Minimum> minima() const = 0;
    virtual size_t minimumCount() const = 0;

    // ── Transition states ──
    virtual TransitionState addTransitionState(double energy,
                                               const std::vector<double>& coords,
                                               MinimumId m1, MinimumId m2) = 0;
    virtual std::vector<TransitionState> transitionStates() const = 0;

    /// Fold `drop` into `keep`: transition states and distances of `drop`
    /// are repointed (existing `keep` distances win) and `drop` is deleted.
    virtual void mergeMinima(MinimumId keep, MinimumId drop) = 0;

    // ── Distances ──
    virtual void setDistanceBulk(const std::vector<DistanceEntry>& entries) = 0;
    virtual std::optional<double> getDistance(MinimumId a, MinimumId b) const = 0;
    virtual std::vector<DistanceEntry> distances() const = 0;

    // ── Transactions ──
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
    virtual size_t transactionDepth() const = 0;
    bool inTransaction() const { return transactionDepth() > 0; }

    double energyAccuracy() const { return energy_accuracy_; }

protected:
    double energy_accuracy_;
};

// ─── Transaction ───────────────────────────────────────────────
// Unit of work on an EntityStore. Rolls back on destruction unless
// commit() was called.

class Transaction {
public:
    explicit Transaction(EntityStore& store);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
    void rollback();

    bool active() const { return active_; }

private:
    EntityStore& store_;
    bool active_ = true;
};

} // namespace landscape
