#pragma once

#include "storage/entity_store.hpp"

#include <string>

struct sqlite3;

namespace landscape {

// ─── SQLite Store ──────────────────────────────────────────────
// Durable entity store on a SQLite database. Tables:
//   minima(id, energy, coords)
//   transition_states(id, energy, coords, minimum1, minimum2)
//   distances(minimum1, minimum2, dist)   -- minimum1 < minimum2
// Transactions map onto SAVEPOINT sp_<depth>.

class SqliteStore : public EntityStore {
public:
    /// Open (or create) the database at `path`. ":memory:" is accepted.
    explicit SqliteStore(const std::string& path, double energy_accuracy = 1e-3);
    ~SqliteStore() override;

    Minimum addMinimum(double energy, const std::vector<double>& coords) override;
    std::optional<Minimum> getMinimum(MinimumId id) const override;
    std::vector<Minimum> minima() const override;
    size_t minimumCount() const override;

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
    size_t transactionDepth() const override { return depth_; }

    const std::string& path() const { return path_; }

private:
    void exec(const std::string& sql) const;
    void createSchema();

    std::string path_;
    sqlite3* db_ = nullptr;
    size_t depth_ = 0;
};

} // namespace landscape
