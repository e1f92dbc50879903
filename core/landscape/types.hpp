#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace landscape {

using MinimumId = uint64_t;
using TransitionStateId = uint64_t;

/// A local minimum of the potential-energy landscape.
/// Identity is the integer id assigned by the entity store.
struct Minimum {
    MinimumId id = 0;
    double energy = 0.0;
    std::vector<double> coords;

    Minimum() = default;
    Minimum(MinimumId id, double energy, std::vector<double> coords = {})
        : id(id), energy(energy), coords(std::move(coords)) {}
};

/// A saddle point joining two minima.
/// After a merge both ends may coincide; such a state is degenerate.
struct TransitionState {
    TransitionStateId id = 0;
    double energy = 0.0;
    std::vector<double> coords;
    MinimumId minimum1 = 0;
    MinimumId minimum2 = 0;

    TransitionState() = default;
    TransitionState(TransitionStateId id, double energy, std::vector<double> coords,
                    MinimumId m1, MinimumId m2)
        : id(id), energy(energy), coords(std::move(coords)),
          minimum1(m1), minimum2(m2) {}

    bool degenerate() const { return minimum1 == minimum2; }

    /// The other end of this transition state, seen from `m`.
    MinimumId opposite(MinimumId m) const { return m == minimum1 ? minimum2 : minimum1; }
};

// ─── MinimumPair ───────────────────────────────────────────────
// Unordered pair of minima, stored normalized (first <= second) so
// (a, b) and (b, a) hash and compare equal.

struct MinimumPair {
    MinimumId first = 0;
    MinimumId second = 0;

    MinimumPair() = default;
    MinimumPair(MinimumId a, MinimumId b)
        : first(a < b ? a : b), second(a < b ? b : a) {}

    bool contains(MinimumId m) const { return first == m || second == m; }
    MinimumId other(MinimumId m) const { return m == first ? second : first; }

    bool operator==(const MinimumPair& o) const {
        return first == o.first && second == o.second;
    }
    bool operator!=(const MinimumPair& o) const { return !(*this == o); }
};

struct MinimumPairHash {
    size_t operator()(const MinimumPair& p) const {
        size_t h = std::hash<MinimumId>{}(p.first);
        return h ^ (std::hash<MinimumId>{}(p.second) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

/// A persisted distance between two minima.
struct DistanceEntry {
    MinimumPair pair;
    double distance = 0.0;

    DistanceEntry() = default;
    DistanceEntry(MinimumPair pair, double distance)
        : pair(pair), distance(distance) {}
};

} // namespace landscape
