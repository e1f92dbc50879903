#pragma once

#include "landscape/types.hpp"

#include <functional>
#include <vector>

namespace landscape {

/// A minimum reported by a local connect run; not yet in the store.
struct FoundMinimum {
    double energy = 0.0;
    std::vector<double> coords;
};

/// A transition state found by a local connect run, with the two minima
/// its steepest-descent paths fell into.
struct FoundTransitionState {
    double energy = 0.0;
    std::vector<double> coords;
    FoundMinimum minimum1;
    FoundMinimum minimum2;
};

struct LocalConnectResult {
    bool success = false;  // a chain joining the two minima was found
    std::vector<FoundTransitionState> transition_states;
};

// ─── Local Connector ───────────────────────────────────────────
// The expensive search for transition states between two minima
// (nudged elastic band, eigenvector following, ...).

class LocalConnector {
public:
    virtual ~LocalConnector() = default;

    virtual LocalConnectResult connect(const Minimum& min1, const Minimum& min2) = 0;
};

/// Decides whether two minima are the same structure.
using DuplicatePredicate = std::function<bool(const Minimum&, const Minimum&)>;

} // namespace landscape
