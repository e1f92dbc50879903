#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace landscape {

/// Result of aligning two structures: the optimized distance and both
/// coordinate sets in the alignment that realizes it.
struct Alignment {
    double distance = 0.0;
    std::vector<double> coords1;
    std::vector<double> coords2;
};

// ─── Distance Function ─────────────────────────────────────────
// Abstract base class for structural distance routines. Implementations
// may be arbitrarily expensive; they must be symmetric and deterministic
// for a given pair of coordinate sets.

class DistanceFunction {
public:
    virtual ~DistanceFunction() = default;

    virtual Alignment compute(const std::vector<double>& coords1,
                              const std::vector<double>& coords2) const = 0;

    virtual std::string name() const = 0;
};

/// Euclidean distance after moving both structures' centers of mass to
/// the origin. Coordinates are flat xyz triples.
class CartesianDistance : public DistanceFunction {
public:
    Alignment compute(const std::vector<double>& coords1,
                      const std::vector<double>& coords2) const override;
    std::string name() const override { return "cartesian"; }
};

/// Adapts any callable (an external alignment routine, a lookup table in
/// tests, a Python function) to the DistanceFunction interface.
class CallbackDistance : public DistanceFunction {
public:
    using Fn = std::function<Alignment(const std::vector<double>&, const std::vector<double>&)>;

    explicit CallbackDistance(Fn fn, std::string name = "callback")
        : fn_(std::move(fn)), name_(std::move(name)) {}

    Alignment compute(const std::vector<double>& coords1,
                      const std::vector<double>& coords2) const override;
    std::string name() const override { return name_; }

private:
    Fn fn_;
    std::string name_;
};

} // namespace landscape
