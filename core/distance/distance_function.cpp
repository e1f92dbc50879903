#include "distance/distance_function.hpp"

#include <cmath>
#include <stdexcept>

namespace landscape {

namespace {

std::vector<double> centered(const std::vector<double>& coords) {
    size_t natoms = coords.size() / 3;
    double com[3] = {0.0, 0.0, 0.0};
    for (size_t i = 0; i < natoms; i++) {
        for (size_t k = 0; k < 3; k++) com[k] += coords[3 * i + k];
    }
    for (double& c : com) c /= static_cast<double>(natoms);

    std::vector<double> out(coords);
    for (size_t i = 0; i < natoms; i++) {
        for (size_t k = 0; k < 3; k++) out[3 * i + k] -= com[k];
    }
    return out;
}

} // namespace

Alignment CartesianDistance::compute(const std::vector<double>& coords1,
                                     const std::vector<double>& coords2) const {
    if (coords1.size() != coords2.size())
        throw std::invalid_argument("Coordinate sizes differ: " + std::to_string(coords1.size()) +
                                    " vs " + std::to_string(coords2.size()));
    if (coords1.empty() || coords1.size() % 3 != 0)
        throw std::invalid_argument("Coordinates are not xyz triples: size " +
                                    std::to_string(coords1.size()));

    Alignment result;
    result.coords1 = centered(coords1);
    result.coords2 = centered(coords2);

    double sum = 0.0;
    for (size_t i = 0; i < result.coords1.size(); i++) {
        double d = result.coords1[i] - result.coords2[i];
        sum += d * d;
    }
    result.distance = std::sqrt(sum);
    return result;
}

Alignment CallbackDistance::compute(const std::vector<double>& coords1,
                                    const std::vector<double>& coords2) const {
    Alignment result = fn_(coords1, coords2);
    if (!(result.distance >= 0.0))
        throw std::runtime_error(name_ + " returned an invalid distance: " +
                                 std::to_string(result.distance));
    return result;
}

} // namespace landscape
