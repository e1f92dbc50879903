#include "storage/memory_store.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace landscape {

// ─── Minima ────────────────────────────────────────────────────

Minimum MemoryStore::addMinimum(double energy, const std::vector<double>& coords) {
    for (const auto& [id, m] : minima_) {
        if (std::abs(m.energy - energy) < energy_accuracy_) return m;
    }
    MinimumId id = next_minimum_id_++;
    minima_.emplace(id, Minimum(id, energy, coords));
    recordUndo([this, id]() { minima_.erase(id); });
    return minima_.at(id);
}

std::optional<Minimum> MemoryStore::getMinimum(MinimumId id) const {
    auto it = minima_.find(id);
    if (it == minima_.end()) return std::nullopt;
    return it->second;
}

std::vector<Minimum> MemoryStore::minima() const {
    std::vector<Minimum> result;
    result.reserve(minima_.size());
    for (const auto& [_, m] : minima_) result.push_back(m);
    return result;
}

// ─── Transition states ─────────────────────────────────────────

TransitionState MemoryStore::addTransitionState(double energy,
                                                const std::vector<double>& coords,
                                                MinimumId m1, MinimumId m2) {
    if (!minima_.count(m1))
        throw StoreError("Minimum not found: " + std::to_string(m1));
    if (!minima_.count(m2))
        throw StoreError("Minimum not found: " + std::to_string(m2));

    TransitionStateId id = next_ts_id_++;
    transition_states_.emplace(id, TransitionState(id, energy, coords, m1, m2));
    recordUndo([this, id]() { transition_states_.erase(id); });
    return transition_states_.at(id);
}

std::vector<TransitionState> MemoryStore::transitionStates() const {
    std::vector<TransitionState> result;
    result.reserve(transition_states_.size());
    for (const auto& [_, ts] : transition_states_) result.push_back(ts);
    return result;
}

// ─── Merge ─────────────────────────────────────────────────────

void MemoryStore::mergeMinima(MinimumId keep, MinimumId drop) {
    if (keep == drop)
        throw StoreError("Cannot merge minimum " + std::to_string(keep) + " into itself");
    if (!minima_.count(keep))
        throw StoreError("Minimum not found: " + std::to_string(keep));
    auto drop_it = minima_.find(drop);
    if (drop_it == minima_.end())
        throw StoreError("Minimum not found: " + std::to_string(drop));

    for (auto& [id, ts] : transition_states_) {
        if (ts.minimum1 != drop && ts.minimum2 != drop) continue;
        TransitionState before = ts;
        if (ts.minimum1 == drop) ts.minimum1 = keep;
        if (ts.minimum2 == drop) ts.minimum2 = keep;
        recordUndo([this, before]() { transition_states_[before.id] = before; });
    }

    std::vector<DistanceEntry> affected;
    for (const auto& [pair, dist] : distances_) {
        if (pair.contains(drop)) affected.emplace_back(pair, dist);
    }
    for (const auto& entry : affected) {
        eraseDistance(entry.pair);
        MinimumId other = entry.pair.other(drop);
        if (other == keep) continue;
        MinimumPair repointed(keep, other);
        if (!distances_.count(repointed)) putDistance(repointed, entry.distance);
    }

    Minimum removed = drop_it->second;
    minima_.erase(drop_it);
    recordUndo([this, removed]() { minima_[removed.id] = removed; });
}

// ─── Distances ─────────────────────────────────────────────────

void MemoryStore::setDistanceBulk(const std::vector<DistanceEntry>& entries) {
    if (entries.empty()) return;
    for (const auto& entry : entries) {
        putDistance(entry.pair, entry.distance);
    }
    bulk_writes_++;
}

std::optional<double> MemoryStore::getDistance(MinimumId a, MinimumId b) const {
    auto it = distances_.find(MinimumPair(a, b));
    if (it == distances_.end()) return std::nullopt;
    return it->second;
}

std::vector<DistanceEntry> MemoryStore::distances() const {
    std::vector<DistanceEntry> result;
    result.reserve(distances_.size());
    for (const auto& [pair, dist] : distances_) result.emplace_back(pair, dist);
    return result;
}

void MemoryStore::putDistance(const MinimumPair& pair, double distance) {
    auto it = distances_.find(pair);
    if (it != distances_.end()) {
        double old = it->second;
        it->second = distance;
        recordUndo([this, pair, old]() { distances_[pair] = old; });
    } else {
        distances_.emplace(pair, distance);
        recordUndo([this, pair]() { distances_.erase(pair); });
    }
}

void MemoryStore::eraseDistance(const MinimumPair& pair) {
    auto it = distances_.find(pair);
    if (it == distances_.end()) return;
    double old = it->second;
    distances_.erase(it);
    recordUndo([this, pair, old]() { distances_[pair] = old; });
}

// ─── Transactions ──────────────────────────────────────────────

void MemoryStore::recordUndo(std::function<void()> undo) {
    if (undo_stack_.empty()) return;
    undo_stack_.back().push_back(std::move(undo));
}

void MemoryStore::begin() {
    undo_stack_.emplace_back();
}

void MemoryStore::commit() {
    if (undo_stack_.empty()) throw StoreError("commit() without begin()");
    auto released = std::move(undo_stack_.back());
    undo_stack_.pop_back();
    // A released savepoint still belongs to the enclosing one.
    if (!undo_stack_.empty()) {
        auto& outer = undo_stack_.back();
        for (auto& undo : released) outer.push_back(std::move(undo));
    }
}

void MemoryStore::rollback() {
    if (undo_stack_.empty()) throw StoreError("rollback() without begin()");
    auto undos = std::move(undo_stack_.back());
    undo_stack_.pop_back();
    for (auto it = undos.rbegin(); it != undos.rend(); ++it) {
        (*it)();
    }
}

// ─── File export / import ──────────────────────────────────────

void MemoryStore::exportToFile(const std::string& path) const {
    std::ofstream out(path);
    if (!out) throw StoreError("Cannot open for writing: " + path);
    out << std::setprecision(std::numeric_limits<double>::max_digits10);

    for (const auto& [id, m] : minima_) {
        out << "M," << m.id << "," << m.energy << "," << m.coords.size();
        for (double c : m.coords) out << "," << c;
        out << "\n";
    }
    for (const auto& [id, ts] : transition_states_) {
        out << "T," << ts.id << "," << ts.energy << ","
            << ts.minimum1 << "," << ts.minimum2 << "," << ts.coords.size();
        for (double c : ts.coords) out << "," << c;
        out << "\n";
    }
    for (const auto& [pair, dist] : distances_) {
        out << "D," << pair.first << "," << pair.second << "," << dist << "\n";
    }
}

namespace {

std::vector<double> readCoords(std::istringstream& iss, size_t n) {
    std::vector<double> coords;
    coords.reserve(n);
    std::string token;
    for (size_t i = 0; i < n; i++) {
        if (!std::getline(iss, token, ','))
            throw StoreError("expected " + std::to_string(n) + " coordinates, found " +
                             std::to_string(i));
        coords.push_back(std::stod(token));
    }
    return coords;
}

} // namespace

void MemoryStore::importFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw StoreError("Cannot open for reading: " + path);

    // a file that fails to load leaves the store as it was
    Transaction txn(*this);

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (line.empty()) continue;
        std::istringstream iss(line);
        std::string tag, token;
        std::getline(iss, tag, ',');

        try {
            if (tag == "M") {
                std::getline(iss, token, ',');
                MinimumId id = std::stoull(token);
                std::getline(iss, token, ',');
                double energy = std::stod(token);
                std::getline(iss, token, ',');
                size_t n = std::stoul(token);
                putMinimum(Minimum(id, energy, readCoords(iss, n)));
                if (id >= next_minimum_id_) next_minimum_id_ = id + 1;
            } else if (tag == "T") {
                std::getline(iss, token, ',');
                TransitionStateId id = std::stoull(token);
                std::getline(iss, token, ',');
                double energy = std::stod(token);
                std::getline(iss, token, ',');
                MinimumId m1 = std::stoull(token);
                std::getline(iss, token, ',');
                MinimumId m2 = std::stoull(token);
                std::getline(iss, token, ',');
                size_t n = std::stoul(token);
                putTransitionState(TransitionState(id, energy, readCoords(iss, n), m1, m2));
                if (id >= next_ts_id_) next_ts_id_ = id + 1;
            } else if (tag == "D") {
                std::getline(iss, token, ',');
                MinimumId m1 = std::stoull(token);
                std::getline(iss, token, ',');
                MinimumId m2 = std::stoull(token);
                std::getline(iss, token, ',');
                putDistance(MinimumPair(m1, m2), std::stod(token));
            } else {
                throw StoreError("unknown record type '" + tag + "'");
            }
        } catch (const StoreError& e) {
            throw StoreError(path + ":" + std::to_string(line_no) + ": " + e.what());
        } catch (const std::logic_error& e) {
            // std::stod/stoull report malformed numbers as invalid_argument/out_of_range
            throw StoreError(path + ":" + std::to_string(line_no) + ": " + e.what());
        }
    }

    for (const auto& [id, ts] : transition_states_) {
        for (MinimumId m : {ts.minimum1, ts.minimum2}) {
            if (!minima_.count(m))
                throw StoreError(path + ": transition state " + std::to_string(id) +
                                 " references unknown minimum " + std::to_string(m));
        }
    }
    txn.commit();
}

void MemoryStore::putMinimum(const Minimum& m) {
    auto it = minima_.find(m.id);
    if (it != minima_.end()) {
        Minimum old = it->second;
        it->second = m;
        recordUndo([this, old]() { minima_[old.id] = old; });
    } else {
        minima_.emplace(m.id, m);
        MinimumId id = m.id;
        recordUndo([this, id]() { minima_.erase(id); });
    }
}

void MemoryStore::putTransitionState(const TransitionState& ts) {
    auto it = transition_states_.find(ts.id);
    if (it != transition_states_.end()) {
        TransitionState old = it->second;
        it->second = ts;
        recordUndo([this, old]() { transition_states_[old.id] = old; });
    } else {
        transition_states_.emplace(ts.id, ts);
        TransitionStateId id = ts.id;
        recordUndo([this, id]() { transition_states_.erase(id); });
    }
}

void MemoryStore::clear() {
    minima_.clear();
    transition_states_.clear();
    distances_.clear();
    undo_stack_.clear();
    next_minimum_id_ = 1;
    next_ts_id_ = 1;
    bulk_writes_ = 0;
}

} // namespace landscape
