#include "storage/sqlite_store.hpp"

#include <sqlite3.h>

#include <cstring>
#include <utility>

namespace landscape {

namespace {

// Prepared statement that finalizes itself.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("Error preparing '") + sql + "': " + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, double v) { check(sqlite3_bind_double(stmt_, idx, v)); }
    void bind(int idx, MinimumId v) { check(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v))); }
    void bind(int idx, const std::vector<double>& v) {
        check(sqlite3_bind_blob(stmt_, idx, v.data(),
                                static_cast<int>(v.size() * sizeof(double)), SQLITE_TRANSIENT));
    }

    /// true while a row is available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    MinimumId columnId(int col) const {
        return static_cast<MinimumId>(sqlite3_column_int64(stmt_, col));
    }
    double columnDouble(int col) const { return sqlite3_column_double(stmt_, col); }
    std::vector<double> columnCoords(int col) const {
        const void* blob = sqlite3_column_blob(stmt_, col);
        int bytes = sqlite3_column_bytes(stmt_, col);
        std::vector<double> coords(static_cast<size_t>(bytes) / sizeof(double));
        if (blob && !coords.empty()) std::memcpy(coords.data(), blob, coords.size() * sizeof(double));
        return coords;
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) throw StoreError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

} // namespace

SqliteStore::SqliteStore(const std::string& path, double energy_accuracy)
    : EntityStore(energy_accuracy), path_(path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Cannot open database " + path + ": " + msg);
    }
    createSchema();
}

SqliteStore::~SqliteStore() {
    sqlite3_close(db_);
}

void SqliteStore::exec(const std::string& sql) const {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("sqlite exec '" + sql + "' failed: " + msg);
    }
}

void SqliteStore::createSchema() {
    exec("CREATE TABLE IF NOT EXISTS minima ("
         " id INTEGER PRIMARY KEY AUTOINCREMENT,"
         " energy REAL NOT NULL,"
         " coords BLOB)");
    exec("CREATE TABLE IF NOT EXISTS transition_states ("
         " id INTEGER PRIMARY KEY AUTOINCREMENT,"
         " energy REAL NOT NULL,"
         " coords BLOB,"
         " minimum1 INTEGER NOT NULL REFERENCES minima(id),"
         " minimum2 INTEGER NOT NULL REFERENCES minima(id))");
    exec("CREATE TABLE IF NOT EXISTS distances ("
         " minimum1 INTEGER NOT NULL,"
         " minimum2 INTEGER NOT NULL,"
         " dist REAL NOT NULL,"
         " PRIMARY KEY (minimum1, minimum2))");
    exec("CREATE INDEX IF NOT EXISTS minima_energy ON minima(energy)");
}

// ─── Minima ────────────────────────────────────────────────────

Minimum SqliteStore::addMinimum(double energy, const std::vector<double>& coords) {
    {
        Statement q(db_, "SELECT id, energy, coords FROM minima"
                         " WHERE energy > ? AND energy < ? ORDER BY id LIMIT 1");
        q.bind(1, energy - energy_accuracy_);
        q.bind(2, energy + energy_accuracy_);
        if (q.step()) return Minimum(q.columnId(0), q.columnDouble(1), q.columnCoords(2));
    }
    Statement ins(db_, "INSERT INTO minima (energy, coords) VALUES (?, ?)");
    ins.bind(1, energy);
    ins.bind(2, coords);
    ins.step();
    return Minimum(static_cast<MinimumId>(sqlite3_last_insert_rowid(db_)), energy, coords);
}

std::optional<Minimum> SqliteStore::getMinimum(MinimumId id) const {
    Statement q(db_, "SELECT id, energy, coords FROM minima WHERE id = ?");
    q.bind(1, id);
    if (!q.step()) return std::nullopt;
    return Minimum(q.columnId(0), q.columnDouble(1), q.columnCoords(2));
}

std::vector<Minimum> SqliteStore::minima() const {
    std::vector<Minimum> result;
    Statement q(db_, "SELECT id, energy, coords FROM minima ORDER BY id");
    while (q.step()) {
        result.emplace_back(q.columnId(0), q.columnDouble(1), q.columnCoords(2));
    }
    return result;
}

size_t SqliteStore::minimumCount() const {
    Statement q(db_, "SELECT COUNT(*) FROM minima");
    q.step();
    return static_cast<size_t>(q.columnId(0));
}

// ─── Transition states ─────────────────────────────────────────

TransitionState SqliteStore::addTransitionState(double energy,
                                                const std::vector<double>& coords,
                                                MinimumId m1, MinimumId m2) {
    if (!getMinimum(m1)) throw StoreError("Minimum not found: " + std::to_string(m1));
    if (!getMinimum(m2)) throw StoreError("Minimum not found: " + std::to_string(m2));

    Statement ins(db_, "INSERT INTO transition_states (energy, coords, minimum1, minimum2)"
                       " VALUES (?, ?, ?, ?)");
    ins.bind(1, energy);
    ins.bind(2, coords);
    ins.bind(3, m1);
    ins.bind(4, m2);
    ins.step();
    return TransitionState(static_cast<TransitionStateId>(sqlite3_last_insert_rowid(db_)),
                           energy, coords, m1, m2);
}

std::vector<TransitionState> SqliteStore::transitionStates() const {
    std::vector<TransitionState> result;
    Statement q(db_, "SELECT id, energy, coords, minimum1, minimum2"
                     " FROM transition_states ORDER BY id");
    while (q.step()) {
        result.emplace_back(q.columnId(0), q.columnDouble(1), q.columnCoords(2),
                            q.columnId(3), q.columnId(4));
    }
    return result;
}

// ─── Merge ─────────────────────────────────────────────────────

void SqliteStore::mergeMinima(MinimumId keep, MinimumId drop) {
    if (keep == drop)
        throw StoreError("Cannot merge minimum " + std::to_string(keep) + " into itself");
    if (!getMinimum(keep)) throw StoreError("Minimum not found: " + std::to_string(keep));
    if (!getMinimum(drop)) throw StoreError("Minimum not found: " + std::to_string(drop));

    Transaction txn(*this);

    for (const char* sql : {"UPDATE transition_states SET minimum1 = ? WHERE minimum1 = ?",
                            "UPDATE transition_states SET minimum2 = ? WHERE minimum2 = ?"}) {
        Statement upd(db_, sql);
        upd.bind(1, keep);
        upd.bind(2, drop);
        upd.step();
    }

    std::vector<DistanceEntry> affected;
    {
        Statement q(db_, "SELECT minimum1, minimum2, dist FROM distances"
                         " WHERE minimum1 = ? OR minimum2 = ?");
        q.bind(1, drop);
        q.bind(2, drop);
        while (q.step()) {
            affected.emplace_back(MinimumPair(q.columnId(0), q.columnId(1)), q.columnDouble(2));
        }
    }
    {
        Statement del(db_, "DELETE FROM distances WHERE minimum1 = ? OR minimum2 = ?");
        del.bind(1, drop);
        del.bind(2, drop);
        del.step();
    }
    {
        Statement ins(db_, "INSERT OR IGNORE INTO distances (minimum1, minimum2, dist)"
                           " VALUES (?, ?, ?)");
        for (const auto& entry : affected) {
            MinimumId other = entry.pair.other(drop);
            if (other == keep) continue;
            MinimumPair repointed(keep, other);
            ins.bind(1, repointed.first);
            ins.bind(2, repointed.second);
            ins.bind(3, entry.distance);
            ins.step();
            ins.reset();
        }
    }
    {
        Statement del(db_, "DELETE FROM minima WHERE id = ?");
        del.bind(1, drop);
        del.step();
    }

    txn.commit();
}

// ─── Distances ─────────────────────────────────────────────────

void SqliteStore::setDistanceBulk(const std::vector<DistanceEntry>& entries) {
    if (entries.empty()) return;
    Transaction txn(*this);
    Statement ins(db_, "INSERT OR REPLACE INTO distances (minimum1, minimum2, dist)"
                       " VALUES (?, ?, ?)");
    for (const auto& entry : entries) {
        ins.bind(1, entry.pair.first);
        ins.bind(2, entry.pair.second);
        ins.bind(3, entry.distance);
        ins.step();
        ins.reset();
    }
    txn.commit();
}

std::optional<double> SqliteStore::getDistance(MinimumId a, MinimumId b) const {
    MinimumPair pair(a, b);
    Statement q(db_, "SELECT dist FROM distances WHERE minimum1 = ? AND minimum2 = ?");
    q.bind(1, pair.first);
    q.bind(2, pair.second);
    if (!q.step()) return std::nullopt;
    return q.columnDouble(0);
}

std::vector<DistanceEntry> SqliteStore::distances() const {
    std::vector<DistanceEntry> result;
    Statement q(db_, "SELECT minimum1, minimum2, dist FROM distances");
    while (q.step()) {
        result.emplace_back(MinimumPair(q.columnId(0), q.columnId(1)), q.columnDouble(2));
    }
    return result;
}

// ─── Transactions ──────────────────────────────────────────────

void SqliteStore::begin() {
    exec("SAVEPOINT sp_" + std::to_string(depth_ + 1));
    depth_++;
}

void SqliteStore::commit() {
    if (depth_ == 0) throw StoreError("commit() without begin()");
    exec("RELEASE sp_" + std::to_string(depth_));
    depth_--;
}

void SqliteStore::rollback() {
    if (depth_ == 0) throw StoreError("rollback() without begin()");
    std::string name = "sp_" + std::to_string(depth_);
    depth_--;
    exec("ROLLBACK TO " + name);
    exec("RELEASE " + name);
}

} // namespace landscape
