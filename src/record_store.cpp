#include "uartrx/record_store.h"

#include <algorithm>
#include <memory>
#include <sqlite3.h>
#include "uartrx/log.h"

namespace uartrx {

static const char* TAG = "store";

// Wait this long for another connection's write lock before failing.
static const int BUSY_TIMEOUT_MS = 1000;

// ─────────────────── In-memory store ───────────────────

size_t MemoryRecordStore::persist_batch(const std::vector<GpsPoint>& records) {
    std::lock_guard<std::mutex> lock(mtx);
    points.insert(points.end(), records.begin(), records.end());
    return records.size();
}

std::vector<GpsPoint> MemoryRecordStore::all() const {
    std::lock_guard<std::mutex> lock(mtx);
    return points;
}

std::vector<GpsPoint> MemoryRecordStore::latest(size_t n) const {
    std::lock_guard<std::mutex> lock(mtx);
    size_t take = std::min(n, points.size());
    return std::vector<GpsPoint>(points.rbegin(), points.rbegin() + take);
}

size_t MemoryRecordStore::count() const {
    std::lock_guard<std::mutex> lock(mtx);
    return points.size();
}

void MemoryRecordStore::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    points.clear();
}

// ─────────────────── SQLite store ───────────────────

namespace {

const char* CREATE_TABLE_SQL =
    "CREATE TABLE IF NOT EXISTS gps_points ("
    "  id              INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  utc_time        TEXT    NOT NULL,"
    "  latitude        REAL    NOT NULL,"
    "  longitude       REAL    NOT NULL,"
    "  fix_quality     INTEGER NOT NULL DEFAULT 0,"
    "  num_satellites  INTEGER NOT NULL DEFAULT 0,"
    "  hdop            REAL    NOT NULL DEFAULT 0.0,"
    "  altitude        REAL    NOT NULL DEFAULT 0.0,"
    "  geoid_height    REAL    NOT NULL DEFAULT 0.0,"
    "  received_at     DATETIME DEFAULT CURRENT_TIMESTAMP"
    ")";

const char* INSERT_SQL =
    "INSERT INTO gps_points (utc_time, latitude, longitude, fix_quality,"
    " num_satellites, hdop, altitude, geoid_height) VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

const char* SELECT_ALL_SQL =
    "SELECT utc_time, latitude, longitude, fix_quality, num_satellites, hdop, altitude,"
    " geoid_height FROM gps_points ORDER BY id";

const char* SELECT_LATEST_SQL =
    "SELECT utc_time, latitude, longitude, fix_quality, num_satellites, hdop, altitude,"
    " geoid_height FROM gps_points ORDER BY id DESC LIMIT ?";

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
typedef std::unique_ptr<sqlite3_stmt, StatementDeleter> Statement;

GpsPoint read_row(sqlite3_stmt* stmt) {
    GpsPoint p;
    const unsigned char* utc = sqlite3_column_text(stmt, 0);
    p.utc_time = utc ? (const char*)utc : "";
    p.latitude = sqlite3_column_double(stmt, 1);
    p.longitude = sqlite3_column_double(stmt, 2);
    p.fix_quality = sqlite3_column_int(stmt, 3);
    p.num_satellites = sqlite3_column_int(stmt, 4);
    p.hdop = sqlite3_column_double(stmt, 5);
    p.altitude = sqlite3_column_double(stmt, 6);
    p.geoid_height = sqlite3_column_double(stmt, 7);
    return p;
}

} // namespace

SqliteRecordStore::SqliteRecordStore(const std::string& path) : db_path(path) {
    int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        db = nullptr;
        throw StoreError(path + ": cannot open database: " + msg);
    }
    sqlite3_busy_timeout(db, BUSY_TIMEOUT_MS);

    try {
        exec(CREATE_TABLE_SQL);
    } catch (const StoreError&) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
    log_info(TAG, "Database initialized: " + path);
}

SqliteRecordStore::~SqliteRecordStore() { sqlite3_close(db); }

void SqliteRecordStore::fail(const std::string& what) const {
    throw StoreError(db_path + ": " + what + ": " + sqlite3_errmsg(db));
}

void SqliteRecordStore::exec(const char* sql) {
    if (sqlite3_exec(db, sql, nullptr, nullptr, nullptr) != SQLITE_OK) {
        fail(sql);
    }
}

size_t SqliteRecordStore::persist_batch(const std::vector<GpsPoint>& records) {
    if (records.empty()) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mtx);

    exec("BEGIN IMMEDIATE");
    try {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db, INSERT_SQL, -1, &raw, nullptr) != SQLITE_OK) {
            fail("prepare insert");
        }
        Statement stmt(raw);

        for (size_t i = 0; i < records.size(); i++) {
            const GpsPoint& p = records[i];
            sqlite3_bind_text(raw, 1, p.utc_time.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(raw, 2, p.latitude);
            sqlite3_bind_double(raw, 3, p.longitude);
            sqlite3_bind_int(raw, 4, p.fix_quality);
            sqlite3_bind_int(raw, 5, p.num_satellites);
            sqlite3_bind_double(raw, 6, p.hdop);
            sqlite3_bind_double(raw, 7, p.altitude);
            sqlite3_bind_double(raw, 8, p.geoid_height);
            if (sqlite3_step(raw) != SQLITE_DONE) {
                fail("insert row " + std::to_string(i + 1));
            }
            sqlite3_reset(raw);
        }
        stmt.reset();

        exec("COMMIT");
    } catch (const StoreError&) {
        if (sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            log_error(TAG, db_path + ": rollback failed: " + sqlite3_errmsg(db));
        }
        throw;
    }
    return records.size();
}

std::vector<GpsPoint> SqliteRecordStore::select(const char* sql, int64_t limit) const {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        fail("prepare select");
    }
    Statement stmt(raw);
    if (limit >= 0) {
        sqlite3_bind_int64(raw, 1, limit);
    }

    std::vector<GpsPoint> points;
    int rc;
    while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
        points.push_back(read_row(raw));
    }
    if (rc != SQLITE_DONE) {
        fail("select");
    }
    return points;
}

std::vector<GpsPoint> SqliteRecordStore::all() const {
    std::lock_guard<std::mutex> lock(mtx);
    return select(SELECT_ALL_SQL, -1);
}

std::vector<GpsPoint> SqliteRecordStore::latest(size_t n) const {
    std::lock_guard<std::mutex> lock(mtx);
    int64_t limit = (int64_t)std::min<size_t>(n, INT64_MAX);
    return select(SELECT_LATEST_SQL, limit);
}

size_t SqliteRecordStore::count() const {
    std::lock_guard<std::mutex> lock(mtx);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM gps_points", -1, &raw, nullptr) !=
        SQLITE_OK) {
        fail("prepare count");
    }
    Statement stmt(raw);
    if (sqlite3_step(raw) != SQLITE_ROW) {
        fail("count");
    }
    return (size_t)sqlite3_column_int64(raw, 0);
}

void SqliteRecordStore::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    exec("DELETE FROM gps_points");
    log_info(TAG, "All GPS points cleared from " + db_path);
}

} // namespace uartrx
