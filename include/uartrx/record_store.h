#ifndef UARTRX_RECORD_STORE_H
#define UARTRX_RECORD_STORE_H

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "record.h"

struct sqlite3;

namespace uartrx {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// Durable home of parsed records. Implementations are thread-safe and a batch
// insert either stores every record or none (throwing StoreError).
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual size_t persist_batch(const std::vector<GpsPoint>& records) = 0;
    virtual std::vector<GpsPoint> all() const = 0;
    virtual std::vector<GpsPoint> latest(size_t n) const = 0; // newest first
    virtual size_t count() const = 0;
    virtual void clear() = 0;
};

class MemoryRecordStore : public RecordStore {
public:
    size_t persist_batch(const std::vector<GpsPoint>& records) override;
    std::vector<GpsPoint> all() const override;
    std::vector<GpsPoint> latest(size_t n) const override;
    size_t count() const override;
    void clear() override;

private:
    mutable std::mutex mtx;
    std::vector<GpsPoint> points;
};

// gps_points table in an SQLite database file. Each batch is one transaction.
class SqliteRecordStore : public RecordStore {
public:
    // Opens or creates the database and its table. Throws StoreError.
    explicit SqliteRecordStore(const std::string& path);
    ~SqliteRecordStore();

    SqliteRecordStore(const SqliteRecordStore&) = delete;
    SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

    size_t persist_batch(const std::vector<GpsPoint>& records) override;
    std::vector<GpsPoint> all() const override;
    std::vector<GpsPoint> latest(size_t n) const override;
    size_t count() const override;
    void clear() override;

private:
    std::string db_path;
    sqlite3* db = nullptr;
    mutable std::mutex mtx;

    void exec(const char* sql);
    [[noreturn]] void fail(const std::string& what) const;
    std::vector<GpsPoint> select(const char* sql, int64_t limit) const;
};

} // namespace uartrx

#endif // UARTRX_RECORD_STORE_H
