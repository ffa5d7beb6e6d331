// File: src/storage/sqlite_journal.cpp
#include "storage/sqlite_journal.hpp"
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace geochron {

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteJournal::SqliteJournal(const Config& config)
    : config_(config) {
    if (config_.db_path.empty()) {
        throw std::invalid_argument("SqliteJournal requires a db_path");
    }

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open journal " + config_.db_path + ": " + error);
    }

    try {
        InitializeDatabase();
    } catch (const std::exception&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    spdlog::info("Opened SQLite journal at {}", config_.db_path);
}

SqliteJournal::~SqliteJournal() {
    if (db_) {
        // close_v2 defers the close until outstanding statements are finalized
        int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            spdlog::warn("Closing SQLite journal {} returned {}", config_.db_path, rc);
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteJournal::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }

    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    ExecuteSQL("PRAGMA cache_size=-" + std::to_string(config_.cache_size_kb) + ";");

    CreateTables();
    CreateIndices();
}

void SqliteJournal::CreateTables() {
    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS records (
            db TEXT NOT NULL,
            id TEXT NOT NULL,
            kind INTEGER NOT NULL,
            series_id TEXT,
            ts INTEGER,
            minx REAL,
            miny REAL,
            maxx REAL,
            maxy REAL,
            data BLOB NOT NULL,
            PRIMARY KEY (db, id)
        );
    )");
}

void SqliteJournal::CreateIndices() {
    // Bounding-box scans
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_records_kind ON records(db, kind);");

    // Time-range scans
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_records_series_ts ON records(db, series_id, ts);");
}

void SqliteJournal::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        throw std::runtime_error("SQLite error in \"" + sql + "\": " + error);
    }
}

SqliteJournal::StatementPtr SqliteJournal::Prepare(const char* sql) const {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        ThrowError("prepare");
    }
    return StatementPtr(stmt, &sqlite3_finalize);
}

void SqliteJournal::ThrowError(const std::string& what) const {
    throw std::runtime_error("SQLite " + what + " failed: " + sqlite3_errmsg(db_));
}

// ============================================================================
// Serialization
// ============================================================================

std::string SqliteJournal::SerializeRecord(const Record& record) {
    std::ostringstream out(std::ios::binary);
    record.Serialize(out);
    return out.str();
}

Record SqliteJournal::DeserializeRecord(const void* data, int size) {
    std::string blob(static_cast<const char*>(data), static_cast<size_t>(size));
    std::istringstream in(blob, std::ios::binary);
    return Record::Deserialize(in);
}

std::vector<Record> SqliteJournal::ReadRecords(sqlite3_stmt* stmt) const {
    std::vector<Record> results;

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const void* blob = sqlite3_column_blob(stmt, 0);
        int size = sqlite3_column_bytes(stmt, 0);
        results.push_back(DeserializeRecord(blob, size));
    }

    if (rc != SQLITE_DONE) {
        ThrowError("step");
    }

    return results;
}

// ============================================================================
// Write Operations
// ============================================================================

bool SqliteJournal::Append(const Record& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = Prepare(
        "INSERT INTO records (db, id, kind, series_id, ts, minx, miny, maxx, maxy, data) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");

    sqlite3_bind_text(stmt.get(), 1, record.database.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, record.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 3, static_cast<int>(record.kind));

    if (record.kind == RecordKind::FEATURE) {
        sqlite3_bind_null(stmt.get(), 4);
        sqlite3_bind_null(stmt.get(), 5);
        sqlite3_bind_double(stmt.get(), 6, record.bbox.minx);
        sqlite3_bind_double(stmt.get(), 7, record.bbox.miny);
        sqlite3_bind_double(stmt.get(), 8, record.bbox.maxx);
        sqlite3_bind_double(stmt.get(), 9, record.bbox.maxy);
    } else {
        sqlite3_bind_text(stmt.get(), 4, record.series_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 5, record.timestamp);
        for (int column = 6; column <= 9; ++column) {
            sqlite3_bind_null(stmt.get(), column);
        }
    }

    std::string blob = SerializeRecord(record);
    sqlite3_bind_blob(stmt.get(), 10, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return true;
    }
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return false;  // Duplicate (db, id)
    }
    ThrowError("insert");
}

bool SqliteJournal::Delete(const std::string& database, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = Prepare("DELETE FROM records WHERE db = ? AND id = ?;");
    sqlite3_bind_text(stmt.get(), 1, database.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        ThrowError("delete");
    }
    return sqlite3_changes(db_) > 0;
}

size_t SqliteJournal::DropDatabase(const std::string& database) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = Prepare("DELETE FROM records WHERE db = ?;");
    sqlite3_bind_text(stmt.get(), 1, database.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        ThrowError("delete");
    }
    return static_cast<size_t>(sqlite3_changes(db_));
}

// ============================================================================
// Read Operations
// ============================================================================

std::vector<Record> SqliteJournal::FetchByIds(const std::string& database,
                                              const std::vector<std::string>& ids) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Record> results;
    results.reserve(ids.size());

    auto stmt = Prepare("SELECT data FROM records WHERE db = ? AND id = ?;");
    for (const auto& id : ids) {
        sqlite3_reset(stmt.get());
        sqlite3_bind_text(stmt.get(), 1, database.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, id.c_str(), -1, SQLITE_TRANSIENT);

        auto found = ReadRecords(stmt.get());
        for (auto& record : found) {
            results.push_back(std::move(record));
        }
    }

    return results;
}

std::vector<Record> SqliteJournal::FullScanBBox(const std::string& database,
                                                const BoundingBox& box) const {
    std::lock_guard<std::mutex> lock(mutex_);

    // Inclusive intersection, same test as BoundingBox::Intersects
    auto stmt = Prepare(
        "SELECT data FROM records WHERE db = ? AND kind = ? "
        "AND minx <= ? AND maxx >= ? AND miny <= ? AND maxy >= ? "
        "ORDER BY id;");

    sqlite3_bind_text(stmt.get(), 1, database.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(RecordKind::FEATURE));
    sqlite3_bind_double(stmt.get(), 3, box.maxx);
    sqlite3_bind_double(stmt.get(), 4, box.minx);
    sqlite3_bind_double(stmt.get(), 5, box.maxy);
    sqlite3_bind_double(stmt.get(), 6, box.miny);

    return ReadRecords(stmt.get());
}

std::vector<Record> SqliteJournal::FullScanTimeSeries(const std::string& database,
                                                      const std::string& series_id,
                                                      Timestamp start,
                                                      Timestamp end) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = Prepare(
        "SELECT data FROM records WHERE db = ? AND kind = ? AND series_id = ? "
        "AND ts >= ? AND ts <= ?;");

    sqlite3_bind_text(stmt.get(), 1, database.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(RecordKind::TIME_SERIES));
    sqlite3_bind_text(stmt.get(), 3, series_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 4, start);
    sqlite3_bind_int64(stmt.get(), 5, end);

    auto results = ReadRecords(stmt.get());
    SortByOrderingKey(results);
    return results;
}

std::vector<std::string> SqliteJournal::ListSeries(const std::string& database) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = Prepare(
        "SELECT DISTINCT series_id FROM records WHERE db = ? AND kind = ? ORDER BY series_id;");
    sqlite3_bind_text(stmt.get(), 1, database.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(RecordKind::TIME_SERIES));

    std::vector<std::string> series;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        series.emplace_back(text ? reinterpret_cast<const char*>(text) : "");
    }
    if (rc != SQLITE_DONE) {
        ThrowError("step");
    }

    return series;
}

size_t SqliteJournal::Count(const std::string& database) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = Prepare("SELECT COUNT(*) FROM records WHERE db = ?;");
    sqlite3_bind_text(stmt.get(), 1, database.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        ThrowError("count");
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace geochron
