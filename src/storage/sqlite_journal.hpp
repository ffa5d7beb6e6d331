// File: src/storage/sqlite_journal.hpp
#pragma once

#include "storage/journal.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace geochron {

/// Persistent journal using SQLite
///
/// One table `records` keyed by (database, id). Record content is stored as
/// a serialized BLOB; kind, series, timestamp and bounding box are stored
/// in indexed columns so the full scans filter in SQL.
///
/// A single connection is shared behind a mutex.
class SqliteJournal : public Journal {
public:
    /// Configuration for SqliteJournal
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private in-memory db)
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Cache size in KB
        size_t cache_size_kb{10240};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// Busy timeout in milliseconds
        int busy_timeout_ms{5000};
    };

    /// @throws std::runtime_error if the database cannot be opened or initialized
    explicit SqliteJournal(const Config& config);

    ~SqliteJournal() override;

    // Prevent copying (SQLite connection is not copyable)
    SqliteJournal(const SqliteJournal&) = delete;
    SqliteJournal& operator=(const SqliteJournal&) = delete;

    // ========================================================================
    // Journal Interface Implementation
    // ========================================================================

    bool Append(const Record& record) override;
    bool Delete(const std::string& database, const std::string& id) override;
    size_t DropDatabase(const std::string& database) override;

    std::vector<Record> FetchByIds(const std::string& database,
                                   const std::vector<std::string>& ids) const override;

    std::vector<Record> FullScanBBox(const std::string& database,
                                     const BoundingBox& box) const override;

    std::vector<Record> FullScanTimeSeries(const std::string& database,
                                           const std::string& series_id,
                                           Timestamp start,
                                           Timestamp end) const override;

    std::vector<std::string> ListSeries(const std::string& database) const override;

    size_t Count(const std::string& database) const override;

    const std::string& GetPath() const { return config_.db_path; }

private:
    using StatementPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

    Config config_;
    sqlite3* db_{nullptr};

    mutable std::mutex mutex_;

    void InitializeDatabase();
    void CreateTables();
    void CreateIndices();

    /// Execute a statement without results
    /// @throws std::runtime_error on failure
    void ExecuteSQL(const std::string& sql);

    /// Prepare a statement
    /// @throws std::runtime_error on failure
    StatementPtr Prepare(const char* sql) const;

    /// Step a prepared statement to completion, decoding the data column
    /// (column 0) of every row
    std::vector<Record> ReadRecords(sqlite3_stmt* stmt) const;

    /// @throws std::runtime_error carrying the connection's last error
    [[noreturn]] void ThrowError(const std::string& what) const;

    static std::string SerializeRecord(const Record& record);
    static Record DeserializeRecord(const void* data, int size);
};

} // namespace geochron
