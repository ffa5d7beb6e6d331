// File: src/storage/journal.hpp
#pragma once

#include "core/record.hpp"
#include <memory>
#include <string>
#include <vector>

namespace geochron {

/// Abstract interface for the record journal
///
/// The journal is the source of truth for record content. Indexes hold ids
/// only and resolve them through FetchByIds; when an index is missing, the
/// read path falls back to the full scans.
///
/// Thread Safety: All methods must be thread-safe.
class Journal {
public:
    virtual ~Journal() = default;

    // ========================================================================
    // Write Operations
    // ========================================================================

    /// Append a record
    /// @return true if stored, false if the id already exists in its database
    virtual bool Append(const Record& record) = 0;

    /// Remove a record
    /// @return true if removed, false if absent
    virtual bool Delete(const std::string& database, const std::string& id) = 0;

    /// Remove every record of a database
    /// @return Number of records removed
    virtual size_t DropDatabase(const std::string& database) = 0;

    // ========================================================================
    // Read Operations
    // ========================================================================

    /// Fetch records by id, in the order the ids are given
    /// Missing ids are skipped.
    virtual std::vector<Record> FetchByIds(const std::string& database,
                                           const std::vector<std::string>& ids) const = 0;

    /// Every feature of a database whose bounding box intersects box
    /// @return Features sorted by id
    virtual std::vector<Record> FullScanBBox(const std::string& database,
                                             const BoundingBox& box) const = 0;

    /// Every point of a series with start <= timestamp <= end
    /// @return Points sorted by (timestamp, id)
    virtual std::vector<Record> FullScanTimeSeries(const std::string& database,
                                                   const std::string& series_id,
                                                   Timestamp start,
                                                   Timestamp end) const = 0;

    /// Series ids that have at least one point, sorted
    virtual std::vector<std::string> ListSeries(const std::string& database) const = 0;

    /// Number of records in a database
    virtual size_t Count(const std::string& database) const = 0;
};

/// Journal backend selector
enum class JournalBackend : uint8_t {
    MEMORY = 0,
    SQLITE = 1,
};

const char* ToString(JournalBackend backend);

/// @throws std::invalid_argument for an unknown name
JournalBackend ParseJournalBackend(const std::string& str);

/// Create a journal
/// @param backend Backend type
/// @param sqlite_path Database file (SQLITE only)
/// @throws std::runtime_error if the SQLite file cannot be opened
std::unique_ptr<Journal> CreateJournal(JournalBackend backend, const std::string& sqlite_path);

} // namespace geochron
