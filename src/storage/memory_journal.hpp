// File: src/storage/memory_journal.hpp
#pragma once

#include "storage/journal.hpp"
#include <atomic>
#include <shared_mutex>
#include <unordered_map>

namespace geochron {

/// In-memory journal using one hash map per database
///
/// Thread-safe with shared_mutex (multiple readers, single writer). Full
/// scans walk every record of the database.
class MemoryJournal : public Journal {
public:
    /// Statistics for monitoring
    struct Stats {
        size_t databases{0};
        size_t total_records{0};
        uint64_t appends{0};
        uint64_t full_scans{0};
    };

    MemoryJournal() = default;

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

    Stats GetStats() const;

private:
    using RecordMap = std::unordered_map<std::string, Record>;

    mutable std::shared_mutex mutex_;

    // database -> (record id -> record)
    std::unordered_map<std::string, RecordMap> databases_;

    std::atomic<uint64_t> appends_{0};
    mutable std::atomic<uint64_t> full_scans_{0};
};

} // namespace geochron
