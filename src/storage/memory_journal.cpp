// File: src/storage/memory_journal.cpp
#include "storage/memory_journal.hpp"
#include <algorithm>
#include <mutex>
#include <set>

namespace geochron {

// ============================================================================
// Write Operations
// ============================================================================

bool MemoryJournal::Append(const Record& record) {
    // Exclusive lock for writing
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& records = databases_[record.database];
    if (records.find(record.id) != records.end()) {
        return false;
    }

    records.emplace(record.id, record);
    appends_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool MemoryJournal::Delete(const std::string& database, const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto db_it = databases_.find(database);
    if (db_it == databases_.end()) {
        return false;
    }

    return db_it->second.erase(id) > 0;
}

size_t MemoryJournal::DropDatabase(const std::string& database) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto db_it = databases_.find(database);
    if (db_it == databases_.end()) {
        return 0;
    }

    size_t removed = db_it->second.size();
    databases_.erase(db_it);
    return removed;
}

// ============================================================================
// Read Operations
// ============================================================================

std::vector<Record> MemoryJournal::FetchByIds(const std::string& database,
                                              const std::vector<std::string>& ids) const {
    // Shared lock for reading
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Record> results;

    auto db_it = databases_.find(database);
    if (db_it == databases_.end()) {
        return results;
    }

    results.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = db_it->second.find(id);
        if (it != db_it->second.end()) {
            results.push_back(it->second);
        }
    }

    return results;
}

std::vector<Record> MemoryJournal::FullScanBBox(const std::string& database,
                                                const BoundingBox& box) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    full_scans_.fetch_add(1, std::memory_order_relaxed);

    std::vector<Record> results;

    auto db_it = databases_.find(database);
    if (db_it == databases_.end()) {
        return results;
    }

    for (const auto& [id, record] : db_it->second) {
        if (record.kind == RecordKind::FEATURE && record.bbox.Intersects(box)) {
            results.push_back(record);
        }
    }

    SortById(results);
    return results;
}

std::vector<Record> MemoryJournal::FullScanTimeSeries(const std::string& database,
                                                      const std::string& series_id,
                                                      Timestamp start,
                                                      Timestamp end) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    full_scans_.fetch_add(1, std::memory_order_relaxed);

    std::vector<Record> results;

    auto db_it = databases_.find(database);
    if (db_it == databases_.end()) {
        return results;
    }

    for (const auto& [id, record] : db_it->second) {
        if (record.kind == RecordKind::TIME_SERIES &&
            record.series_id == series_id &&
            record.timestamp >= start &&
            record.timestamp <= end) {
            results.push_back(record);
        }
    }

    SortByOrderingKey(results);
    return results;
}

std::vector<std::string> MemoryJournal::ListSeries(const std::string& database) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto db_it = databases_.find(database);
    if (db_it == databases_.end()) {
        return {};
    }

    std::set<std::string> series;
    for (const auto& [id, record] : db_it->second) {
        if (record.kind == RecordKind::TIME_SERIES) {
            series.insert(record.series_id);
        }
    }

    return std::vector<std::string>(series.begin(), series.end());
}

size_t MemoryJournal::Count(const std::string& database) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto db_it = databases_.find(database);
    return db_it == databases_.end() ? 0 : db_it->second.size();
}

MemoryJournal::Stats MemoryJournal::GetStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    Stats stats;
    stats.databases = databases_.size();
    for (const auto& [name, records] : databases_) {
        stats.total_records += records.size();
    }
    stats.appends = appends_.load(std::memory_order_relaxed);
    stats.full_scans = full_scans_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace geochron
