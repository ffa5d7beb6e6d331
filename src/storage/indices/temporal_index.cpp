// File: src/storage/indices/temporal_index.cpp
#include "storage/indices/temporal_index.hpp"
#include <algorithm>
#include <mutex>

namespace geochron {

// ============================================================================
// SeriesIndex
// ============================================================================

bool SeriesIndex::Insert(const std::string& point_id, Timestamp timestamp) {
    return keys_.emplace(timestamp, point_id).second;
}

bool SeriesIndex::Remove(const std::string& point_id, Timestamp timestamp) {
    return keys_.erase(Key(timestamp, point_id)) > 0;
}

bool SeriesIndex::Contains(const std::string& point_id, Timestamp timestamp) const {
    return keys_.find(Key(timestamp, point_id)) != keys_.end();
}

std::vector<std::string> SeriesIndex::FindInRange(
        Timestamp start,
        Timestamp end,
        size_t max_results) const {
    std::vector<std::string> results;
    if (start > end) {
        return results;
    }

    // Smallest key with timestamp >= start (the empty id sorts first)
    auto it = keys_.lower_bound(Key(start, std::string()));

    for (; it != keys_.end() && it->first <= end && results.size() < max_results; ++it) {
        results.push_back(it->second);
    }

    return results;
}

SeriesIndex::Stats SeriesIndex::GetStats() const {
    Stats stats;
    stats.total_points = keys_.size();

    if (!keys_.empty()) {
        stats.earliest = keys_.begin()->first;
        stats.latest = keys_.rbegin()->first;
    }

    return stats;
}

// ============================================================================
// TemporalIndex
// ============================================================================

std::shared_ptr<TemporalIndex::SeriesSlot> TemporalIndex::FindSlot(
        const std::string& database,
        const std::string& series_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);

    auto it = series_.find(SeriesKey(database, series_id));
    if (it == series_.end()) {
        throw IndexError(ErrorCode::INDEX_NOT_FOUND,
                         "no temporal index for series " + series_id + " in database " + database);
    }
    return it->second;
}

void TemporalIndex::CreateIndex(const std::string& database, const std::string& series_id) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);

    SeriesKey key(database, series_id);
    if (series_.find(key) != series_.end()) {
        throw IndexError(ErrorCode::ALREADY_EXISTS,
                         "temporal index for series " + series_id + " in database " + database);
    }

    series_.emplace(std::move(key), std::make_shared<SeriesSlot>());
}

void TemporalIndex::Rebuild(const std::string& database,
                            const std::string& series_id,
                            const std::function<void(SeriesIndex&)>& populate) {
    SeriesKey key(database, series_id);

    std::shared_ptr<SeriesSlot> slot;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = series_.find(key);
        if (it == series_.end()) {
            it = series_.emplace(key, std::make_shared<SeriesSlot>()).first;
        }
        slot = it->second;
    }

    std::unique_lock<std::shared_mutex> series_lock(slot->mutex);
    slot->index.Clear();

    try {
        populate(slot->index);
    } catch (...) {
        slot->index.Clear();
        series_lock.unlock();

        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = series_.find(key);
        if (it != series_.end() && it->second == slot) {
            series_.erase(it);
        }
        throw;
    }
}

bool TemporalIndex::HasIndex(const std::string& database, const std::string& series_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return series_.find(SeriesKey(database, series_id)) != series_.end();
}

void TemporalIndex::Insert(const std::string& database,
                           const std::string& series_id,
                           const std::string& point_id,
                           Timestamp timestamp) {
    auto slot = FindSlot(database, series_id);
    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    slot->index.Insert(point_id, timestamp);
}

std::vector<std::string> TemporalIndex::RangeQuery(const std::string& database,
                                                   const std::string& series_id,
                                                   Timestamp start,
                                                   Timestamp end,
                                                   size_t limit) const {
    if (start > end) {
        throw IndexError(ErrorCode::INVALID_RANGE,
                         "start " + std::to_string(start) + " > end " + std::to_string(end));
    }

    auto slot = FindSlot(database, series_id);
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->index.FindInRange(start, end, limit);
}

void TemporalIndex::Delete(const std::string& database,
                           const std::string& series_id,
                           const std::string& point_id,
                           Timestamp timestamp) {
    auto slot = FindSlot(database, series_id);
    std::unique_lock<std::shared_mutex> lock(slot->mutex);

    if (!slot->index.Remove(point_id, timestamp)) {
        throw IndexError(ErrorCode::NOT_FOUND,
                         "point " + point_id + "@" + std::to_string(timestamp) +
                         " in series " + series_id);
    }
}

void TemporalIndex::DropIndex(const std::string& database, const std::string& series_id) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    series_.erase(SeriesKey(database, series_id));
}

size_t TemporalIndex::DropDatabase(const std::string& database) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);

    auto first = series_.lower_bound(SeriesKey(database, std::string()));
    auto last = first;
    size_t dropped = 0;
    while (last != series_.end() && last->first.first == database) {
        ++last;
        ++dropped;
    }

    series_.erase(first, last);
    return dropped;
}

size_t TemporalIndex::Size(const std::string& database, const std::string& series_id) const {
    auto slot = FindSlot(database, series_id);
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->index.Size();
}

SeriesIndex::Stats TemporalIndex::GetSeriesStats(const std::string& database,
                                                 const std::string& series_id) const {
    auto slot = FindSlot(database, series_id);
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->index.GetStats();
}

std::vector<std::string> TemporalIndex::ListSeries(const std::string& database) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);

    std::vector<std::string> result;
    for (auto it = series_.lower_bound(SeriesKey(database, std::string()));
         it != series_.end() && it->first.first == database; ++it) {
        result.push_back(it->first.second);
    }
    return result;
}

TemporalIndex::Stats TemporalIndex::GetStats() const {
    std::vector<std::shared_ptr<SeriesSlot>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        for (const auto& [key, slot] : series_) {
            slots.push_back(slot);
        }
    }

    Stats stats;
    stats.indexed_series = slots.size();
    for (const auto& slot : slots) {
        std::shared_lock<std::shared_mutex> lock(slot->mutex);
        stats.total_points += slot->index.Size();
    }
    return stats;
}

} // namespace geochron
