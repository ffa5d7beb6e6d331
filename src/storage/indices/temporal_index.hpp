// File: src/storage/indices/temporal_index.hpp
#pragma once

#include "core/types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace geochron {

/// Ordered index of one time series
///
/// Uses a Red-Black tree (std::set) keyed by (timestamp, point id), so points
/// sharing a timestamp still have a total order and range scans are a
/// lower_bound plus a forward walk.
///
/// Not thread-safe. TemporalIndex serializes access per (database, series).
class SeriesIndex {
public:
    using Key = std::pair<Timestamp, std::string>;

    SeriesIndex() = default;

    /// Insert a point
    /// @return true if inserted, false if the exact key was already present
    bool Insert(const std::string& point_id, Timestamp timestamp);

    /// Remove a point
    /// @return true if removed, false if the exact key is absent
    bool Remove(const std::string& point_id, Timestamp timestamp);

    bool Contains(const std::string& point_id, Timestamp timestamp) const;

    /// Find points within a time range
    /// @param start Start timestamp (inclusive)
    /// @param end End timestamp (inclusive)
    /// @param max_results Maximum number of results to return
    /// @return Point ids in ascending (timestamp, id) order
    std::vector<std::string> FindInRange(
        Timestamp start,
        Timestamp end,
        size_t max_results) const;

    size_t Size() const { return keys_.size(); }

    void Clear() { keys_.clear(); }

    /// Statistics about the series
    struct Stats {
        size_t total_points{0};
        std::optional<Timestamp> earliest;
        std::optional<Timestamp> latest;
    };

    Stats GetStats() const;

private:
    std::set<Key> keys_;
};

/// Temporal index manager: one SeriesIndex per (database, series)
///
/// Each series has its own shared_mutex: mutations are exclusive, range
/// queries shared. The manager never creates a series implicitly.
class TemporalIndex {
public:
    /// Statistics across all series
    struct Stats {
        size_t indexed_series{0};
        size_t total_points{0};
    };

    TemporalIndex() = default;

    TemporalIndex(const TemporalIndex&) = delete;
    TemporalIndex& operator=(const TemporalIndex&) = delete;

    /// Create an empty series index
    /// @throws IndexError(ALREADY_EXISTS) if present
    void CreateIndex(const std::string& database, const std::string& series_id);

    /// Replace the series index with one filled by populate
    ///
    /// Created if missing, cleared otherwise; populate runs under the
    /// series' exclusive lock. If populate throws, the series is dropped and
    /// the exception propagates.
    void Rebuild(const std::string& database,
                 const std::string& series_id,
                 const std::function<void(SeriesIndex&)>& populate);

    bool HasIndex(const std::string& database, const std::string& series_id) const;

    /// Insert a point under key (timestamp, point_id); re-inserting a key is a no-op
    /// @throws IndexError(INDEX_NOT_FOUND) if the series has no index
    void Insert(const std::string& database,
                const std::string& series_id,
                const std::string& point_id,
                Timestamp timestamp);

    /// Point ids with start <= timestamp <= end, ascending by (timestamp, id)
    /// @throws IndexError(INVALID_RANGE) if start > end
    /// @throws IndexError(INDEX_NOT_FOUND) if the series has no index
    std::vector<std::string> RangeQuery(const std::string& database,
                                        const std::string& series_id,
                                        Timestamp start,
                                        Timestamp end,
                                        size_t limit) const;

    /// Remove the exact key (timestamp, point_id)
    /// @throws IndexError(INDEX_NOT_FOUND) if the series has no index
    /// @throws IndexError(NOT_FOUND) if the key is absent
    void Delete(const std::string& database,
                const std::string& series_id,
                const std::string& point_id,
                Timestamp timestamp);

    /// Discard a series index; no-op if absent
    void DropIndex(const std::string& database, const std::string& series_id);

    /// Discard every series of a database
    /// @return Number of series dropped
    size_t DropDatabase(const std::string& database);

    /// @throws IndexError(INDEX_NOT_FOUND) if the series has no index
    size_t Size(const std::string& database, const std::string& series_id) const;

    /// @throws IndexError(INDEX_NOT_FOUND) if the series has no index
    SeriesIndex::Stats GetSeriesStats(const std::string& database, const std::string& series_id) const;

    /// Indexed series of a database, sorted
    std::vector<std::string> ListSeries(const std::string& database) const;

    Stats GetStats() const;

private:
    using SeriesKey = std::pair<std::string, std::string>;

    struct SeriesSlot {
        mutable std::shared_mutex mutex;
        SeriesIndex index;
    };

    mutable std::shared_mutex registry_mutex_;

    // Ordered so a database's series are contiguous
    std::map<SeriesKey, std::shared_ptr<SeriesSlot>> series_;

    /// @throws IndexError(INDEX_NOT_FOUND) if absent
    std::shared_ptr<SeriesSlot> FindSlot(const std::string& database, const std::string& series_id) const;
};

} // namespace geochron
