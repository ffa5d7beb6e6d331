// File: src/core/index_coordinator.hpp
#pragma once

#include "core/query_result.hpp"
#include "events/subscriber_registry.hpp"
#include "storage/indices/spatial_index.hpp"
#include "storage/indices/temporal_index.hpp"
#include "storage/journal.hpp"
#include "storage/query_cache.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace geochron {

struct EngineConfig;

/// IndexCoordinator - Keeps indexes, cache and subscribers in step with the journal
///
/// Write path (OnInsertFeature / OnInsertPoint), in order:
///   1. update the owning index (failures are logged, never surfaced)
///   2. invalidate the database's cached results (failure clears the cache)
///   3. publish a change event
///
/// Read path (QueryBBox / QueryTimeSeries): cache, then index plus journal
/// fetch, then journal full scan when the index is missing.
///
/// The coordinator does not write the journal itself in the On* calls; the
/// host appends first. InsertFeature / InsertPoint do both.
class IndexCoordinator {
public:
    /// Configuration for the coordinator
    struct Config {
        SpatialIndex::Config spatial;
        QueryCache::Config cache;

        /// Build a missing index from the journal on the first write
        bool auto_create_indexes{true};

        /// Default result limit for bounding-box queries
        size_t default_limit{100};

        /// Default result limit for time-series queries
        size_t default_series_limit{1000};

        /// Run the cache's background TTL sweep
        bool start_sweeper{true};
    };

    /// Coordinator statistics
    struct Statistics {
        uint64_t writes{0};
        uint64_t deletes{0};
        uint64_t index_update_failures{0};
        uint64_t cache_escalations{0};
        uint64_t cache_queries{0};
        uint64_t index_queries{0};
        uint64_t fallback_queries{0};

        SpatialIndex::Stats spatial;
        TemporalIndex::Stats temporal;
        QueryCache::Stats cache;
        SubscriberRegistry::Stats subscribers;
    };

    /// @param journal Source of record content (must not be null)
    /// @throws std::invalid_argument if journal is null
    explicit IndexCoordinator(std::shared_ptr<Journal> journal);

    /// @throws std::invalid_argument if journal is null or the cache config is invalid
    IndexCoordinator(const Config& config, std::shared_ptr<Journal> journal);

    /// Use a caller-built cache in place of one built from config.cache
    /// @throws std::invalid_argument if journal or cache is null
    IndexCoordinator(const Config& config,
                     std::shared_ptr<Journal> journal,
                     std::unique_ptr<QueryCache> cache);

    ~IndexCoordinator();

    // Disable copy and move
    IndexCoordinator(const IndexCoordinator&) = delete;
    IndexCoordinator& operator=(const IndexCoordinator&) = delete;
    IndexCoordinator(IndexCoordinator&&) = delete;
    IndexCoordinator& operator=(IndexCoordinator&&) = delete;

    // ========================================================================
    // Database Lifecycle
    // ========================================================================

    /// Create the database's spatial index, filled from any journal records
    /// @throws IndexError(ALREADY_EXISTS) if the database is already indexed
    void CreateDatabase(const std::string& database);

    /// Drop every index of a database, its cached results and subscriptions
    /// The journal is left untouched.
    void DropDatabase(const std::string& database);

    /// Create a temporal index for a series, filled from any journal points
    /// @throws IndexError(ALREADY_EXISTS) if the series is already indexed
    void CreateSeries(const std::string& database, const std::string& series_id);

    /// Rebuild the database's spatial index and every series index from the journal
    /// @return Number of records indexed
    size_t RebuildIndexes(const std::string& database);

    // ========================================================================
    // Write Path
    // ========================================================================

    /// Notify of a feature accepted into the journal
    /// @throws IndexError(INVALID_BOUNDING_BOX) if bbox is invalid (nothing else happens)
    void OnInsertFeature(const std::string& database,
                         const std::string& feature_id,
                         const BoundingBox& bbox,
                         const Record& record);

    /// Notify of a time-series point accepted into the journal
    void OnInsertPoint(const std::string& database,
                       const std::string& series_id,
                       const std::string& point_id,
                       Timestamp timestamp,
                       const Record& record);

    /// Notify of a feature removed from the journal
    void OnDeleteFeature(const std::string& database, const std::string& feature_id);

    /// Notify of a point removed from the journal
    void OnDeletePoint(const std::string& database,
                       const std::string& series_id,
                       const std::string& point_id,
                       Timestamp timestamp);

    /// Append to the journal, then run the write path
    /// @return false if the id already exists in the journal
    bool InsertFeature(const Record& record);

    /// Append to the journal, then run the write path
    /// @return false if the id already exists in the journal
    bool InsertPoint(const Record& record);

    /// Remove from the journal, then run the delete path
    /// @return false if the record is not in the journal
    bool DeleteRecord(const std::string& database, const std::string& id);

    // ========================================================================
    // Read Path
    // ========================================================================

    /// Features intersecting bbox, sorted by id
    /// @throws IndexError(INVALID_BOUNDING_BOX) for an invalid box
    QueryResult QueryBBox(const std::string& database, const BoundingBox& bbox);
    QueryResult QueryBBox(const std::string& database, const BoundingBox& bbox, size_t limit);

    /// Points of a series with start <= timestamp <= end, ascending by (timestamp, id)
    ///
    /// The aggregate covers every point in range, not only the returned page.
    /// @throws IndexError(INVALID_RANGE) if start > end
    QueryResult QueryTimeSeries(const std::string& database,
                                const std::string& series_id,
                                Timestamp start,
                                Timestamp end,
                                Aggregation aggregation = Aggregation::NONE);
    QueryResult QueryTimeSeries(const std::string& database,
                                const std::string& series_id,
                                Timestamp start,
                                Timestamp end,
                                size_t limit,
                                Aggregation aggregation = Aggregation::NONE);

    // ========================================================================
    // Subscriptions
    // ========================================================================

    SubscriptionHandle Subscribe(const std::string& database,
                                 const SubscriptionFilter& filter,
                                 EventSink sink);

    bool Unsubscribe(SubscriptionHandle handle);

    // ========================================================================
    // Statistics & Components
    // ========================================================================

    Statistics GetStatistics() const;

    const Config& GetConfig() const { return config_; }

    SpatialIndex& GetSpatialIndex() { return spatial_; }
    TemporalIndex& GetTemporalIndex() { return temporal_; }
    QueryCache& GetCache() { return *cache_; }
    SubscriberRegistry& GetSubscribers() { return subscribers_; }
    Journal& GetJournal() { return *journal_; }

private:
    Config config_;

    std::shared_ptr<Journal> journal_;
    SpatialIndex spatial_;
    TemporalIndex temporal_;
    std::unique_ptr<QueryCache> cache_;
    SubscriberRegistry subscribers_;

    // Statistics tracking
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> deletes_{0};
    std::atomic<uint64_t> index_update_failures_{0};
    std::atomic<uint64_t> cache_escalations_{0};
    std::atomic<uint64_t> cache_queries_{0};
    std::atomic<uint64_t> index_queries_{0};
    std::atomic<uint64_t> fallback_queries_{0};

    // Helper methods
    void IndexFeature(const std::string& database, const std::string& feature_id, const BoundingBox& bbox);
    void IndexPoint(const std::string& database, const std::string& series_id,
                    const std::string& point_id, Timestamp timestamp);
    void ReplayFeatures(const std::string& database, RTree& tree) const;
    void ReplayPoints(const std::string& database, const std::string& series_id, SeriesIndex& index) const;
    void RebuildSpatial(const std::string& database);
    void RebuildSeries(const std::string& database, const std::string& series_id);
    void InvalidateDatabase(const std::string& database);
    QueryResult Remember(const QueryKey& key, QueryResult result, uint64_t generation);
};

/// Build a coordinator with the journal named by the configuration
///
/// Also applies the configured log level to the default spdlog logger.
/// @throws std::invalid_argument if the configuration is invalid
/// @throws std::runtime_error if the journal cannot be opened
std::unique_ptr<IndexCoordinator> CreateCoordinator(const EngineConfig& config);

} // namespace geochron
