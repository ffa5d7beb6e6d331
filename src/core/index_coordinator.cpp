// File: src/core/index_coordinator.cpp
#include "core/index_coordinator.hpp"
#include "config/engine_config.hpp"
#include <algorithm>
#include <limits>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace geochron {

namespace {

ChangeEvent MakeInsertEvent(const Record& record) {
    ChangeEvent event;
    event.database = record.database;
    event.change = ChangeType::INSERT;
    event.kind = record.kind;
    event.record_id = record.id;
    event.provenance = record.provenance;

    if (record.kind == RecordKind::FEATURE) {
        event.bbox = record.bbox;
        event.metadata = record.properties;
    } else {
        event.series_id = record.series_id;
        event.timestamp = record.timestamp;
        event.value = record.value;
        event.metadata = record.metadata;
    }

    return event;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

IndexCoordinator::IndexCoordinator(std::shared_ptr<Journal> journal)
    : IndexCoordinator(Config{}, std::move(journal)) {}

IndexCoordinator::IndexCoordinator(const Config& config, std::shared_ptr<Journal> journal)
    : IndexCoordinator(config, std::move(journal), std::make_unique<QueryCache>(config.cache)) {}

IndexCoordinator::IndexCoordinator(const Config& config,
                                   std::shared_ptr<Journal> journal,
                                   std::unique_ptr<QueryCache> cache)
    : config_(config),
      journal_(std::move(journal)),
      spatial_(config.spatial),
      cache_(std::move(cache)) {
    if (!journal_) {
        throw std::invalid_argument("IndexCoordinator requires a journal");
    }
    if (!cache_) {
        throw std::invalid_argument("IndexCoordinator requires a cache");
    }

    if (config_.start_sweeper) {
        cache_->StartSweeper();
    }
}

IndexCoordinator::~IndexCoordinator() {
    cache_->StopSweeper();
}

// ============================================================================
// Database Lifecycle
// ============================================================================

void IndexCoordinator::CreateDatabase(const std::string& database) {
    spatial_.CreateIndex(database);

    if (journal_->Count(database) > 0) {
        RebuildIndexes(database);
    }

    spdlog::info("Created database {}", database);
}

void IndexCoordinator::DropDatabase(const std::string& database) {
    spatial_.DropIndex(database);
    size_t series = temporal_.DropDatabase(database);
    InvalidateDatabase(database);
    cache_->ForgetDatabase(database);
    size_t subscriptions = subscribers_.RemoveDatabase(database);

    spdlog::info("Dropped database {} ({} series, {} subscriptions)",
                 database, series, subscriptions);
}

void IndexCoordinator::CreateSeries(const std::string& database, const std::string& series_id) {
    if (temporal_.HasIndex(database, series_id)) {
        throw IndexError(ErrorCode::ALREADY_EXISTS,
                         "temporal index for series " + series_id + " in database " + database);
    }

    RebuildSeries(database, series_id);
    spdlog::info("Created series {} in database {}", series_id, database);
}

size_t IndexCoordinator::RebuildIndexes(const std::string& database) {
    RebuildSpatial(database);

    // Series known to either side: indexed series with no points left are emptied
    std::set<std::string> series;
    for (const auto& series_id : journal_->ListSeries(database)) {
        series.insert(series_id);
    }
    for (const auto& series_id : temporal_.ListSeries(database)) {
        series.insert(series_id);
    }

    for (const auto& series_id : series) {
        RebuildSeries(database, series_id);
    }

    InvalidateDatabase(database);

    size_t indexed = spatial_.Size(database);
    for (const auto& series_id : series) {
        indexed += temporal_.Size(database, series_id);
    }

    spdlog::info("Rebuilt indexes for database {}: {} records", database, indexed);
    return indexed;
}

void IndexCoordinator::ReplayFeatures(const std::string& database, RTree& tree) const {
    for (const auto& record : journal_->FullScanBBox(database, BoundingBox::Everything())) {
        tree.Insert(record.id, record.bbox);
    }
}

void IndexCoordinator::ReplayPoints(const std::string& database,
                                    const std::string& series_id,
                                    SeriesIndex& index) const {
    auto points = journal_->FullScanTimeSeries(database, series_id,
                                               std::numeric_limits<Timestamp>::min(),
                                               std::numeric_limits<Timestamp>::max());
    for (const auto& point : points) {
        index.Insert(point.id, point.timestamp);
    }
}

void IndexCoordinator::RebuildSpatial(const std::string& database) {
    spatial_.Rebuild(database, [&](RTree& tree) {
        ReplayFeatures(database, tree);
    });
}

void IndexCoordinator::RebuildSeries(const std::string& database, const std::string& series_id) {
    temporal_.Rebuild(database, series_id, [&](SeriesIndex& index) {
        ReplayPoints(database, series_id, index);
    });
}

// ============================================================================
// Write Path
// ============================================================================

void IndexCoordinator::IndexFeature(const std::string& database,
                                    const std::string& feature_id,
                                    const BoundingBox& bbox) {
    try {
        spatial_.Insert(database, feature_id, bbox);
        return;
    } catch (const IndexError& e) {
        if (e.code() != ErrorCode::INDEX_NOT_FOUND || !config_.auto_create_indexes) {
            throw;
        }
    }

    // Replay the journal, then add the record in case the host has not journaled it
    spdlog::info("Building spatial index for database {} from journal", database);
    spatial_.Rebuild(database, [&](RTree& tree) {
        ReplayFeatures(database, tree);
        tree.Insert(feature_id, bbox);
    });
}

void IndexCoordinator::IndexPoint(const std::string& database,
                                  const std::string& series_id,
                                  const std::string& point_id,
                                  Timestamp timestamp) {
    try {
        temporal_.Insert(database, series_id, point_id, timestamp);
        return;
    } catch (const IndexError& e) {
        if (e.code() != ErrorCode::INDEX_NOT_FOUND || !config_.auto_create_indexes) {
            throw;
        }
    }

    spdlog::info("Building temporal index for series {} in database {} from journal",
                 series_id, database);
    temporal_.Rebuild(database, series_id, [&](SeriesIndex& index) {
        ReplayPoints(database, series_id, index);
        index.Insert(point_id, timestamp);
    });
}

void IndexCoordinator::InvalidateDatabase(const std::string& database) {
    try {
        cache_->InvalidateDatabase(database);
    } catch (const std::exception& e) {
        cache_escalations_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Cache invalidation for database {} failed ({}); clearing cache",
                      database, e.what());
        cache_->Clear();
    }
}

void IndexCoordinator::OnInsertFeature(const std::string& database,
                                       const std::string& feature_id,
                                       const BoundingBox& bbox,
                                       const Record& record) {
    ValidateBoundingBox(bbox);

    writes_.fetch_add(1, std::memory_order_relaxed);

    // Step 1: index
    try {
        IndexFeature(database, feature_id, bbox);
    } catch (const std::exception& e) {
        index_update_failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("Spatial index update for {} in database {} failed: {}",
                     feature_id, database, e.what());
    }

    // Step 2: invalidate (runs even if step 1 failed)
    InvalidateDatabase(database);

    // Step 3: notify
    ChangeEvent event = MakeInsertEvent(record);
    event.database = database;
    event.record_id = feature_id;
    event.kind = RecordKind::FEATURE;
    event.bbox = bbox;
    subscribers_.Publish(std::move(event));
}

void IndexCoordinator::OnInsertPoint(const std::string& database,
                                     const std::string& series_id,
                                     const std::string& point_id,
                                     Timestamp timestamp,
                                     const Record& record) {
    writes_.fetch_add(1, std::memory_order_relaxed);

    try {
        IndexPoint(database, series_id, point_id, timestamp);
    } catch (const std::exception& e) {
        index_update_failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("Temporal index update for {} in series {} of database {} failed: {}",
                     point_id, series_id, database, e.what());
    }

    InvalidateDatabase(database);

    ChangeEvent event = MakeInsertEvent(record);
    event.database = database;
    event.record_id = point_id;
    event.kind = RecordKind::TIME_SERIES;
    event.series_id = series_id;
    event.timestamp = timestamp;
    subscribers_.Publish(std::move(event));
}

void IndexCoordinator::OnDeleteFeature(const std::string& database, const std::string& feature_id) {
    deletes_.fetch_add(1, std::memory_order_relaxed);

    // Keep the box so bbox-filtered subscribers see the delete
    std::optional<BoundingBox> bbox;

    try {
        bbox = spatial_.GetBoundingBox(database, feature_id);
        spatial_.Delete(database, feature_id);
    } catch (const IndexError& e) {
        spdlog::warn("Spatial index delete for {} in database {}: {}",
                     feature_id, database, e.what());
    }

    InvalidateDatabase(database);

    ChangeEvent event;
    event.database = database;
    event.change = ChangeType::DELETE;
    event.kind = RecordKind::FEATURE;
    event.record_id = feature_id;
    event.bbox = bbox;
    subscribers_.Publish(std::move(event));
}

void IndexCoordinator::OnDeletePoint(const std::string& database,
                                     const std::string& series_id,
                                     const std::string& point_id,
                                     Timestamp timestamp) {
    deletes_.fetch_add(1, std::memory_order_relaxed);

    try {
        temporal_.Delete(database, series_id, point_id, timestamp);
    } catch (const IndexError& e) {
        spdlog::warn("Temporal index delete for {} in series {} of database {}: {}",
                     point_id, series_id, database, e.what());
    }

    InvalidateDatabase(database);

    ChangeEvent event;
    event.database = database;
    event.change = ChangeType::DELETE;
    event.kind = RecordKind::TIME_SERIES;
    event.record_id = point_id;
    event.series_id = series_id;
    event.timestamp = timestamp;
    subscribers_.Publish(std::move(event));
}

bool IndexCoordinator::InsertFeature(const Record& record) {
    if (record.kind != RecordKind::FEATURE) {
        throw std::invalid_argument("InsertFeature requires a FEATURE record");
    }
    ValidateBoundingBox(record.bbox);

    if (!journal_->Append(record)) {
        return false;
    }

    OnInsertFeature(record.database, record.id, record.bbox, record);
    return true;
}

bool IndexCoordinator::InsertPoint(const Record& record) {
    if (record.kind != RecordKind::TIME_SERIES) {
        throw std::invalid_argument("InsertPoint requires a TIME_SERIES record");
    }

    if (!journal_->Append(record)) {
        return false;
    }

    OnInsertPoint(record.database, record.series_id, record.id, record.timestamp, record);
    return true;
}

bool IndexCoordinator::DeleteRecord(const std::string& database, const std::string& id) {
    auto found = journal_->FetchByIds(database, {id});
    if (found.empty() || !journal_->Delete(database, id)) {
        return false;
    }

    const Record& record = found.front();
    if (record.kind == RecordKind::FEATURE) {
        OnDeleteFeature(database, id);
    } else {
        OnDeletePoint(database, record.series_id, id, record.timestamp);
    }
    return true;
}

// ============================================================================
// Read Path
// ============================================================================

QueryResult IndexCoordinator::Remember(const QueryKey& key, QueryResult result, uint64_t generation) {
    if (result.origin == QueryOrigin::FALLBACK) {
        fallback_queries_.fetch_add(1, std::memory_order_relaxed);
    } else {
        index_queries_.fetch_add(1, std::memory_order_relaxed);
    }

    cache_->PutIfCurrent(key, result, generation);
    return result;
}

QueryResult IndexCoordinator::QueryBBox(const std::string& database, const BoundingBox& bbox) {
    return QueryBBox(database, bbox, config_.default_limit);
}

QueryResult IndexCoordinator::QueryBBox(const std::string& database,
                                        const BoundingBox& bbox,
                                        size_t limit) {
    ValidateBoundingBox(bbox);

    QueryKey key = MakeQueryKey(database, "bbox", {
        {"minx", FormatKeyNumber(bbox.minx)},
        {"miny", FormatKeyNumber(bbox.miny)},
        {"maxx", FormatKeyNumber(bbox.maxx)},
        {"maxy", FormatKeyNumber(bbox.maxy)},
        {"limit", std::to_string(limit)},
    });

    if (auto cached = cache_->Get(key)) {
        cache_queries_.fetch_add(1, std::memory_order_relaxed);
        cached->origin = QueryOrigin::CACHE;
        return *cached;
    }

    // Read before the index so a concurrent write's invalidation rejects our put
    uint64_t generation = cache_->Generation(database);

    QueryResult result;
    try {
        auto ids = spatial_.Query(database, bbox);
        result.records = journal_->FetchByIds(database, ids);
        result.origin = QueryOrigin::INDEX;
    } catch (const IndexError& e) {
        if (e.code() != ErrorCode::INDEX_NOT_FOUND) {
            throw;
        }
        spdlog::debug("No spatial index for database {}; scanning journal", database);
        result.records = journal_->FullScanBBox(database, bbox);
        result.origin = QueryOrigin::FALLBACK;
    }

    SortById(result.records);
    if (result.records.size() > limit) {
        result.records.resize(limit);
    }

    return Remember(key, std::move(result), generation);
}

QueryResult IndexCoordinator::QueryTimeSeries(const std::string& database,
                                              const std::string& series_id,
                                              Timestamp start,
                                              Timestamp end,
                                              Aggregation aggregation) {
    return QueryTimeSeries(database, series_id, start, end,
                           config_.default_series_limit, aggregation);
}

QueryResult IndexCoordinator::QueryTimeSeries(const std::string& database,
                                              const std::string& series_id,
                                              Timestamp start,
                                              Timestamp end,
                                              size_t limit,
                                              Aggregation aggregation) {
    if (start > end) {
        throw IndexError(ErrorCode::INVALID_RANGE,
                         "start " + std::to_string(start) + " > end " + std::to_string(end));
    }

    QueryKey key = MakeQueryKey(database, "timeseries", {
        {"series", series_id},
        {"start", std::to_string(start)},
        {"end", std::to_string(end)},
        {"limit", std::to_string(limit)},
        {"aggregation", ToString(aggregation)},
    });

    if (auto cached = cache_->Get(key)) {
        cache_queries_.fetch_add(1, std::memory_order_relaxed);
        cached->origin = QueryOrigin::CACHE;
        return *cached;
    }

    uint64_t generation = cache_->Generation(database);

    // An aggregate needs every point in range, not just the first page
    size_t scan_limit = aggregation == Aggregation::NONE
        ? limit
        : std::numeric_limits<size_t>::max();

    QueryResult result;
    try {
        auto ids = temporal_.RangeQuery(database, series_id, start, end, scan_limit);
        result.records = journal_->FetchByIds(database, ids);
        result.origin = QueryOrigin::INDEX;
    } catch (const IndexError& e) {
        if (e.code() != ErrorCode::INDEX_NOT_FOUND) {
            throw;
        }
        spdlog::debug("No temporal index for series {} in database {}; scanning journal",
                      series_id, database);
        result.records = journal_->FullScanTimeSeries(database, series_id, start, end);
        result.origin = QueryOrigin::FALLBACK;
    }

    SortByOrderingKey(result.records);
    result.aggregate = Aggregate(result.records, aggregation);
    if (result.records.size() > limit) {
        result.records.resize(limit);
    }

    return Remember(key, std::move(result), generation);
}

// ============================================================================
// Subscriptions
// ============================================================================

SubscriptionHandle IndexCoordinator::Subscribe(const std::string& database,
                                               const SubscriptionFilter& filter,
                                               EventSink sink) {
    return subscribers_.Subscribe(database, filter, std::move(sink));
}

bool IndexCoordinator::Unsubscribe(SubscriptionHandle handle) {
    return subscribers_.Unsubscribe(handle);
}

// ============================================================================
// Statistics
// ============================================================================

IndexCoordinator::Statistics IndexCoordinator::GetStatistics() const {
    Statistics stats;
    stats.writes = writes_.load(std::memory_order_relaxed);
    stats.deletes = deletes_.load(std::memory_order_relaxed);
    stats.index_update_failures = index_update_failures_.load(std::memory_order_relaxed);
    stats.cache_escalations = cache_escalations_.load(std::memory_order_relaxed);
    stats.cache_queries = cache_queries_.load(std::memory_order_relaxed);
    stats.index_queries = index_queries_.load(std::memory_order_relaxed);
    stats.fallback_queries = fallback_queries_.load(std::memory_order_relaxed);

    stats.spatial = spatial_.GetStats();
    stats.temporal = temporal_.GetStats();
    stats.cache = cache_->GetStats();
    stats.subscribers = subscribers_.GetStats();
    return stats;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<IndexCoordinator> CreateCoordinator(const EngineConfig& config) {
    auto errors = config.GetValidationErrors();
    if (!errors.empty()) {
        throw std::invalid_argument("Invalid engine configuration: " + errors.front());
    }

    spdlog::set_level(spdlog::level::from_str(config.logging.level));

    std::shared_ptr<Journal> journal = CreateJournal(
        ParseJournalBackend(config.journal.backend),
        config.journal.sqlite_path);

    return std::make_unique<IndexCoordinator>(config.ToCoordinatorConfig(), std::move(journal));
}

} // namespace geochron
