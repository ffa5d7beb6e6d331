// File: src/core/query_result.hpp
#pragma once

#include "core/record.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geochron {

// QueryOrigin: Where a read-path result came from
enum class QueryOrigin : uint8_t {
    CACHE = 0,     // Served from the result cache
    INDEX = 1,     // Index lookup plus journal fetch
    FALLBACK = 2,  // Index absent, journal full scan
};

// Convert QueryOrigin to string
const char* ToString(QueryOrigin origin);

// Aggregation: Reduction applied to time-series values
enum class Aggregation : uint8_t {
    NONE = 0,
    AVG = 1,
    MIN = 2,
    MAX = 3,
    SUM = 4,
    COUNT = 5,
};

// Convert Aggregation to its query-parameter name ("none", "avg", ...)
const char* ToString(Aggregation aggregation);

// Parse Aggregation from its query-parameter name
Aggregation ParseAggregation(const std::string& str);

/// Result of a bounding-box or time-series query
struct QueryResult {
    std::vector<Record> records;

    /// Aggregate over every point in range (not just the returned page)
    std::optional<double> aggregate;

    QueryOrigin origin{QueryOrigin::INDEX};
};

/// Reduce the values of time-series records
/// @return nullopt for NONE, or for an empty input unless COUNT
std::optional<double> Aggregate(const std::vector<Record>& points, Aggregation aggregation);

} // namespace geochron
