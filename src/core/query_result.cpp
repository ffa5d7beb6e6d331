// File: src/core/query_result.cpp
#include "core/query_result.hpp"
#include <algorithm>
#include <stdexcept>

namespace geochron {

const char* ToString(QueryOrigin origin) {
    switch (origin) {
        case QueryOrigin::CACHE: return "CACHE";
        case QueryOrigin::INDEX: return "INDEX";
        case QueryOrigin::FALLBACK: return "FALLBACK";
        default: return "UNKNOWN";
    }
}

const char* ToString(Aggregation aggregation) {
    switch (aggregation) {
        case Aggregation::NONE: return "none";
        case Aggregation::AVG: return "avg";
        case Aggregation::MIN: return "min";
        case Aggregation::MAX: return "max";
        case Aggregation::SUM: return "sum";
        case Aggregation::COUNT: return "count";
        default: return "unknown";
    }
}

Aggregation ParseAggregation(const std::string& str) {
    if (str == "none") return Aggregation::NONE;
    if (str == "avg") return Aggregation::AVG;
    if (str == "min") return Aggregation::MIN;
    if (str == "max") return Aggregation::MAX;
    if (str == "sum") return Aggregation::SUM;
    if (str == "count") return Aggregation::COUNT;
    throw std::invalid_argument("Unknown Aggregation: " + str);
}

std::optional<double> Aggregate(const std::vector<Record>& points, Aggregation aggregation) {
    if (aggregation == Aggregation::NONE) {
        return std::nullopt;
    }
    if (aggregation == Aggregation::COUNT) {
        return static_cast<double>(points.size());
    }
    if (points.empty()) {
        return std::nullopt;
    }

    double sum = 0.0;
    double min_value = points.front().value;
    double max_value = points.front().value;
    for (const auto& point : points) {
        sum += point.value;
        min_value = std::min(min_value, point.value);
        max_value = std::max(max_value, point.value);
    }

    switch (aggregation) {
        case Aggregation::AVG: return sum / static_cast<double>(points.size());
        case Aggregation::MIN: return min_value;
        case Aggregation::MAX: return max_value;
        case Aggregation::SUM: return sum;
        default: return std::nullopt;
    }
}

} // namespace geochron
