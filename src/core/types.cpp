// File: src/core/types.cpp
#include "core/types.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace geochron {

// Enum implementations

const char* ToString(RecordKind kind) {
    switch (kind) {
        case RecordKind::FEATURE: return "FEATURE";
        case RecordKind::TIME_SERIES: return "TIME_SERIES";
        default: return "UNKNOWN";
    }
}

RecordKind ParseRecordKind(const std::string& str) {
    if (str == "FEATURE") return RecordKind::FEATURE;
    if (str == "TIME_SERIES") return RecordKind::TIME_SERIES;
    throw std::invalid_argument("Unknown RecordKind: " + str);
}

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::INDEX_NOT_FOUND: return "INDEX_NOT_FOUND";
        case ErrorCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case ErrorCode::INVALID_BOUNDING_BOX: return "INVALID_BOUNDING_BOX";
        case ErrorCode::INVALID_RANGE: return "INVALID_RANGE";
        default: return "UNKNOWN";
    }
}

IndexError::IndexError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(ToString(code)) + ": " + message),
      code_(code) {}

// BoundingBox implementations

BoundingBox BoundingBox::Everything() {
    constexpr double kMax = std::numeric_limits<double>::max();
    return BoundingBox(-kMax, -kMax, kMax, kMax);
}

bool BoundingBox::IsValid() const {
    if (!std::isfinite(minx) || !std::isfinite(miny) ||
        !std::isfinite(maxx) || !std::isfinite(maxy)) {
        return false;
    }
    return minx <= maxx && miny <= maxy;
}

double BoundingBox::Area() const {
    return (maxx - minx) * (maxy - miny);
}

BoundingBox BoundingBox::Union(const BoundingBox& other) const {
    return BoundingBox(std::min(minx, other.minx), std::min(miny, other.miny),
                       std::max(maxx, other.maxx), std::max(maxy, other.maxy));
}

double BoundingBox::Enlargement(const BoundingBox& other) const {
    return Union(other).Area() - Area();
}

bool BoundingBox::Intersects(const BoundingBox& other) const {
    return minx <= other.maxx && other.minx <= maxx &&
           miny <= other.maxy && other.miny <= maxy;
}

bool BoundingBox::Contains(const BoundingBox& other) const {
    return minx <= other.minx && miny <= other.miny &&
           maxx >= other.maxx && maxy >= other.maxy;
}

std::string BoundingBox::ToString() const {
    std::ostringstream oss;
    oss << "BoundingBox(" << minx << ", " << miny << ", " << maxx << ", " << maxy << ")";
    return oss.str();
}

void ValidateBoundingBox(const BoundingBox& box) {
    if (!box.IsValid()) {
        throw IndexError(ErrorCode::INVALID_BOUNDING_BOX, box.ToString());
    }
}

} // namespace geochron
