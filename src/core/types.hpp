// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace geochron {

// Timestamp: signed integer in the caller's unit (seconds in the tests)
using Timestamp = int64_t;

// Free-form string attributes (feature properties, point metadata, provenance)
using Properties = std::map<std::string, std::string>;

// RecordKind: The two record kinds held by the journal
enum class RecordKind : uint8_t {
    FEATURE = 0,      // Geospatial feature with a bounding box
    TIME_SERIES = 1,  // Time-series point
};

// Convert RecordKind to string
const char* ToString(RecordKind kind);

// Parse RecordKind from string
RecordKind ParseRecordKind(const std::string& str);

// ErrorCode: Failure kinds raised by the index and cache layer
enum class ErrorCode : uint8_t {
    NOT_FOUND = 0,             // Targeted entry or index absent
    INDEX_NOT_FOUND = 1,       // No index for the database/series (read path falls back)
    ALREADY_EXISTS = 2,        // Duplicate index creation
    INVALID_BOUNDING_BOX = 3,  // minx > maxx, miny > maxy, or non-finite coordinate
    INVALID_RANGE = 4,         // start > end
};

// Convert ErrorCode to string
const char* ToString(ErrorCode code);

/// Exception carrying an ErrorCode
class IndexError : public std::runtime_error {
public:
    IndexError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// BoundingBox: Axis-aligned rectangle (minx, miny, maxx, maxy)
struct BoundingBox {
    double minx{0.0};
    double miny{0.0};
    double maxx{0.0};
    double maxy{0.0};

    BoundingBox() = default;
    BoundingBox(double min_x, double min_y, double max_x, double max_y)
        : minx(min_x), miny(min_y), maxx(max_x), maxy(max_y) {}

    // Box covering every finite coordinate
    static BoundingBox Everything();

    // Degenerate box for a single position
    static BoundingBox FromPoint(double x, double y) { return BoundingBox(x, y, x, y); }

    // True if ordered and every coordinate is finite
    bool IsValid() const;

    double Area() const;

    // Minimal box covering both
    BoundingBox Union(const BoundingBox& other) const;

    // Area growth needed to also cover other
    double Enlargement(const BoundingBox& other) const;

    // Inclusive intersection: touching boundaries intersect
    bool Intersects(const BoundingBox& other) const;

    bool Contains(const BoundingBox& other) const;

    bool operator==(const BoundingBox& other) const {
        return minx == other.minx && miny == other.miny &&
               maxx == other.maxx && maxy == other.maxy;
    }
    bool operator!=(const BoundingBox& other) const { return !(*this == other); }

    // String conversion for debugging
    std::string ToString() const;
};

/// Throw IndexError(INVALID_BOUNDING_BOX) unless box.IsValid()
void ValidateBoundingBox(const BoundingBox& box);

} // namespace geochron
