// File: src/core/record.hpp
#pragma once

#include "core/geometry.hpp"
#include "core/types.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace geochron {

/// A journal record: either a geospatial feature or a time-series point
///
/// The journal owns record content; indexes refer to records by id only.
struct Record {
    std::string id;
    std::string database;
    RecordKind kind{RecordKind::FEATURE};

    // FEATURE fields
    Geometry geometry;
    BoundingBox bbox;
    Properties properties;

    // TIME_SERIES fields
    std::string series_id;
    Timestamp timestamp{0};
    double value{0.0};
    Properties metadata;

    // Source of the record (both kinds)
    Properties provenance;

    /// Build a feature record; the bounding box is computed from the geometry
    /// @throws IndexError(INVALID_BOUNDING_BOX) for an empty or non-finite geometry
    static Record MakeFeature(
        const std::string& database,
        const std::string& id,
        const Geometry& geometry,
        const Properties& properties = {},
        const Properties& provenance = {});

    /// Build a time-series point record
    static Record MakePoint(
        const std::string& database,
        const std::string& series_id,
        const std::string& id,
        Timestamp timestamp,
        double value,
        const Properties& metadata = {},
        const Properties& provenance = {});

    bool operator==(const Record& other) const;
    bool operator!=(const Record& other) const { return !(*this == other); }

    // Binary serialization (used by the SQLite journal)
    void Serialize(std::ostream& out) const;
    static Record Deserialize(std::istream& in);
};

// Sort by record id
void SortById(std::vector<Record>& records);

// Sort by (timestamp, id)
void SortByOrderingKey(std::vector<Record>& records);

} // namespace geochron
