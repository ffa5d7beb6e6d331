// File: src/core/geometry.hpp
#pragma once

#include "core/types.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace geochron {

// GeometryType: GeoJSON geometry kinds accepted for features
enum class GeometryType : uint8_t {
    POINT = 0,
    MULTI_POINT = 1,
    LINE_STRING = 2,
    MULTI_LINE_STRING = 3,
    POLYGON = 4,
    MULTI_POLYGON = 5,
};

// Convert GeometryType to its GeoJSON name ("Point", "Polygon", ...)
const char* ToString(GeometryType type);

// Parse GeometryType from its GeoJSON name
GeometryType ParseGeometryType(const std::string& str);

struct Position {
    double x{0.0};
    double y{0.0};
};

/// Feature geometry
///
/// Rings and parts are flattened into one position list; only the extent
/// matters to the index.
struct Geometry {
    GeometryType type{GeometryType::POINT};
    std::vector<Position> positions;

    static Geometry Point(double x, double y);
    static Geometry LineString(std::vector<Position> positions);
    static Geometry Polygon(std::vector<Position> ring);

    void Serialize(std::ostream& out) const;
    static Geometry Deserialize(std::istream& in);
};

/// Minimal box covering every position of the geometry
/// @throws IndexError(INVALID_BOUNDING_BOX) if the geometry is empty or
///         has a non-finite coordinate
BoundingBox ComputeBoundingBox(const Geometry& geometry);

} // namespace geochron
