// File: src/core/geometry.cpp
#include "core/geometry.hpp"
#include <algorithm>
#include <cmath>
#include <istream>
#include <ostream>

namespace geochron {

const char* ToString(GeometryType type) {
    switch (type) {
        case GeometryType::POINT: return "Point";
        case GeometryType::MULTI_POINT: return "MultiPoint";
        case GeometryType::LINE_STRING: return "LineString";
        case GeometryType::MULTI_LINE_STRING: return "MultiLineString";
        case GeometryType::POLYGON: return "Polygon";
        case GeometryType::MULTI_POLYGON: return "MultiPolygon";
        default: return "Unknown";
    }
}

GeometryType ParseGeometryType(const std::string& str) {
    if (str == "Point") return GeometryType::POINT;
    if (str == "MultiPoint") return GeometryType::MULTI_POINT;
    if (str == "LineString") return GeometryType::LINE_STRING;
    if (str == "MultiLineString") return GeometryType::MULTI_LINE_STRING;
    if (str == "Polygon") return GeometryType::POLYGON;
    if (str == "MultiPolygon") return GeometryType::MULTI_POLYGON;
    throw std::invalid_argument("Unknown GeometryType: " + str);
}

Geometry Geometry::Point(double x, double y) {
    Geometry geometry;
    geometry.type = GeometryType::POINT;
    geometry.positions.push_back(Position{x, y});
    return geometry;
}

Geometry Geometry::LineString(std::vector<Position> positions) {
    Geometry geometry;
    geometry.type = GeometryType::LINE_STRING;
    geometry.positions = std::move(positions);
    return geometry;
}

Geometry Geometry::Polygon(std::vector<Position> ring) {
    Geometry geometry;
    geometry.type = GeometryType::POLYGON;
    geometry.positions = std::move(ring);
    return geometry;
}

void Geometry::Serialize(std::ostream& out) const {
    uint8_t type_value = static_cast<uint8_t>(type);
    out.write(reinterpret_cast<const char*>(&type_value), sizeof(type_value));

    uint64_t count = positions.size();
    out.write(reinterpret_cast<const char*>(&count), sizeof(count));
    for (const auto& position : positions) {
        out.write(reinterpret_cast<const char*>(&position.x), sizeof(position.x));
        out.write(reinterpret_cast<const char*>(&position.y), sizeof(position.y));
    }
}

Geometry Geometry::Deserialize(std::istream& in) {
    Geometry geometry;

    uint8_t type_value = 0;
    in.read(reinterpret_cast<char*>(&type_value), sizeof(type_value));
    geometry.type = static_cast<GeometryType>(type_value);

    uint64_t count = 0;
    in.read(reinterpret_cast<char*>(&count), sizeof(count));
    if (!in) {
        throw std::runtime_error("Truncated geometry");
    }

    geometry.positions.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        Position position;
        in.read(reinterpret_cast<char*>(&position.x), sizeof(position.x));
        in.read(reinterpret_cast<char*>(&position.y), sizeof(position.y));
        if (!in) {
            throw std::runtime_error("Truncated geometry");
        }
        geometry.positions.push_back(position);
    }

    return geometry;
}

BoundingBox ComputeBoundingBox(const Geometry& geometry) {
    if (geometry.positions.empty()) {
        throw IndexError(ErrorCode::INVALID_BOUNDING_BOX,
                         std::string("empty ") + ToString(geometry.type));
    }

    const auto& first = geometry.positions.front();
    BoundingBox box = BoundingBox::FromPoint(first.x, first.y);

    for (const auto& position : geometry.positions) {
        if (!std::isfinite(position.x) || !std::isfinite(position.y)) {
            throw IndexError(ErrorCode::INVALID_BOUNDING_BOX,
                             std::string("non-finite coordinate in ") + ToString(geometry.type));
        }
        box.minx = std::min(box.minx, position.x);
        box.miny = std::min(box.miny, position.y);
        box.maxx = std::max(box.maxx, position.x);
        box.maxy = std::max(box.maxy, position.y);
    }

    return box;
}

} // namespace geochron
