// File: tests/core/geometry_test.cpp
#include "core/geometry.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <sstream>

namespace geochron {
namespace {

TEST(GeometryTypeTest, GeoJsonNames) {
    EXPECT_STREQ("Point", ToString(GeometryType::POINT));
    EXPECT_STREQ("MultiPolygon", ToString(GeometryType::MULTI_POLYGON));

    EXPECT_EQ(GeometryType::LINE_STRING, ParseGeometryType("LineString"));
    EXPECT_EQ(GeometryType::MULTI_LINE_STRING, ParseGeometryType("MultiLineString"));
    EXPECT_THROW(ParseGeometryType("Circle"), std::invalid_argument);
}

TEST(GeometryTest, PointBoxIsDegenerate) {
    auto box = ComputeBoundingBox(Geometry::Point(-74.006, 40.7128));

    EXPECT_EQ(BoundingBox(-74.006, 40.7128, -74.006, 40.7128), box);
    EXPECT_DOUBLE_EQ(0.0, box.Area());
}

TEST(GeometryTest, PolygonBoxCoversRing) {
    auto polygon = Geometry::Polygon({
        {-74.1, 40.6}, {-73.9, 40.6}, {-73.9, 40.8}, {-74.1, 40.8}, {-74.1, 40.6}
    });

    EXPECT_EQ(BoundingBox(-74.1, 40.6, -73.9, 40.8), ComputeBoundingBox(polygon));
}

TEST(GeometryTest, LineStringBox) {
    auto line = Geometry::LineString({{3, -1}, {0, 4}, {-2, 2}});

    EXPECT_EQ(BoundingBox(-2, -1, 3, 4), ComputeBoundingBox(line));
}

TEST(GeometryTest, EmptyGeometryIsInvalid) {
    Geometry empty;
    empty.type = GeometryType::MULTI_POINT;

    try {
        ComputeBoundingBox(empty);
        FAIL() << "Expected IndexError";
    } catch (const IndexError& e) {
        EXPECT_EQ(ErrorCode::INVALID_BOUNDING_BOX, e.code());
    }
}

TEST(GeometryTest, NonFiniteCoordinateIsInvalid) {
    auto point = Geometry::Point(std::numeric_limits<double>::quiet_NaN(), 1.0);

    EXPECT_THROW(ComputeBoundingBox(point), IndexError);
}

TEST(GeometryTest, SerializePreservesPositions) {
    auto line = Geometry::LineString({{1.5, 2.5}, {-3.25, 4.0}});

    std::stringstream stream;
    line.Serialize(stream);
    auto restored = Geometry::Deserialize(stream);

    EXPECT_EQ(GeometryType::LINE_STRING, restored.type);
    ASSERT_EQ(2u, restored.positions.size());
    EXPECT_DOUBLE_EQ(-3.25, restored.positions[1].x);
    EXPECT_DOUBLE_EQ(4.0, restored.positions[1].y);
}

TEST(GeometryTest, DeserializeTruncatedThrows) {
    std::stringstream stream;
    stream.write("\x04", 1);  // Type byte only

    EXPECT_THROW(Geometry::Deserialize(stream), std::runtime_error);
}

}  // namespace
}  // namespace geochron
