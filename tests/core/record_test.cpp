// File: tests/core/record_test.cpp
#include "core/record.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace geochron {
namespace {

TEST(RecordTest, MakeFeatureComputesBoundingBox) {
    auto record = Record::MakeFeature(
        "cities", "nyc", Geometry::Point(-74.006, 40.7128),
        {{"name", "New York"}}, {{"source", "census"}});

    EXPECT_EQ("cities", record.database);
    EXPECT_EQ("nyc", record.id);
    EXPECT_EQ(RecordKind::FEATURE, record.kind);
    EXPECT_EQ(BoundingBox::FromPoint(-74.006, 40.7128), record.bbox);
    EXPECT_EQ("New York", record.properties.at("name"));
    EXPECT_EQ("census", record.provenance.at("source"));
}

TEST(RecordTest, MakeFeatureRejectsEmptyGeometry) {
    Geometry empty;
    empty.type = GeometryType::POLYGON;

    EXPECT_THROW(Record::MakeFeature("db", "f1", empty), IndexError);
}

TEST(RecordTest, MakePoint) {
    auto record = Record::MakePoint("sensors", "sensor_001", "p1", 60, 21.5,
                                    {{"unit", "C"}});

    EXPECT_EQ(RecordKind::TIME_SERIES, record.kind);
    EXPECT_EQ("sensor_001", record.series_id);
    EXPECT_EQ(60, record.timestamp);
    EXPECT_DOUBLE_EQ(21.5, record.value);
    EXPECT_EQ("C", record.metadata.at("unit"));
}

TEST(RecordTest, EqualityComparesGeometryPositions) {
    auto a = Record::MakeFeature("db", "line", Geometry::LineString({{0, 0}, {1, 1}, {2, 0}}));
    auto b = Record::MakeFeature("db", "line", Geometry::LineString({{0, 0}, {1, 0}, {2, 1}}));

    // Same extent, different shape
    EXPECT_EQ(a.bbox, b.bbox);
    EXPECT_NE(a, b);
    EXPECT_EQ(a, a);
}

TEST(RecordTest, SerializeFeatureAndPoint) {
    auto feature = Record::MakeFeature(
        "db", "poly",
        Geometry::Polygon({{0, 0}, {4, 0}, {4, 3}, {0, 0}}),
        {{"zone", "A"}}, {{"import", "batch-7"}});
    auto point = Record::MakePoint("db", "s1", "p1", -5, 3.75, {{"q", "good"}});

    std::stringstream stream;
    feature.Serialize(stream);
    point.Serialize(stream);

    EXPECT_EQ(feature, Record::Deserialize(stream));
    EXPECT_EQ(point, Record::Deserialize(stream));
}

TEST(RecordTest, SortByOrderingKeyBreaksTiesById) {
    std::vector<Record> points = {
        Record::MakePoint("db", "s", "b", 10, 1.0),
        Record::MakePoint("db", "s", "c", 5, 2.0),
        Record::MakePoint("db", "s", "a", 10, 3.0),
    };

    SortByOrderingKey(points);

    EXPECT_EQ("c", points[0].id);
    EXPECT_EQ("a", points[1].id);
    EXPECT_EQ("b", points[2].id);
}

TEST(RecordTest, SortById) {
    std::vector<Record> records = {
        Record::MakeFeature("db", "zeta", Geometry::Point(0, 0)),
        Record::MakeFeature("db", "alpha", Geometry::Point(1, 1)),
    };

    SortById(records);

    EXPECT_EQ("alpha", records[0].id);
    EXPECT_EQ("zeta", records[1].id);
}

}  // namespace
}  // namespace geochron
