// File: tests/core/types_test.cpp
#include "core/types.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

namespace geochron {
namespace {

// ============================================================================
// Enum Conversion Tests
// ============================================================================

TEST(RecordKindTest, ToStringAndParse) {
    EXPECT_STREQ("FEATURE", ToString(RecordKind::FEATURE));
    EXPECT_STREQ("TIME_SERIES", ToString(RecordKind::TIME_SERIES));

    EXPECT_EQ(RecordKind::FEATURE, ParseRecordKind("FEATURE"));
    EXPECT_EQ(RecordKind::TIME_SERIES, ParseRecordKind("TIME_SERIES"));
}

TEST(RecordKindTest, ParseUnknownThrows) {
    EXPECT_THROW(ParseRecordKind("feature"), std::invalid_argument);
    EXPECT_THROW(ParseRecordKind(""), std::invalid_argument);
}

TEST(IndexErrorTest, CarriesCodeAndMessage) {
    IndexError error(ErrorCode::INDEX_NOT_FOUND, "no tree for db1");

    EXPECT_EQ(ErrorCode::INDEX_NOT_FOUND, error.code());
    EXPECT_EQ("INDEX_NOT_FOUND: no tree for db1", std::string(error.what()));
}

TEST(IndexErrorTest, IsRuntimeError) {
    try {
        throw IndexError(ErrorCode::INVALID_RANGE, "5 > 1");
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("INVALID_RANGE"));
        return;
    }
    FAIL() << "IndexError not caught as std::runtime_error";
}

// ============================================================================
// BoundingBox Tests
// ============================================================================

TEST(BoundingBoxTest, Validity) {
    EXPECT_TRUE(BoundingBox(0, 0, 1, 1).IsValid());
    EXPECT_TRUE(BoundingBox(2, 3, 2, 3).IsValid());  // Degenerate point box

    EXPECT_FALSE(BoundingBox(1, 0, 0, 1).IsValid());
    EXPECT_FALSE(BoundingBox(0, 1, 1, 0).IsValid());

    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(BoundingBox(nan, 0, 1, 1).IsValid());
    EXPECT_FALSE(BoundingBox(0, 0, inf, 1).IsValid());
}

TEST(BoundingBoxTest, ValidateThrowsInvalidBoundingBox) {
    EXPECT_NO_THROW(ValidateBoundingBox(BoundingBox(0, 0, 1, 1)));

    try {
        ValidateBoundingBox(BoundingBox(5, 0, 1, 1));
        FAIL() << "Expected IndexError";
    } catch (const IndexError& e) {
        EXPECT_EQ(ErrorCode::INVALID_BOUNDING_BOX, e.code());
    }
}

TEST(BoundingBoxTest, IntersectsIsInclusive) {
    BoundingBox a(0, 0, 1, 1);

    EXPECT_TRUE(a.Intersects(BoundingBox(0.5, 0.5, 2, 2)));
    EXPECT_TRUE(a.Intersects(BoundingBox(1, 1, 2, 2)));      // Corner touch
    EXPECT_TRUE(a.Intersects(BoundingBox(1, -5, 3, 5)));     // Edge touch
    EXPECT_TRUE(a.Intersects(BoundingBox::FromPoint(0, 0)));

    EXPECT_FALSE(a.Intersects(BoundingBox(1.0001, 0, 2, 1)));
    EXPECT_FALSE(a.Intersects(BoundingBox(0, -2, 1, -0.5)));
}

TEST(BoundingBoxTest, UnionAndEnlargement) {
    BoundingBox a(0, 0, 1, 1);
    BoundingBox b(2, 2, 3, 3);

    EXPECT_EQ(BoundingBox(0, 0, 3, 3), a.Union(b));
    EXPECT_DOUBLE_EQ(1.0, a.Area());
    EXPECT_DOUBLE_EQ(8.0, a.Enlargement(b));
    EXPECT_DOUBLE_EQ(0.0, a.Enlargement(BoundingBox(0.2, 0.2, 0.8, 0.8)));
}

TEST(BoundingBoxTest, Contains) {
    BoundingBox outer(0, 0, 10, 10);

    EXPECT_TRUE(outer.Contains(BoundingBox(1, 1, 2, 2)));
    EXPECT_TRUE(outer.Contains(outer));
    EXPECT_FALSE(outer.Contains(BoundingBox(9, 9, 11, 11)));
}

TEST(BoundingBoxTest, EverythingIntersectsAnyFiniteBox) {
    BoundingBox everything = BoundingBox::Everything();

    EXPECT_TRUE(everything.IsValid());
    EXPECT_TRUE(everything.Intersects(BoundingBox(-1e300, -1e300, -1e299, -1e299)));
    EXPECT_TRUE(everything.Intersects(BoundingBox::FromPoint(-122.4194, 37.7749)));
}

}  // namespace
}  // namespace geochron
