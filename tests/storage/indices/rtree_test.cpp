// File: tests/storage/indices/rtree_test.cpp
#include "storage/indices/rtree.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <random>

namespace geochron {
namespace {

std::vector<std::string> Sorted(std::vector<std::string> ids) {
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::string> BruteForce(const std::map<std::string, BoundingBox>& boxes,
                                    const BoundingBox& query) {
    std::vector<std::string> ids;
    for (const auto& [id, box] : boxes) {
        if (box.Intersects(query)) {
            ids.push_back(id);
        }
    }
    return ids;  // std::map iterates in sorted order
}

BoundingBox RandomBox(std::mt19937& rng, double extent, double max_size) {
    std::uniform_real_distribution<double> pos(-extent, extent);
    std::uniform_real_distribution<double> size(0.0, max_size);
    double x = pos(rng);
    double y = pos(rng);
    return BoundingBox(x, y, x + size(rng), y + size(rng));
}

// ============================================================================
// Construction Tests
// ============================================================================

TEST(RTreeTest, DefaultTreeIsEmpty) {
    RTree tree;

    EXPECT_EQ(0u, tree.Size());
    EXPECT_EQ(1u, tree.Height());
    EXPECT_EQ(RTree::kDefaultMaxFanout, tree.MaxFanout());
    EXPECT_FALSE(tree.Bounds().has_value());
    EXPECT_TRUE(tree.Query(BoundingBox::Everything()).empty());
    EXPECT_TRUE(tree.Validate());
}

TEST(RTreeTest, FanoutBelowFourRejected) {
    EXPECT_THROW(RTree(3), std::invalid_argument);
    EXPECT_NO_THROW(RTree(4));
}

// ============================================================================
// Insert / Query Tests
// ============================================================================

TEST(RTreeTest, InsertAndQuerySingle) {
    RTree tree;
    tree.Insert("nyc", BoundingBox::FromPoint(-74.006, 40.7128));

    EXPECT_EQ(1u, tree.Size());
    EXPECT_TRUE(tree.Contains("nyc"));
    EXPECT_EQ(std::vector<std::string>{"nyc"}, tree.Query(BoundingBox(-75, 40, -73, 41)));
    EXPECT_TRUE(tree.Query(BoundingBox(-123, 37, -122, 38)).empty());
}

TEST(RTreeTest, TouchingBoxesIntersect) {
    RTree tree;
    tree.Insert("a", BoundingBox(0, 0, 1, 1));

    EXPECT_EQ(1u, tree.Query(BoundingBox(1, 1, 2, 2)).size());
}

TEST(RTreeTest, InvalidBoxRejected) {
    RTree tree;

    EXPECT_THROW(tree.Insert("bad", BoundingBox(1, 0, 0, 1)), IndexError);
    EXPECT_THROW(tree.Query(BoundingBox(0, 1, 1, 0)), IndexError);
    EXPECT_EQ(0u, tree.Size());
}

TEST(RTreeTest, ReinsertReplacesEntry) {
    RTree tree;
    tree.Insert("f", BoundingBox(0, 0, 1, 1));
    tree.Insert("f", BoundingBox(10, 10, 11, 11));

    EXPECT_EQ(1u, tree.Size());
    EXPECT_TRUE(tree.Query(BoundingBox(0, 0, 1, 1)).empty());
    EXPECT_EQ(std::vector<std::string>{"f"}, tree.Query(BoundingBox(10, 10, 11, 11)));
    EXPECT_EQ(BoundingBox(10, 10, 11, 11), *tree.GetBoundingBox("f"));
}

TEST(RTreeTest, SplitsGrowHeight) {
    RTree tree(4);

    for (int i = 0; i < 50; ++i) {
        tree.Insert("f" + std::to_string(i), BoundingBox::FromPoint(i, i % 7));
    }

    EXPECT_EQ(50u, tree.Size());
    EXPECT_GT(tree.Height(), 1u);
    EXPECT_TRUE(tree.Validate());
    EXPECT_EQ(BoundingBox(0, 0, 49, 6), *tree.Bounds());
}

TEST(RTreeTest, MatchesBruteForceOnRandomData) {
    std::mt19937 rng(42);
    RTree tree(6);
    std::map<std::string, BoundingBox> boxes;

    for (int i = 0; i < 2000; ++i) {
        std::string id = "f" + std::to_string(i);
        BoundingBox box = RandomBox(rng, 1000.0, 20.0);
        tree.Insert(id, box);
        boxes[id] = box;
    }

    ASSERT_TRUE(tree.Validate());

    for (int q = 0; q < 200; ++q) {
        BoundingBox query = RandomBox(rng, 1000.0, 150.0);
        EXPECT_EQ(BruteForce(boxes, query), Sorted(tree.Query(query)));
    }
}

// ============================================================================
// Removal Tests
// ============================================================================

TEST(RTreeTest, RemoveUnknownReturnsFalse) {
    RTree tree;
    EXPECT_FALSE(tree.Remove("missing"));
}

TEST(RTreeTest, RemoveThenQuery) {
    RTree tree;
    tree.Insert("a", BoundingBox(0, 0, 1, 1));
    tree.Insert("b", BoundingBox(0.5, 0.5, 2, 2));

    EXPECT_TRUE(tree.Remove("a"));
    EXPECT_FALSE(tree.Contains("a"));
    EXPECT_EQ(std::vector<std::string>{"b"}, tree.Query(BoundingBox(0, 0, 1, 1)));
    EXPECT_FALSE(tree.GetBoundingBox("a").has_value());
}

TEST(RTreeTest, RandomDeletesMatchBruteForce) {
    std::mt19937 rng(7);
    RTree tree(5);
    std::map<std::string, BoundingBox> boxes;

    for (int i = 0; i < 1000; ++i) {
        std::string id = "f" + std::to_string(i);
        BoundingBox box = RandomBox(rng, 500.0, 10.0);
        tree.Insert(id, box);
        boxes[id] = box;
    }

    // Remove every third feature
    for (int i = 0; i < 1000; i += 3) {
        std::string id = "f" + std::to_string(i);
        ASSERT_TRUE(tree.Remove(id));
        boxes.erase(id);
    }

    EXPECT_EQ(boxes.size(), tree.Size());
    ASSERT_TRUE(tree.Validate());

    for (int q = 0; q < 100; ++q) {
        BoundingBox query = RandomBox(rng, 500.0, 100.0);
        EXPECT_EQ(BruteForce(boxes, query), Sorted(tree.Query(query)));
    }
}

TEST(RTreeTest, RemoveAllLeavesEmptyTree) {
    RTree tree(4);
    for (int i = 0; i < 40; ++i) {
        tree.Insert(std::to_string(i), BoundingBox::FromPoint(i, -i));
    }
    for (int i = 0; i < 40; ++i) {
        ASSERT_TRUE(tree.Remove(std::to_string(i)));
    }

    EXPECT_EQ(0u, tree.Size());
    EXPECT_EQ(1u, tree.Height());
    EXPECT_TRUE(tree.Validate());
    EXPECT_TRUE(tree.Query(BoundingBox::Everything()).empty());

    // Still usable
    tree.Insert("again", BoundingBox(0, 0, 1, 1));
    EXPECT_EQ(1u, tree.Query(BoundingBox::Everything()).size());
}

TEST(RTreeTest, ClearResets) {
    RTree tree(4);
    for (int i = 0; i < 20; ++i) {
        tree.Insert(std::to_string(i), BoundingBox::FromPoint(i, i));
    }

    tree.Clear();

    EXPECT_EQ(0u, tree.Size());
    EXPECT_EQ(1u, tree.Height());
    EXPECT_FALSE(tree.Contains("3"));
}

}  // namespace
}  // namespace geochron
