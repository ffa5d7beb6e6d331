// File: src/storage/indices/rtree.hpp
#pragma once

#include "core/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace geochron {

/// R-tree over feature bounding boxes
///
/// Guttman-style tree with quadratic split. Leaves hold (feature id, box)
/// entries, internal nodes hold child nodes; every node's box is the minimal
/// box covering its contents and all leaves sit at the same depth.
///
/// Insertion descends by least-area enlargement (ties: smaller resulting
/// area, then earliest child). Deletion removes the entry and prunes empty
/// nodes but never merges underflowed nodes, so heavy delete churn costs
/// query efficiency, not correctness.
///
/// Not thread-safe. SpatialIndex serializes access per database.
class RTree {
public:
    static constexpr size_t kDefaultMaxFanout = 10;

    /// Construct an empty tree with the default fanout
    RTree();

    /// Construct an empty tree
    /// @param max_fanout Maximum entries/children per node (at least 4)
    /// @throws std::invalid_argument if max_fanout < 4
    explicit RTree(size_t max_fanout);

    /// Insert a feature, replacing any previous entry with the same id
    /// @throws IndexError(INVALID_BOUNDING_BOX) if box is invalid
    void Insert(const std::string& id, const BoundingBox& box);

    /// Remove a feature
    /// @return true if removed, false if the id is not indexed
    bool Remove(const std::string& id);

    /// Find all features whose box intersects the query box (inclusive)
    /// @throws IndexError(INVALID_BOUNDING_BOX) if box is invalid
    std::vector<std::string> Query(const BoundingBox& box) const;

    bool Contains(const std::string& id) const;

    /// Stored box of a feature, nullopt if not indexed
    std::optional<BoundingBox> GetBoundingBox(const std::string& id) const;

    /// Box covering every entry, nullopt if the tree is empty
    std::optional<BoundingBox> Bounds() const;

    size_t Size() const { return leaf_of_.size(); }
    size_t Height() const { return height_; }
    size_t MaxFanout() const { return max_fanout_; }

    void Clear();

    /// Check structural invariants (minimal boxes, fanout, equal leaf depth,
    /// parent links, id lookup table)
    bool Validate() const;

private:
    struct Entry {
        std::string id;
        BoundingBox box;
    };

    struct Node {
        bool leaf{true};
        BoundingBox box;
        Node* parent{nullptr};
        std::vector<Entry> entries;                  // leaf only
        std::vector<std::unique_ptr<Node>> children; // internal only
    };

    size_t max_fanout_;
    size_t min_fill_;
    std::unique_ptr<Node> root_;
    size_t height_{1};

    // feature id -> leaf holding it
    std::unordered_map<std::string, Node*> leaf_of_;

    Node* ChooseLeaf(const BoundingBox& box) const;

    /// Split an overflowing node; returns the new sibling
    std::unique_ptr<Node> SplitNode(Node* node);

    /// Propagate box changes and splits from node to the root
    void AdjustTree(Node* node, std::unique_ptr<Node> sibling);

    /// Prune empty nodes and tighten boxes from node to the root
    void CondenseTree(Node* node);

    /// Quadratic split: true marks items that go to the second group
    std::vector<bool> PartitionQuadratic(const std::vector<BoundingBox>& boxes) const;

    static void RecomputeBox(Node* node);

    bool ValidateNode(const Node* node, size_t depth,
                      std::optional<size_t>& leaf_depth, size_t& count) const;
};

} // namespace geochron
