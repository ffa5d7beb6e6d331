// File: src/storage/indices/rtree.cpp
#include "storage/indices/rtree.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace geochron {

RTree::RTree()
    : RTree(kDefaultMaxFanout) {}

RTree::RTree(size_t max_fanout)
    : max_fanout_(max_fanout),
      min_fill_(std::max<size_t>(1, max_fanout * 2 / 5)),
      root_(std::make_unique<Node>()) {
    if (max_fanout_ < 4) {
        throw std::invalid_argument("RTree max_fanout must be at least 4");
    }
}

// ============================================================================
// Insertion
// ============================================================================

void RTree::Insert(const std::string& id, const BoundingBox& box) {
    ValidateBoundingBox(box);

    if (leaf_of_.count(id) > 0) {
        Remove(id);
    }

    Node* leaf = ChooseLeaf(box);
    leaf->entries.push_back(Entry{id, box});
    leaf_of_[id] = leaf;

    std::unique_ptr<Node> sibling;
    if (leaf->entries.size() > max_fanout_) {
        sibling = SplitNode(leaf);
    }

    AdjustTree(leaf, std::move(sibling));
}

RTree::Node* RTree::ChooseLeaf(const BoundingBox& box) const {
    Node* node = root_.get();

    while (!node->leaf) {
        Node* best = nullptr;
        double best_enlargement = std::numeric_limits<double>::infinity();
        double best_area = std::numeric_limits<double>::infinity();

        for (const auto& child : node->children) {
            double enlargement = child->box.Enlargement(box);
            double area = child->box.Union(box).Area();

            // Strict comparisons keep the earliest child on full ties
            if (best == nullptr || enlargement < best_enlargement ||
                (enlargement == best_enlargement && area < best_area)) {
                best = child.get();
                best_enlargement = enlargement;
                best_area = area;
            }
        }

        node = best;
    }

    return node;
}

std::vector<bool> RTree::PartitionQuadratic(const std::vector<BoundingBox>& boxes) const {
    const size_t n = boxes.size();

    // Seeds: the pair wasting the most area when grouped together
    size_t seed_a = 0;
    size_t seed_b = 1;
    double worst = -std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            double waste = boxes[i].Union(boxes[j]).Area() - boxes[i].Area() - boxes[j].Area();
            if (waste > worst) {
                worst = waste;
                seed_a = i;
                seed_b = j;
            }
        }
    }

    std::vector<bool> second(n, false);
    second[seed_b] = true;

    BoundingBox group_a = boxes[seed_a];
    BoundingBox group_b = boxes[seed_b];
    size_t count_a = 1;
    size_t count_b = 1;
    size_t remaining = n - 2;

    for (size_t i = 0; i < n; ++i) {
        if (i == seed_a || i == seed_b) {
            continue;
        }

        bool to_b = false;
        if (count_a + remaining == min_fill_) {
            to_b = false;
        } else if (count_b + remaining == min_fill_) {
            to_b = true;
        } else {
            double enlarge_a = group_a.Enlargement(boxes[i]);
            double enlarge_b = group_b.Enlargement(boxes[i]);
            if (enlarge_a != enlarge_b) {
                to_b = enlarge_b < enlarge_a;
            } else {
                double area_a = group_a.Union(boxes[i]).Area();
                double area_b = group_b.Union(boxes[i]).Area();
                if (area_a != area_b) {
                    to_b = area_b < area_a;
                } else {
                    to_b = count_b < count_a;
                }
            }
        }

        if (to_b) {
            second[i] = true;
            group_b = group_b.Union(boxes[i]);
            ++count_b;
        } else {
            group_a = group_a.Union(boxes[i]);
            ++count_a;
        }
        --remaining;
    }

    return second;
}

std::unique_ptr<RTree::Node> RTree::SplitNode(Node* node) {
    auto sibling = std::make_unique<Node>();
    sibling->leaf = node->leaf;
    sibling->parent = node->parent;

    if (node->leaf) {
        std::vector<BoundingBox> boxes;
        boxes.reserve(node->entries.size());
        for (const auto& entry : node->entries) {
            boxes.push_back(entry.box);
        }

        std::vector<bool> second = PartitionQuadratic(boxes);

        std::vector<Entry> kept;
        for (size_t i = 0; i < node->entries.size(); ++i) {
            if (second[i]) {
                leaf_of_[node->entries[i].id] = sibling.get();
                sibling->entries.push_back(std::move(node->entries[i]));
            } else {
                kept.push_back(std::move(node->entries[i]));
            }
        }
        node->entries = std::move(kept);
    } else {
        std::vector<BoundingBox> boxes;
        boxes.reserve(node->children.size());
        for (const auto& child : node->children) {
            boxes.push_back(child->box);
        }

        std::vector<bool> second = PartitionQuadratic(boxes);

        std::vector<std::unique_ptr<Node>> kept;
        for (size_t i = 0; i < node->children.size(); ++i) {
            if (second[i]) {
                node->children[i]->parent = sibling.get();
                sibling->children.push_back(std::move(node->children[i]));
            } else {
                kept.push_back(std::move(node->children[i]));
            }
        }
        node->children = std::move(kept);
    }

    RecomputeBox(node);
    RecomputeBox(sibling.get());
    return sibling;
}

void RTree::AdjustTree(Node* node, std::unique_ptr<Node> sibling) {
    while (true) {
        RecomputeBox(node);

        Node* parent = node->parent;
        if (parent == nullptr) {
            if (sibling) {
                // Root split: the only place the tree grows taller
                auto new_root = std::make_unique<Node>();
                new_root->leaf = false;
                node->parent = new_root.get();
                sibling->parent = new_root.get();
                new_root->children.push_back(std::move(root_));
                new_root->children.push_back(std::move(sibling));
                root_ = std::move(new_root);
                RecomputeBox(root_.get());
                ++height_;
            }
            return;
        }

        if (sibling) {
            sibling->parent = parent;
            parent->children.push_back(std::move(sibling));
            if (parent->children.size() > max_fanout_) {
                sibling = SplitNode(parent);
            }
        }

        node = parent;
    }
}

// ============================================================================
// Deletion
// ============================================================================

bool RTree::Remove(const std::string& id) {
    auto it = leaf_of_.find(id);
    if (it == leaf_of_.end()) {
        return false;
    }

    Node* leaf = it->second;
    auto& entries = leaf->entries;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&id](const Entry& entry) { return entry.id == id; }),
                  entries.end());
    leaf_of_.erase(it);

    CondenseTree(leaf);
    return true;
}

void RTree::CondenseTree(Node* node) {
    while (node != root_.get()) {
        Node* parent = node->parent;
        bool empty = node->leaf ? node->entries.empty() : node->children.empty();

        if (empty) {
            auto& siblings = parent->children;
            siblings.erase(std::remove_if(siblings.begin(), siblings.end(),
                                          [node](const std::unique_ptr<Node>& child) {
                                              return child.get() == node;
                                          }),
                           siblings.end());
        } else {
            RecomputeBox(node);
        }

        node = parent;
    }

    if (!root_->leaf && root_->children.empty()) {
        root_ = std::make_unique<Node>();
        height_ = 1;
    } else {
        RecomputeBox(root_.get());
    }
}

// ============================================================================
// Queries
// ============================================================================

std::vector<std::string> RTree::Query(const BoundingBox& box) const {
    ValidateBoundingBox(box);

    std::vector<std::string> results;
    if (leaf_of_.empty()) {
        return results;
    }

    std::vector<const Node*> stack;
    stack.push_back(root_.get());

    while (!stack.empty()) {
        const Node* node = stack.back();
        stack.pop_back();

        if (!node->box.Intersects(box)) {
            continue;
        }

        if (node->leaf) {
            for (const auto& entry : node->entries) {
                if (entry.box.Intersects(box)) {
                    results.push_back(entry.id);
                }
            }
        } else {
            for (const auto& child : node->children) {
                stack.push_back(child.get());
            }
        }
    }

    return results;
}

bool RTree::Contains(const std::string& id) const {
    return leaf_of_.count(id) > 0;
}

std::optional<BoundingBox> RTree::GetBoundingBox(const std::string& id) const {
    auto it = leaf_of_.find(id);
    if (it == leaf_of_.end()) {
        return std::nullopt;
    }

    for (const auto& entry : it->second->entries) {
        if (entry.id == id) {
            return entry.box;
        }
    }

    return std::nullopt;
}

std::optional<BoundingBox> RTree::Bounds() const {
    if (leaf_of_.empty()) {
        return std::nullopt;
    }
    return root_->box;
}

void RTree::Clear() {
    root_ = std::make_unique<Node>();
    leaf_of_.clear();
    height_ = 1;
}

// ============================================================================
// Helpers
// ============================================================================

void RTree::RecomputeBox(Node* node) {
    if (node->leaf) {
        if (node->entries.empty()) {
            node->box = BoundingBox();
            return;
        }
        BoundingBox box = node->entries.front().box;
        for (const auto& entry : node->entries) {
            box = box.Union(entry.box);
        }
        node->box = box;
    } else {
        if (node->children.empty()) {
            node->box = BoundingBox();
            return;
        }
        BoundingBox box = node->children.front()->box;
        for (const auto& child : node->children) {
            box = box.Union(child->box);
        }
        node->box = box;
    }
}

bool RTree::Validate() const {
    if (!root_ || root_->parent != nullptr) {
        return false;
    }

    std::optional<size_t> leaf_depth;
    size_t count = 0;
    if (!ValidateNode(root_.get(), 1, leaf_depth, count)) {
        return false;
    }

    if (count != leaf_of_.size()) {
        return false;
    }

    return !leaf_depth.has_value() || *leaf_depth == height_;
}

bool RTree::ValidateNode(const Node* node, size_t depth,
                         std::optional<size_t>& leaf_depth, size_t& count) const {
    if (node->leaf) {
        if (node->entries.size() > max_fanout_) {
            return false;
        }
        if (leaf_depth.has_value() && *leaf_depth != depth) {
            return false;
        }
        leaf_depth = depth;

        if (!node->entries.empty()) {
            BoundingBox box = node->entries.front().box;
            for (const auto& entry : node->entries) {
                auto it = leaf_of_.find(entry.id);
                if (it == leaf_of_.end() || it->second != node) {
                    return false;
                }
                box = box.Union(entry.box);
            }
            if (box != node->box) {
                return false;
            }
        } else if (node != root_.get()) {
            // Only the root may be an empty leaf
            return false;
        }

        count += node->entries.size();
        return true;
    }

    if (node->children.empty() || node->children.size() > max_fanout_) {
        return false;
    }

    BoundingBox box = node->children.front()->box;
    for (const auto& child : node->children) {
        if (child->parent != node) {
            return false;
        }
        if (!ValidateNode(child.get(), depth + 1, leaf_depth, count)) {
            return false;
        }
        box = box.Union(child->box);
    }

    return box == node->box;
}

} // namespace geochron
