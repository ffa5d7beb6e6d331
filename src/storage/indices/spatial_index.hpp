// File: src/storage/indices/spatial_index.hpp
#pragma once

#include "storage/indices/rtree.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace geochron {

/// Spatial index manager: one R-tree per database
///
/// Mutations of one database's tree are serialized by an exclusive lock on
/// that tree; queries take a shared lock and run in parallel with each other.
/// Trees are held by shared_ptr so a concurrent DropIndex never frees a tree
/// that a reader is still walking.
///
/// The manager never creates a tree implicitly: operations on a database
/// without one fail with INDEX_NOT_FOUND.
class SpatialIndex {
public:
    /// Configuration for SpatialIndex
    struct Config {
        /// Maximum entries/children per tree node
        size_t max_fanout{RTree::kDefaultMaxFanout};
    };

    /// Statistics across all trees
    struct Stats {
        size_t indexed_databases{0};
        size_t total_entries{0};
        size_t max_height{0};
    };

    SpatialIndex();
    explicit SpatialIndex(const Config& config);

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    /// Create an empty tree for a database
    /// @throws IndexError(ALREADY_EXISTS) if the database already has one
    void CreateIndex(const std::string& database);

    /// Replace the database's tree with one filled by populate
    ///
    /// The tree is created if missing, cleared otherwise, and populate runs
    /// while the tree's exclusive lock is held, so writers queue behind it.
    /// If populate throws, the tree is dropped and the exception propagates.
    void Rebuild(const std::string& database, const std::function<void(RTree&)>& populate);

    bool HasIndex(const std::string& database) const;

    /// Index a feature (replaces an existing entry with the same id)
    /// @throws IndexError(INVALID_BOUNDING_BOX) for an invalid box
    /// @throws IndexError(INDEX_NOT_FOUND) if the database has no tree
    void Insert(const std::string& database, const std::string& feature_id, const BoundingBox& box);

    /// Feature ids whose box intersects the query box (inclusive)
    /// @throws IndexError(INVALID_BOUNDING_BOX) for an invalid box
    /// @throws IndexError(INDEX_NOT_FOUND) if the database has no tree
    std::vector<std::string> Query(const std::string& database, const BoundingBox& box) const;

    /// Remove a feature
    /// @throws IndexError(INDEX_NOT_FOUND) if the database has no tree
    /// @throws IndexError(NOT_FOUND) if the feature is not indexed
    void Delete(const std::string& database, const std::string& feature_id);

    /// Stored box of a feature, nullopt if not indexed
    /// @throws IndexError(INDEX_NOT_FOUND) if the database has no tree
    std::optional<BoundingBox> GetBoundingBox(const std::string& database, const std::string& feature_id) const;

    /// Discard a database's tree; no-op if absent
    void DropIndex(const std::string& database);

    /// Number of indexed features
    /// @throws IndexError(INDEX_NOT_FOUND) if the database has no tree
    size_t Size(const std::string& database) const;

    /// Tree height
    /// @throws IndexError(INDEX_NOT_FOUND) if the database has no tree
    size_t Height(const std::string& database) const;

    std::vector<std::string> ListDatabases() const;

    Stats GetStats() const;

private:
    struct TreeSlot {
        explicit TreeSlot(size_t max_fanout) : tree(max_fanout) {}

        mutable std::shared_mutex mutex;
        RTree tree;
    };

    Config config_;

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<TreeSlot>> trees_;

    /// Look up a database's tree
    /// @throws IndexError(INDEX_NOT_FOUND) if absent
    std::shared_ptr<TreeSlot> FindSlot(const std::string& database) const;
};

} // namespace geochron
