// File: src/storage/indices/spatial_index.cpp
#include "storage/indices/spatial_index.hpp"
#include <algorithm>
#include <mutex>

namespace geochron {

SpatialIndex::SpatialIndex()
    : SpatialIndex(Config{}) {}

SpatialIndex::SpatialIndex(const Config& config)
    : config_(config) {
    if (config_.max_fanout < 4) {
        throw std::invalid_argument("SpatialIndex max_fanout must be at least 4");
    }
}

std::shared_ptr<SpatialIndex::TreeSlot> SpatialIndex::FindSlot(const std::string& database) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);

    auto it = trees_.find(database);
    if (it == trees_.end()) {
        throw IndexError(ErrorCode::INDEX_NOT_FOUND, "no spatial index for database " + database);
    }
    return it->second;
}

// ============================================================================
// Lifecycle
// ============================================================================

void SpatialIndex::CreateIndex(const std::string& database) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);

    if (trees_.find(database) != trees_.end()) {
        throw IndexError(ErrorCode::ALREADY_EXISTS, "spatial index for database " + database);
    }

    trees_.emplace(database, std::make_shared<TreeSlot>(config_.max_fanout));
}

void SpatialIndex::Rebuild(const std::string& database,
                           const std::function<void(RTree&)>& populate) {
    std::shared_ptr<TreeSlot> slot;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = trees_.find(database);
        if (it == trees_.end()) {
            it = trees_.emplace(database, std::make_shared<TreeSlot>(config_.max_fanout)).first;
        }
        slot = it->second;
    }

    std::unique_lock<std::shared_mutex> tree_lock(slot->mutex);
    slot->tree.Clear();

    try {
        populate(slot->tree);
    } catch (...) {
        // A half-filled tree would answer queries wrongly; drop it so reads fall back
        slot->tree.Clear();
        tree_lock.unlock();

        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = trees_.find(database);
        if (it != trees_.end() && it->second == slot) {
            trees_.erase(it);
        }
        throw;
    }
}

bool SpatialIndex::HasIndex(const std::string& database) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return trees_.find(database) != trees_.end();
}

void SpatialIndex::DropIndex(const std::string& database) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    trees_.erase(database);
}

// ============================================================================
// Mutations
// ============================================================================

void SpatialIndex::Insert(const std::string& database,
                          const std::string& feature_id,
                          const BoundingBox& box) {
    ValidateBoundingBox(box);

    auto slot = FindSlot(database);
    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    slot->tree.Insert(feature_id, box);
}

void SpatialIndex::Delete(const std::string& database, const std::string& feature_id) {
    auto slot = FindSlot(database);
    std::unique_lock<std::shared_mutex> lock(slot->mutex);

    if (!slot->tree.Remove(feature_id)) {
        throw IndexError(ErrorCode::NOT_FOUND, "feature " + feature_id + " in database " + database);
    }
}

// ============================================================================
// Queries
// ============================================================================

std::vector<std::string> SpatialIndex::Query(const std::string& database,
                                             const BoundingBox& box) const {
    ValidateBoundingBox(box);

    auto slot = FindSlot(database);
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->tree.Query(box);
}

std::optional<BoundingBox> SpatialIndex::GetBoundingBox(const std::string& database,
                                                        const std::string& feature_id) const {
    auto slot = FindSlot(database);
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->tree.GetBoundingBox(feature_id);
}

size_t SpatialIndex::Size(const std::string& database) const {
    auto slot = FindSlot(database);
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->tree.Size();
}

size_t SpatialIndex::Height(const std::string& database) const {
    auto slot = FindSlot(database);
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->tree.Height();
}

std::vector<std::string> SpatialIndex::ListDatabases() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);

    std::vector<std::string> databases;
    databases.reserve(trees_.size());
    for (const auto& [database, slot] : trees_) {
        databases.push_back(database);
    }
    std::sort(databases.begin(), databases.end());
    return databases;
}

SpatialIndex::Stats SpatialIndex::GetStats() const {
    std::vector<std::shared_ptr<TreeSlot>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        slots.reserve(trees_.size());
        for (const auto& [database, slot] : trees_) {
            slots.push_back(slot);
        }
    }

    Stats stats;
    stats.indexed_databases = slots.size();
    for (const auto& slot : slots) {
        std::shared_lock<std::shared_mutex> lock(slot->mutex);
        stats.total_entries += slot->tree.Size();
        stats.max_height = std::max(stats.max_height, slot->tree.Height());
    }
    return stats;
}

} // namespace geochron
