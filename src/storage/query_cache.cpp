// File: src/storage/query_cache.cpp
#include "storage/query_cache.hpp"
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace geochron {

// ============================================================================
// Keys
// ============================================================================

QueryKey MakeQueryKey(const std::string& database,
                      const std::string& kind,
                      const std::map<std::string, std::string>& params) {
    // Length prefix keeps database names containing separators unambiguous
    std::ostringstream oss;
    oss << database.size() << ':' << database << '|' << kind << '?';

    bool first = true;
    for (const auto& [name, value] : params) {
        if (!first) {
            oss << '&';
        }
        oss << name << '=' << value;
        first = false;
    }

    return QueryKey{database, oss.str()};
}

std::string FormatKeyNumber(double value) {
    if (value == 0.0) {
        value = 0.0;  // -0 and 0 are the same coordinate
    }

    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

// ============================================================================
// Constructor and Destructor
// ============================================================================

QueryCache::QueryCache()
    : QueryCache(Config{}) {}

QueryCache::QueryCache(const Config& config)
    : config_(config) {
    if (config_.capacity == 0) {
        throw std::invalid_argument("QueryCache capacity must be greater than 0");
    }
    if (config_.ttl.count() <= 0 || config_.ttl > kMaxDuration) {
        throw std::invalid_argument("QueryCache ttl must be greater than 0 and at most one year");
    }
    if (config_.sweep_interval.count() <= 0 || config_.sweep_interval > kMaxDuration) {
        throw std::invalid_argument(
            "QueryCache sweep_interval must be greater than 0 and at most one year");
    }
    if (config_.sweep_batch_size == 0) {
        throw std::invalid_argument("QueryCache sweep_batch_size must be greater than 0");
    }
}

QueryCache::~QueryCache() {
    StopSweeper();
}

// ============================================================================
// Lookup and Insertion
// ============================================================================

std::optional<QueryResult> QueryCache::Get(const QueryKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto map_it = map_.find(key.text);
    if (map_it == map_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    auto now = Clock::now();
    auto item = map_it->second;

    if (now >= item->expires_at) {
        EraseLocked(item);
        expirations_.fetch_add(1, std::memory_order_relaxed);
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    hits_.fetch_add(1, std::memory_order_relaxed);

    // Move to front (most recently used)
    item->last_access = now;
    items_.splice(items_.begin(), items_, item);

    return item->value;
}

void QueryCache::Put(const QueryKey& key, const QueryResult& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    PutLocked(key, value);
}

bool QueryCache::PutIfCurrent(const QueryKey& key, const QueryResult& value, uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (GenerationLocked(key.database) != generation) {
        return false;
    }

    PutLocked(key, value);
    return true;
}

void QueryCache::PutLocked(const QueryKey& key, const QueryResult& value) {
    auto now = Clock::now();
    auto expires_at = now + config_.ttl;

    auto map_it = map_.find(key.text);

    // Key already exists, update and move to front
    if (map_it != map_.end()) {
        auto item = map_it->second;
        item->value = value;
        item->last_access = now;
        item->expires_at = expires_at;
        expiry_order_.erase(item->expiry_it);
        item->expiry_it = expiry_order_.emplace(expires_at, key.text);
        items_.splice(items_.begin(), items_, item);
        return;
    }

    // Cache is full, evict LRU item
    if (items_.size() >= config_.capacity) {
        EraseLocked(std::prev(items_.end()));
        evictions_.fetch_add(1, std::memory_order_relaxed);
    }

    items_.push_front(Entry{key, value, expires_at, now, expiry_order_.end()});
    auto item = items_.begin();
    item->expiry_it = expiry_order_.emplace(expires_at, key.text);
    map_[key.text] = item;
    database_keys_[key.database].insert(key.text);
}

void QueryCache::EraseLocked(EntryList::iterator it) {
    expiry_order_.erase(it->expiry_it);

    auto db_it = database_keys_.find(it->key.database);
    if (db_it != database_keys_.end()) {
        db_it->second.erase(it->key.text);
        if (db_it->second.empty()) {
            database_keys_.erase(db_it);
        }
    }

    map_.erase(it->key.text);
    items_.erase(it);
}

// ============================================================================
// Invalidation
// ============================================================================

uint64_t QueryCache::Generation(const std::string& database) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return GenerationLocked(database);
}

uint64_t QueryCache::GenerationLocked(const std::string& database) const {
    auto it = generations_.find(database);
    if (it == generations_.end() || it->second < floor_generation_) {
        return floor_generation_;
    }
    return it->second;
}

void QueryCache::RaiseFloorLocked() {
    floor_generation_ = ++generation_counter_;
    generations_.clear();
}

bool QueryCache::Invalidate(const QueryKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto map_it = map_.find(key.text);
    if (map_it == map_.end()) {
        return false;
    }

    EraseLocked(map_it->second);
    invalidations_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

size_t QueryCache::InvalidateDatabase(const std::string& database) {
    std::lock_guard<std::mutex> lock(mutex_);

    generations_[database] = ++generation_counter_;

    auto db_it = database_keys_.find(database);
    if (db_it == database_keys_.end()) {
        return 0;
    }

    // Copy: EraseLocked mutates the set
    std::vector<std::string> keys(db_it->second.begin(), db_it->second.end());
    for (const auto& text : keys) {
        auto map_it = map_.find(text);
        if (map_it != map_.end()) {
            EraseLocked(map_it->second);
        }
    }

    invalidations_.fetch_add(keys.size(), std::memory_order_relaxed);
    return keys.size();
}

void QueryCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    invalidations_.fetch_add(items_.size(), std::memory_order_relaxed);

    items_.clear();
    map_.clear();
    database_keys_.clear();
    expiry_order_.clear();
    RaiseFloorLocked();
}

void QueryCache::ForgetDatabase(const std::string& database) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (generations_.count(database) > 0) {
        RaiseFloorLocked();
    }
}

// ============================================================================
// Expiry Sweep
// ============================================================================

size_t QueryCache::SweepExpired() {
    size_t removed = 0;

    while (true) {
        size_t batch = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = Clock::now();

            while (!expiry_order_.empty() &&
                   expiry_order_.begin()->first <= now &&
                   batch < config_.sweep_batch_size) {
                auto map_it = map_.find(expiry_order_.begin()->second);
                EraseLocked(map_it->second);
                ++batch;
            }
        }

        removed += batch;
        if (batch < config_.sweep_batch_size) {
            break;
        }

        // Let foreground get/put take the lock between batches
        std::this_thread::yield();
    }

    expirations_.fetch_add(removed, std::memory_order_relaxed);
    return removed;
}

void QueryCache::StartSweeper() {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);

    if (sweeper_running_.load()) {
        return;  // Already running
    }

    sweeper_running_.store(true);
    sweeper_ = std::make_unique<std::thread>(&QueryCache::SweepLoop, this);
}

void QueryCache::StopSweeper() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        if (!sweeper_running_.load()) {
            return;  // Not running
        }
        sweeper_running_.store(false);
    }
    sweeper_cv_.notify_all();

    if (sweeper_ && sweeper_->joinable()) {
        sweeper_->join();
    }
    sweeper_.reset();
}

bool QueryCache::IsSweeperRunning() const {
    return sweeper_running_.load();
}

void QueryCache::SweepLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(sweeper_mutex_);
            if (sweeper_cv_.wait_for(lock, config_.sweep_interval,
                                     [this] { return !sweeper_running_.load(); })) {
                break;
            }
        }

        try {
            size_t removed = SweepExpired();
            if (removed > 0) {
                spdlog::debug("Query cache sweep: removed {} expired entries", removed);
            }
        } catch (const std::exception& e) {
            spdlog::error("Exception in query cache sweep: {}", e.what());
        }
    }
}

// ============================================================================
// Statistics
// ============================================================================

size_t QueryCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

bool QueryCache::Contains(const QueryKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.find(key.text) != map_.end();
}

QueryCache::Stats QueryCache::GetStats() const {
    Stats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.size = items_.size();
    }

    stats.capacity = config_.capacity;
    stats.ttl = config_.ttl;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.evictions = evictions_.load(std::memory_order_relaxed);
    stats.expirations = expirations_.load(std::memory_order_relaxed);
    stats.invalidations = invalidations_.load(std::memory_order_relaxed);

    uint64_t total = stats.hits + stats.misses;
    if (total > 0) {
        stats.hit_rate = static_cast<float>(stats.hits) / static_cast<float>(total);
    }

    return stats;
}

} // namespace geochron
