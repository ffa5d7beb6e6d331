// File: src/storage/query_cache.hpp
#pragma once

#include "core/query_result.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace geochron {

/// Cache key: owning database plus canonical query signature
struct QueryKey {
    std::string database;
    std::string text;

    bool operator==(const QueryKey& other) const { return text == other.text; }
    bool operator!=(const QueryKey& other) const { return text != other.text; }
};

/// Build a canonical key
///
/// Parameters are rendered in sorted name order, so the same logical query
/// always yields the same key whatever order the caller supplied them in.
/// @param database Owning database
/// @param kind Query kind ("bbox", "timeseries", ...)
/// @param params Parameter name -> canonical value
QueryKey MakeQueryKey(const std::string& database,
                      const std::string& kind,
                      const std::map<std::string, std::string>& params);

/// Render a number for use in a key (round-trip precision, so equal doubles
/// give equal text and distinct doubles distinct text; -0 renders as 0)
std::string FormatKeyNumber(double value);

/// Result cache with LRU eviction and TTL expiry
///
/// One mutex serializes every operation. Entries are kept in a list ordered
/// by last access (front = most recent), so the back is always the globally
/// least-recently-used entry; entries never accessed since insertion are
/// ordered by insertion. A second index orders entries by expiry for the
/// sweep.
///
/// Each database has a generation that strictly increases with every
/// invalidation of that database. PutIfCurrent refuses to install a result
/// computed before the latest invalidation, so a slow reader cannot
/// resurrect data a completed write has invalidated.
class QueryCache {
public:
    /// Upper bound for ttl and sweep_interval (one year)
    static constexpr std::chrono::hours kMaxDuration{24 * 365};

    /// Configuration for QueryCache
    struct Config {
        /// Maximum number of live entries
        size_t capacity{1000};

        /// Lifetime of an entry from its put
        std::chrono::milliseconds ttl{std::chrono::seconds(300)};

        /// Period of the background sweep
        std::chrono::milliseconds sweep_interval{std::chrono::seconds(60)};

        /// Expired entries removed per lock hold during a sweep
        size_t sweep_batch_size{256};
    };

    /// Statistics structure
    struct Stats {
        size_t size{0};
        size_t capacity{0};
        std::chrono::milliseconds ttl{0};
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
        uint64_t expirations{0};
        uint64_t invalidations{0};
        float hit_rate{0.0f};
    };

    QueryCache();

    /// @throws std::invalid_argument for zero capacity or batch size, or a
    ///         ttl or interval outside (0, kMaxDuration]
    explicit QueryCache(const Config& config);

    /// Destructor - stops the sweeper
    virtual ~QueryCache();

    QueryCache(const QueryCache&) = delete;
    QueryCache& operator=(const QueryCache&) = delete;

    /// Look up a live entry, refreshing its last access
    /// An expired entry found here is removed and reported as a miss.
    std::optional<QueryResult> Get(const QueryKey& key);

    /// Insert or replace an entry; expiry = now + ttl
    /// At capacity, a new key first evicts the least-recently-used entry.
    void Put(const QueryKey& key, const QueryResult& value);

    /// Put unless key.database was invalidated since generation was read
    /// @return true if stored
    bool PutIfCurrent(const QueryKey& key, const QueryResult& value, uint64_t generation);

    /// Current invalidation generation of a database
    uint64_t Generation(const std::string& database) const;

    /// Remove one entry
    /// @return true if it was present
    bool Invalidate(const QueryKey& key);

    /// Remove every entry of a database and bump its generation
    /// @return Number of entries removed
    virtual size_t InvalidateDatabase(const std::string& database);

    /// Release the generation bookkeeping of a dropped database
    ///
    /// Raises the floor shared by every database, so a PutIfCurrent already
    /// in flight for any database is refused once.
    void ForgetDatabase(const std::string& database);

    /// Remove every entry and bump every generation
    void Clear();

    /// Remove all expired entries in batches of sweep_batch_size,
    /// releasing the lock between batches
    /// @return Number of entries removed
    size_t SweepExpired();

    /// Start the periodic sweep thread (no-op if running)
    void StartSweeper();

    /// Stop and join the sweep thread (no-op if stopped)
    void StopSweeper();

    bool IsSweeperRunning() const;

    size_t Size() const;
    size_t Capacity() const { return config_.capacity; }
    std::chrono::milliseconds Ttl() const { return config_.ttl; }

    bool Contains(const QueryKey& key) const;

    Stats GetStats() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        QueryKey key;
        QueryResult value;
        Clock::time_point expires_at;
        Clock::time_point last_access;
        std::multimap<Clock::time_point, std::string>::iterator expiry_it;
    };

    using EntryList = std::list<Entry>;

    Config config_;

    mutable std::mutex mutex_;

    // Front = most recently used, back = least recently used
    EntryList items_;

    // key text -> list position
    std::unordered_map<std::string, EntryList::iterator> map_;

    // database -> key texts
    std::unordered_map<std::string, std::unordered_set<std::string>> database_keys_;

    // expiry -> key text
    std::multimap<Clock::time_point, std::string> expiry_order_;

    // Generation(db) = max(floor_generation_, generations_[db]); every bump
    // takes the next value of generation_counter_
    std::unordered_map<std::string, uint64_t> generations_;
    uint64_t floor_generation_{0};
    uint64_t generation_counter_{0};

    // Statistics (atomics for lock-free reads)
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
    std::atomic<uint64_t> invalidations_{0};

    // Background sweep
    std::unique_ptr<std::thread> sweeper_;
    std::atomic<bool> sweeper_running_{false};
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;

    /// Remove an entry; caller holds mutex_
    void EraseLocked(EntryList::iterator it);

    /// Insert or replace; caller holds mutex_
    void PutLocked(const QueryKey& key, const QueryResult& value);

    uint64_t GenerationLocked(const std::string& database) const;

    /// Raise the floor above every per-database generation and drop them
    void RaiseFloorLocked();

    void SweepLoop();
};

} // namespace geochron
