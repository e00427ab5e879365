#pragma once
#include "../value.hpp"
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace crancache {

struct CacheOptions {
    uint64_t ttl_ms = 3600 * 1000;               // default entry lifetime
    uint64_t max_size_bytes = 100 * 1024 * 1024; // budget for all entries
    uint64_t sweep_interval_ms = 5 * 60 * 1000;  // 0 = no background sweep
    std::function<uint64_t()> clock;             // ms; defaults to steady_millis
};

struct CacheStats {
    size_t size = 0;
    size_t memory_usage = 0;
    size_t max_size = 0;
    double hit_rate = 0.0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
};

// Byte-budgeted TTL cache with access-order LRU eviction.
//
// A successful get() refreshes the entry's timestamp, which both postpones
// its eviction and restarts its TTL. has() checks expiry without touching
// recency. Every public method takes mutex_; so does the background sweep.
class ResponseCache {
public:
    // Throws std::invalid_argument on a zero ttl or budget.
    explicit ResponseCache(CacheOptions options = {});
    ~ResponseCache();

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // Insert or replace. ttl_ms of nullopt or 0 uses the default ttl.
    // A value larger than the whole budget is kept after evicting everything else.
    void set(const std::string& key, ValuePtr value,
             std::optional<uint64_t> ttl_ms = std::nullopt);

    // Look up a live entry. Returns nullopt on a miss.
    std::optional<ValuePtr> get(const std::string& key);

    bool has(const std::string& key);
    bool remove(const std::string& key);
    void clear();

    size_t size() const;
    size_t memory_usage() const;
    CacheStats stats() const;

    // Evict every expired entry now. Returns the number removed.
    size_t sweep();

    // Stop the background sweep and clear. Safe to call repeatedly; the cache
    // keeps working afterwards with lazy expiry only.
    void destroy();

private:
    struct Entry {
        ValuePtr value;
        uint64_t stored_at;
        uint64_t ttl_ms;
        size_t size;
        std::list<std::string>::iterator recency; // position in lru_
    };

    using EntryMap = std::unordered_map<std::string, Entry>;

    uint64_t now() const;
    bool expired(const Entry& entry, uint64_t now) const;
    EntryMap::iterator erase_entry(EntryMap::iterator it);
    void evict_least_recent();
    size_t sweep_locked();
    void clear_locked();
    void sweep_loop();
    void stop_sweeper();

    CacheOptions options_;
    EntryMap entries_;
    std::list<std::string> lru_; // front = most recently touched
    size_t used_bytes_ = 0;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t expirations_ = 0;
    mutable std::mutex mutex_;

    std::thread sweeper_;
    std::condition_variable sweep_cv_;
    bool stop_sweep_ = false;
    std::mutex lifecycle_mutex_;
};

} // namespace crancache
