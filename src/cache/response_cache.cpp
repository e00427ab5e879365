#include "response_cache.hpp"
#include "size_estimator.hpp"
#include "../util.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace crancache {

ResponseCache::ResponseCache(CacheOptions options)
    : options_(std::move(options)) {
    if (options_.ttl_ms == 0)
        throw std::invalid_argument("cache ttl must be positive");
    if (options_.max_size_bytes == 0)
        throw std::invalid_argument("cache max size must be positive");
    if (!options_.clock)
        options_.clock = steady_millis;

    if (options_.sweep_interval_ms > 0) {
        sweeper_ = std::thread([this]() { sweep_loop(); });
    }
}

ResponseCache::~ResponseCache() {
    stop_sweeper();
}

uint64_t ResponseCache::now() const {
    return options_.clock();
}

bool ResponseCache::expired(const Entry& entry, uint64_t now) const {
    return now >= entry.stored_at && now - entry.stored_at >= entry.ttl_ms;
}

ResponseCache::EntryMap::iterator ResponseCache::erase_entry(EntryMap::iterator it) {
    // Must be called with mutex_ already held.
    used_bytes_ -= it->second.size;
    lru_.erase(it->second.recency);
    return entries_.erase(it);
}

void ResponseCache::evict_least_recent() {
    // Must be called with mutex_ already held.
    auto it = entries_.find(lru_.back());
    erase_entry(it);
    ++evictions_;
}

void ResponseCache::set(const std::string& key, ValuePtr value,
                        std::optional<uint64_t> ttl_ms) {
    if (!value) value = Value::null();

    // Sizing walks the caller's value only; no shared state involved.
    size_t entry_size = estimate_entry_size(key, value);
    uint64_t ttl = (ttl_ms && *ttl_ms > 0) ? *ttl_ms : options_.ttl_ms;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Drop the old entry first so it can never be chosen as its own victim.
        auto existing = entries_.find(key);
        if (existing != entries_.end()) erase_entry(existing);

        while (used_bytes_ + entry_size > options_.max_size_bytes && !entries_.empty()) {
            evict_least_recent();
        }

        lru_.push_front(key);
        entries_.emplace(key, Entry{std::move(value), now(), ttl, entry_size, lru_.begin()});
        used_bytes_ += entry_size;
    }

    // Logged outside the lock; options_ is fixed after construction.
    if (entry_size > options_.max_size_bytes) {
        std::cerr << "[cache] Entry " << key << " (" << entry_size
                  << " bytes) exceeds the " << options_.max_size_bytes
                  << " byte budget; stored alone\n";
    }
}

std::optional<ValuePtr> ResponseCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }

    uint64_t t = now();
    if (expired(it->second, t)) {
        erase_entry(it);
        ++expirations_;
        ++misses_;
        return std::nullopt;
    }

    ++hits_;
    it->second.stored_at = t;
    lru_.splice(lru_.begin(), lru_, it->second.recency);
    return it->second.value;
}

bool ResponseCache::has(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return false;

    if (expired(it->second, now())) {
        erase_entry(it);
        ++expirations_;
        return false;
    }
    return true;
}

bool ResponseCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    erase_entry(it);
    return true;
}

void ResponseCache::clear_locked() {
    entries_.clear();
    lru_.clear();
    used_bytes_ = 0;
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
    expirations_ = 0;
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    clear_locked();
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ResponseCache::memory_usage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_bytes_;
}

CacheStats ResponseCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheStats s;
    s.size = entries_.size();
    s.memory_usage = used_bytes_;
    s.max_size = options_.max_size_bytes;
    s.hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    s.expirations = expirations_;
    uint64_t requests = hits_ + misses_;
    s.hit_rate = requests > 0 ? static_cast<double>(hits_) / static_cast<double>(requests) : 0.0;
    return s;
}

size_t ResponseCache::sweep_locked() {
    uint64_t t = now();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (expired(it->second, t)) {
            it = erase_entry(it);
            ++expirations_;
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t ResponseCache::sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweep_locked();
}

void ResponseCache::sweep_loop() {
    auto interval = std::chrono::milliseconds(options_.sweep_interval_ms);
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_sweep_) {
        if (sweep_cv_.wait_for(lock, interval, [this]() { return stop_sweep_; }))
            break;
        size_t freed_before = used_bytes_;
        size_t removed = sweep_locked();
        size_t freed = freed_before - used_bytes_;
        if (removed > 0) {
            lock.unlock();
            std::cerr << "[cache] Sweep removed " << removed << " expired entries, freed "
                      << freed << " bytes\n";
            lock.lock();
        }
    }
}

void ResponseCache::stop_sweeper() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_sweep_ = true;
    }
    sweep_cv_.notify_all();
    if (sweeper_.joinable()) sweeper_.join();
}

void ResponseCache::destroy() {
    stop_sweeper();
    clear();
}

} // namespace crancache
