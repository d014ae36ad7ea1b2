#ifndef COUNTER_CACHE_HPP
#define COUNTER_CACHE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/**
 * @brief Bounded LRU cache of last known counts with a fixed time to live
 *
 * An entry older than the TTL is never returned: get() reports it as a miss
 * and drops it. Inserting into a full cache evicts the least recently used
 * entry. Hit and miss counters are updated under the same lock as the lookup.
 */
class CounterCache
{
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct Stats
    {
        uint64_t hits{0};
        uint64_t misses{0};
        size_t size{0};
    };

    /**
     * @param capacity Maximum number of entries
     * @param ttl Age after which an entry counts as absent
     * @param clock Time source, steady_clock::now when empty
     */
    CounterCache(size_t capacity, std::chrono::milliseconds ttl, Clock clock = Clock());

    CounterCache(const CounterCache &) = delete;
    CounterCache &operator=(const CounterCache &) = delete;

    std::optional<int64_t> get(const std::string &key);
    void put(const std::string &key, int64_t value);

    /**
     * @brief Adds delta to a live entry and resets its insertion time
     *
     * Never creates an entry: a cached count must start from a value read
     * from storage. An expired entry is dropped.
     *
     * @return The new value, std::nullopt if the key had no live entry
     */
    std::optional<int64_t> increment(const std::string &key, int64_t delta);

    // Returns true if an entry was removed
    bool invalidate(const std::string &key);

    // Drops every expired entry, returns how many were dropped
    size_t purgeExpired();

    void clear();
    Stats stats() const;
    size_t size() const;
    size_t capacity() const { return m_capacity; }
    std::chrono::milliseconds ttl() const { return m_ttl; }

private:
    struct Entry
    {
        int64_t value;
        std::chrono::steady_clock::time_point insertedAt;
        std::list<std::string>::iterator lruIt;
    };

    // Called with m_mutex held
    bool isExpired(const Entry &entry, std::chrono::steady_clock::time_point now) const;
    void touch(Entry &entry);
    void insert(const std::string &key, int64_t value, std::chrono::steady_clock::time_point now);
    void erase(std::unordered_map<std::string, Entry>::iterator it);
    void evictLRU();

    const size_t m_capacity;
    const std::chrono::milliseconds m_ttl;
    Clock m_clock;

    std::list<std::string> m_lruList; // front is most recently used
    std::unordered_map<std::string, Entry> m_entries;
    uint64_t m_hits{0};
    uint64_t m_misses{0};
    mutable std::mutex m_mutex;
};

#endif
