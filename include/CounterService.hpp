#ifndef COUNTER_SERVICE_HPP
#define COUNTER_SERVICE_HPP

#include "BatchWriter.hpp"
#include "Config.hpp"
#include "CounterCache.hpp"
#include "ShardRegistry.hpp"
#include "StorageConnection.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class CountSource
{
    Cache,    // served from the in-process cache
    Storage,  // read from the owning node, plus any unflushed delta
    Buffered, // the node has no value yet, the count is the unflushed delta
};

const char *toString(CountSource source);

struct CountResult
{
    int64_t value{0};
    CountSource source{CountSource::Cache};
    std::string node; // serving node, empty for Cache
};

struct ServiceMetrics
{
    CounterCache::Stats cache;
    size_t pendingKeys{0};
    int64_t pendingIncrements{0};
    std::map<std::string, bool> nodeHealth;
    std::optional<std::chrono::system_clock::time_point> lastSuccessfulFlush;
    BatchWriterStats writer;
};

struct ServiceStatus
{
    std::string status; // "healthy" while at least one node is up, "degraded" otherwise
    size_t nodes{0};
    size_t healthyNodes{0};
    std::map<std::string, size_t> distribution;
    ServiceMetrics metrics;
};

/**
 * @brief Visit counter over sharded storage with a read cache and write batching
 *
 * Owns the shard registry, the cache and the batch writer. Independent
 * instances share nothing, so several can live in one process.
 */
class CounterService
{
public:
    /**
     * @param config Validated with validateConfig()
     * @param factory Opens storage connections, makeConnectionFactory(config) when empty
     * @param clock Time source for the cache, steady_clock::now when empty
     */
    explicit CounterService(const CounterConfig &config,
                            ConnectionFactory factory = ConnectionFactory(),
                            CounterCache::Clock clock = CounterCache::Clock());
    ~CounterService();

    CounterService(const CounterService &) = delete;
    CounterService &operator=(const CounterService &) = delete;

    // Probes the nodes once and starts the flush, health and cache cleanup tasks
    bool start();

    // Flushes pending increments within the shutdown grace period and stops the tasks
    bool shutdown();

    bool isRunning() const;

    /**
     * @brief Counts one visit without touching storage
     *
     * @return false once the service has been shut down
     */
    bool recordVisit(const std::string &key);

    /**
     * @throws StorageUnavailableError if the key is not cached and its node is down
     */
    CountResult getCount(const std::string &key);

    /**
     * @brief Sets the count back to zero
     *
     * Cache and buffer are only cleared once storage confirmed the reset.
     *
     * @throws StorageUnavailableError if the owning node is down
     */
    void resetCount(const std::string &key);

    FlushReport flushNow();
    ServiceMetrics metrics() const;
    ServiceStatus status() const;

    std::shared_ptr<ShardRegistry> getRegistry() const { return m_registry; }
    std::shared_ptr<CounterCache> getCache() const { return m_cache; }
    std::shared_ptr<BatchWriter> getBatchWriter() const { return m_batchWriter; }

private:
    static constexpr size_t NUM_KEY_LOCKS = 64;

    std::string storageKey(const std::string &key) const { return m_keyPrefix + key; }
    std::mutex &keyLock(const std::string &key)
    {
        return m_keyLocks[std::hash<std::string>{}(key) & (NUM_KEY_LOCKS - 1)];
    }
    void cleanupCache();

    std::shared_ptr<ShardRegistry> m_registry;
    std::shared_ptr<CounterCache> m_cache;
    std::shared_ptr<BatchWriter> m_batchWriter;

    const std::string m_keyPrefix;
    const std::chrono::milliseconds m_healthCheckInterval;
    const std::chrono::milliseconds m_shutdownGrace;
    const std::chrono::milliseconds m_cacheTtl;

    // Serializes record, reset and cache refill of one key; never held during storage I/O
    std::array<std::mutex, NUM_KEY_LOCKS> m_keyLocks;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_acceptingVisits{true};
    std::mutex m_systemMutex;

    std::unique_ptr<std::thread> m_cleanupThread;
    std::mutex m_cleanupMutex;
    std::condition_variable m_cleanupCondition;
    bool m_stopCleanup{false};
};

#endif
