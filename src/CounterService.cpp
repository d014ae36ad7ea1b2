#include "CounterService.hpp"
#include "ConnectionFactory.hpp"
#include <algorithm>
#include <iostream>

const char *toString(CountSource source)
{
    switch (source)
    {
    case CountSource::Cache:
        return "cache";
    case CountSource::Storage:
        return "storage";
    case CountSource::Buffered:
        return "buffered";
    }
    return "unknown";
}

CounterService::CounterService(const CounterConfig &config,
                               ConnectionFactory factory,
                               CounterCache::Clock clock)
    : m_keyPrefix(config.keyPrefix),
      m_healthCheckInterval(config.healthCheckInterval),
      m_shutdownGrace(config.shutdownGrace),
      m_cacheTtl(config.cacheTtl)
{
    validateConfig(config);

    if (!factory)
    {
        factory = makeConnectionFactory(config);
    }

    RetryPolicy retryPolicy;
    retryPolicy.maxAttempts = config.retryAttempts;
    retryPolicy.baseDelay = config.baseRetryDelay;

    m_registry = std::make_shared<ShardRegistry>(
        config.nodes,
        config.virtualNodes,
        std::move(factory),
        retryPolicy,
        config.maxConnectionsPerNode);
    m_cache = std::make_shared<CounterCache>(config.cacheCapacity, config.cacheTtl, std::move(clock));
    m_batchWriter = std::make_shared<BatchWriter>(m_registry, config.batchInterval, config.batchSizeLimit);
}

CounterService::~CounterService()
{
    shutdown();
}

bool CounterService::start()
{
    std::lock_guard<std::mutex> lock(m_systemMutex);

    if (m_running.load(std::memory_order_acquire))
    {
        std::cerr << "CounterService: Already running" << std::endl;
        return false;
    }

    m_registry->probeNodes();
    RegistryStatus registryStatus = m_registry->status();
    for (const auto &pair : registryStatus.nodeStatus)
    {
        if (pair.second)
        {
            std::cout << "CounterService: Connected to storage node " << pair.first << std::endl;
        }
    }

    m_running.store(true, std::memory_order_release);
    m_acceptingVisits.store(true, std::memory_order_release);

    m_batchWriter->start();
    m_registry->startHealthProbe(m_healthCheckInterval);

    {
        std::lock_guard<std::mutex> cleanupLock(m_cleanupMutex);
        m_stopCleanup = false;
    }
    m_cleanupThread.reset(new std::thread(&CounterService::cleanupCache, this));

    std::cout << "CounterService: Started with " << registryStatus.healthyNodes << "/"
              << registryStatus.nodes << " healthy storage nodes" << std::endl;
    return true;
}

bool CounterService::shutdown()
{
    std::lock_guard<std::mutex> lock(m_systemMutex);

    m_acceptingVisits.store(false, std::memory_order_release);

    if (!m_running.exchange(false))
    {
        // Never started: still drain whatever was recorded
        return m_batchWriter->stop(m_shutdownGrace);
    }

    {
        std::lock_guard<std::mutex> cleanupLock(m_cleanupMutex);
        m_stopCleanup = true;
    }
    m_cleanupCondition.notify_all();
    if (m_cleanupThread && m_cleanupThread->joinable())
    {
        m_cleanupThread->join();
    }
    m_cleanupThread.reset();

    bool drained = m_batchWriter->stop(m_shutdownGrace);
    m_registry->stopHealthProbe();

    std::cout << "CounterService: Stopped" << std::endl;
    return drained;
}

bool CounterService::isRunning() const
{
    return m_running.load(std::memory_order_acquire);
}

bool CounterService::recordVisit(const std::string &key)
{
    if (!m_acceptingVisits.load(std::memory_order_acquire))
    {
        std::cerr << "CounterService: Not accepting visits" << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(keyLock(key));
    // Only a live entry moves; without one the next read merges storage and buffer
    m_cache->increment(key, 1);
    m_batchWriter->recordIncrement(storageKey(key), 1);
    return true;
}

CountResult CounterService::getCount(const std::string &key)
{
    if (auto cached = m_cache->get(key))
    {
        return CountResult{*cached, CountSource::Cache, ""};
    }

    const std::string storedKey = storageKey(key);
    PendingState before = m_batchWriter->pendingState(storedKey);
    ShardRead stored = m_registry->read(storedKey);

    std::lock_guard<std::mutex> lock(keyLock(key));
    PendingState after = m_batchWriter->pendingState(storedKey);

    // A flush of this key that overlapped the read may be missing from both
    // sides, so count the larger buffer and leave the cache alone
    const bool stable = PendingState::stable(before, after);
    int64_t pending = stable ? after.delta : std::max(before.delta, after.delta);

    CountResult result;
    result.node = stored.node;
    if (stored.value)
    {
        result.value = *stored.value + pending;
        result.source = CountSource::Storage;
    }
    else if (pending > 0)
    {
        result.value = pending;
        result.source = CountSource::Buffered;
    }
    else
    {
        result.value = 0;
        result.source = CountSource::Storage;
    }

    if (stable)
    {
        m_cache->put(key, result.value);
    }
    return result;
}

void CounterService::resetCount(const std::string &key)
{
    const std::string storedKey = storageKey(key);
    const int64_t buffered = m_batchWriter->pendingFor(storedKey);
    m_registry->reset(storedKey);

    // Visits recorded while the delete was on the wire belong to the new count
    std::lock_guard<std::mutex> lock(keyLock(key));
    m_batchWriter->discard(storedKey, buffered);
    m_cache->invalidate(key);
}

FlushReport CounterService::flushNow()
{
    return m_batchWriter->flushNow();
}

ServiceMetrics CounterService::metrics() const
{
    ServiceMetrics metrics;
    metrics.cache = m_cache->stats();
    metrics.pendingKeys = m_batchWriter->pendingKeys();
    metrics.pendingIncrements = m_batchWriter->pendingIncrements();
    metrics.nodeHealth = m_registry->healthSnapshot();
    metrics.writer = m_batchWriter->stats();
    metrics.lastSuccessfulFlush = metrics.writer.lastSuccessfulFlush;
    return metrics;
}

ServiceStatus CounterService::status() const
{
    RegistryStatus registryStatus = m_registry->status();

    ServiceStatus status;
    status.status = registryStatus.healthyNodes > 0 ? "healthy" : "degraded";
    status.nodes = registryStatus.nodes;
    status.healthyNodes = registryStatus.healthyNodes;
    status.distribution = std::move(registryStatus.distribution);
    status.metrics = metrics();
    return status;
}

void CounterService::cleanupCache()
{
    std::unique_lock<std::mutex> lock(m_cleanupMutex);
    while (!m_stopCleanup)
    {
        if (m_cleanupCondition.wait_for(lock, m_cacheTtl, [this]
                                        { return m_stopCleanup; }))
        {
            break;
        }

        lock.unlock();
        m_cache->purgeExpired();
        lock.lock();
    }
}
