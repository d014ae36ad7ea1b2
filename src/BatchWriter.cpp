#include "BatchWriter.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

BatchWriter::BatchWriter(std::shared_ptr<ShardRegistry> registry,
                         std::chrono::milliseconds flushInterval,
                         size_t sizeLimit)
    : m_registry(std::move(registry)),
      m_flushInterval(flushInterval),
      m_sizeLimit(sizeLimit)
{
    if (!m_registry)
    {
        throw std::invalid_argument("BatchWriter: null shard registry");
    }
}

BatchWriter::~BatchWriter()
{
    stop(std::chrono::milliseconds(0));
}

void BatchWriter::recordIncrement(const std::string &key, int64_t delta)
{
    if (delta < 0)
    {
        throw std::invalid_argument("BatchWriter: negative delta for key '" + key + "'");
    }
    if (delta == 0)
    {
        return;
    }

    size_t pendingKeys = 0;
    {
        Shard &shard = m_shards[getShardIndex(key)];
        std::lock_guard<std::mutex> lock(shard.mutex);

        auto it = shard.pending.find(key);
        if (it != shard.pending.end())
        {
            it->second.delta += delta;
            pendingKeys = m_pendingKeyCount.load(std::memory_order_relaxed);
        }
        else
        {
            shard.pending.emplace(key, PendingDelta{key, delta, std::chrono::steady_clock::now()});
            pendingKeys = m_pendingKeyCount.fetch_add(1, std::memory_order_relaxed) + 1;
        }
    }

    if (pendingKeys < m_sizeLimit)
    {
        return;
    }

    // Buffer overflow: wake the flush thread instead of rejecting the increment
    bool newlyRequested = false;
    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        newlyRequested = !m_flushRequested;
        m_flushRequested = true;
    }
    if (newlyRequested)
    {
        m_wakeCondition.notify_one();
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.overflowFlushes;
    }
}

FlushReport BatchWriter::flushNow()
{
    return flushUntil(std::nullopt);
}

FlushReport BatchWriter::flushUntil(std::optional<std::chrono::steady_clock::time_point> deadline)
{
    std::lock_guard<std::mutex> flushLock(m_flushMutex);

    std::vector<std::pair<std::string, int64_t>> batch;
    for (auto &shard : m_shards)
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto &pair : shard.pending)
        {
            shard.inFlight[pair.first] = InFlight{pair.second.delta, pair.second.firstSeenAt, false};
            batch.emplace_back(pair.first, pair.second.delta);
        }
        m_pendingKeyCount.fetch_sub(shard.pending.size(), std::memory_order_relaxed);
        shard.pending.clear();
    }

    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_flushRequested = false;
    }

    FlushReport report;
    std::string lastError;
    for (const auto &[key, delta] : batch)
    {
        Shard &shard = m_shards[getShardIndex(key)];

        if (deadline && std::chrono::steady_clock::now() >= *deadline)
        {
            requeue(shard, key);
            ++report.deferredKeys;
            continue;
        }

        ++report.attemptedKeys;
        {
            std::lock_guard<std::mutex> lock(shard.mutex);
            auto it = shard.inFlight.find(key);
            if (it != shard.inFlight.end())
            {
                it->second.applying = true;
            }
        }

        try
        {
            m_registry->increment(key, delta);
            ++report.flushedKeys;
            report.flushedIncrements += delta;

            std::lock_guard<std::mutex> lock(shard.mutex);
            if (shard.inFlight.erase(key) > 0)
            {
                ++shard.settled;
            }
        }
        catch (const std::exception &e)
        {
            // Unavailable node or a connection fault: either way the delta goes back
            ++report.failedKeys;
            lastError = e.what();
            requeue(shard, key);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.flushCycles;
        m_stats.flushedIncrements += static_cast<uint64_t>(report.flushedIncrements);
        if (report.flushedKeys > 0)
        {
            m_stats.lastSuccessfulFlush = std::chrono::system_clock::now();
        }
        if (report.partialFailure())
        {
            ++m_stats.partialFlushCycles;
            m_stats.failedFlushKeys += report.failedKeys;
        }
    }

    if (report.partialFailure())
    {
        std::cerr << "BatchWriter: Partial flush failure, " << report.failedKeys << " of "
                  << report.attemptedKeys << " keys kept for retry (last error: " << lastError << ")" << std::endl;
    }

    return report;
}

void BatchWriter::requeue(Shard &shard, const std::string &key)
{
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.inFlight.find(key);
    if (it == shard.inFlight.end())
    {
        return;
    }

    if (!it->second.discarded)
    {
        auto pending = shard.pending.find(key);
        if (pending != shard.pending.end())
        {
            // New increments arrived while this delta was in flight
            pending->second.delta += it->second.delta;
            pending->second.firstSeenAt = std::min(pending->second.firstSeenAt, it->second.firstSeenAt);
        }
        else
        {
            shard.pending.emplace(key, PendingDelta{key, it->second.delta, it->second.firstSeenAt});
            m_pendingKeyCount.fetch_add(1, std::memory_order_relaxed);
        }
    }

    shard.inFlight.erase(it);
    ++shard.settled;
}

int64_t BatchWriter::pendingFor(const std::string &key) const
{
    const Shard &shard = m_shards[getShardIndex(key)];
    std::lock_guard<std::mutex> lock(shard.mutex);

    int64_t total = 0;
    auto pending = shard.pending.find(key);
    if (pending != shard.pending.end())
    {
        total += pending->second.delta;
    }
    auto inFlight = shard.inFlight.find(key);
    if (inFlight != shard.inFlight.end() && !inFlight->second.discarded)
    {
        total += inFlight->second.delta;
    }
    return total;
}

PendingState BatchWriter::pendingState(const std::string &key) const
{
    const Shard &shard = m_shards[getShardIndex(key)];
    std::lock_guard<std::mutex> lock(shard.mutex);

    PendingState state;
    state.settled = shard.settled;
    auto pending = shard.pending.find(key);
    if (pending != shard.pending.end())
    {
        state.delta += pending->second.delta;
    }
    auto inFlight = shard.inFlight.find(key);
    if (inFlight != shard.inFlight.end())
    {
        state.applying = inFlight->second.applying;
        if (!inFlight->second.discarded)
        {
            state.delta += inFlight->second.delta;
        }
    }
    return state;
}

int64_t BatchWriter::discard(const std::string &key, int64_t amount)
{
    Shard &shard = m_shards[getShardIndex(key)];
    std::lock_guard<std::mutex> lock(shard.mutex);

    int64_t remaining = amount;
    auto inFlight = shard.inFlight.find(key);
    if (inFlight != shard.inFlight.end() && !inFlight->second.discarded &&
        inFlight->second.delta <= remaining)
    {
        inFlight->second.discarded = true;
        remaining -= inFlight->second.delta;
    }

    auto pending = shard.pending.find(key);
    if (pending != shard.pending.end() && remaining > 0)
    {
        int64_t taken = std::min(remaining, pending->second.delta);
        pending->second.delta -= taken;
        remaining -= taken;
        if (pending->second.delta == 0)
        {
            shard.pending.erase(pending);
            m_pendingKeyCount.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    return amount - remaining;
}

size_t BatchWriter::pendingKeys() const
{
    size_t count = 0;
    for (const auto &shard : m_shards)
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        count += shard.pending.size();
        for (const auto &pair : shard.inFlight)
        {
            if (!pair.second.discarded && shard.pending.count(pair.first) == 0)
            {
                ++count;
            }
        }
    }
    return count;
}

int64_t BatchWriter::pendingIncrements() const
{
    int64_t total = 0;
    for (const auto &shard : m_shards)
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto &pair : shard.pending)
        {
            total += pair.second.delta;
        }
        for (const auto &pair : shard.inFlight)
        {
            if (!pair.second.discarded)
            {
                total += pair.second.delta;
            }
        }
    }
    return total;
}

std::vector<PendingDelta> BatchWriter::pendingSnapshot() const
{
    std::vector<PendingDelta> snapshot;
    for (const auto &shard : m_shards)
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        std::unordered_map<std::string, PendingDelta> merged = shard.pending;
        for (const auto &pair : shard.inFlight)
        {
            if (pair.second.discarded)
            {
                continue;
            }
            auto it = merged.find(pair.first);
            if (it != merged.end())
            {
                it->second.delta += pair.second.delta;
                it->second.firstSeenAt = std::min(it->second.firstSeenAt, pair.second.firstSeenAt);
            }
            else
            {
                merged.emplace(pair.first, PendingDelta{pair.first, pair.second.delta, pair.second.firstSeenAt});
            }
        }
        for (auto &pair : merged)
        {
            snapshot.push_back(std::move(pair.second));
        }
    }
    return snapshot;
}

void BatchWriter::start()
{
    if (m_running.exchange(true))
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_stopRequested = false;
    }
    m_flushThread.reset(new std::thread(&BatchWriter::processFlushCycles, this));
}

bool BatchWriter::stop(std::chrono::milliseconds grace)
{
    if (m_running.exchange(false))
    {
        {
            std::lock_guard<std::mutex> lock(m_wakeMutex);
            m_stopRequested = true;
        }
        m_wakeCondition.notify_all();

        if (m_flushThread && m_flushThread->joinable())
        {
            m_flushThread->join();
        }
        m_flushThread.reset();
    }

    // Final drain, retried while it makes progress and time remains
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (pendingKeys() > 0 && std::chrono::steady_clock::now() < deadline)
    {
        FlushReport report = flushUntil(deadline);
        if (report.flushedKeys == 0)
        {
            break;
        }
    }

    return dropPending() == 0;
}

size_t BatchWriter::dropPending()
{
    size_t droppedKeys = 0;
    int64_t droppedIncrements = 0;

    for (auto &shard : m_shards)
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto &pair : shard.pending)
        {
            droppedIncrements += pair.second.delta;
        }
        droppedKeys += shard.pending.size();
        m_pendingKeyCount.fetch_sub(shard.pending.size(), std::memory_order_relaxed);
        shard.pending.clear();
    }

    if (droppedKeys > 0)
    {
        {
            std::lock_guard<std::mutex> lock(m_statsMutex);
            m_stats.droppedKeys += droppedKeys;
            m_stats.droppedIncrements += static_cast<uint64_t>(droppedIncrements);
        }
        std::cerr << "BatchWriter: Dropped " << droppedIncrements << " unflushed increments for "
                  << droppedKeys << " keys on shutdown" << std::endl;
    }

    return droppedKeys;
}

bool BatchWriter::isRunning() const
{
    return m_running.load();
}

BatchWriterStats BatchWriter::stats() const
{
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

void BatchWriter::processFlushCycles()
{
    std::unique_lock<std::mutex> lock(m_wakeMutex);
    while (!m_stopRequested)
    {
        m_wakeCondition.wait_for(lock, m_flushInterval, [this]
                                 { return m_stopRequested || m_flushRequested; });
        if (m_stopRequested)
        {
            break;
        }

        m_flushRequested = false;
        lock.unlock();
        flushNow();
        lock.lock();
    }
}
