#ifndef BATCH_WRITER_HPP
#define BATCH_WRITER_HPP

#include "ShardRegistry.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct PendingDelta
{
    std::string key;
    int64_t delta{0};
    std::chrono::steady_clock::time_point firstSeenAt;
};

// Buffered state of one key, compared before and after a storage read
struct PendingState
{
    int64_t delta{0};     // as pendingFor()
    bool applying{false}; // a flush is writing the key's in-flight delta right now
    uint64_t settled{0};  // in-flight deltas of the key's stripe applied or requeued so far

    // True if no delta of the key can have reached storage between the two states
    static bool stable(const PendingState &before, const PendingState &after)
    {
        return !before.applying && !after.applying && before.settled == after.settled;
    }
};

// Outcome of one flush cycle
struct FlushReport
{
    size_t attemptedKeys{0};
    size_t flushedKeys{0};
    size_t failedKeys{0};
    size_t deferredKeys{0}; // not attempted before the deadline
    int64_t flushedIncrements{0};

    bool partialFailure() const { return failedKeys > 0; }
};

struct BatchWriterStats
{
    uint64_t flushCycles{0};
    uint64_t partialFlushCycles{0};
    uint64_t failedFlushKeys{0};
    uint64_t flushedIncrements{0};
    uint64_t overflowFlushes{0};
    uint64_t droppedKeys{0};
    uint64_t droppedIncrements{0};
    std::optional<std::chrono::system_clock::time_point> lastSuccessfulFlush;
};

/**
 * @brief Coalesces increments per key and applies them to storage in batches
 *
 * recordIncrement() only touches memory. A background thread flushes every
 * interval, or as soon as the number of pending keys reaches the size limit.
 * A flush takes the pending deltas under lock, applies them without holding
 * any lock, then drops the applied ones. Failed deltas go back into the
 * buffer for the next cycle, so a key may be applied more than once after a
 * partial failure but is never silently lost.
 */
class BatchWriter
{
public:
    static constexpr size_t NUM_SHARDS = 64;

    BatchWriter(std::shared_ptr<ShardRegistry> registry,
                std::chrono::milliseconds flushInterval,
                size_t sizeLimit);

    ~BatchWriter();

    BatchWriter(const BatchWriter &) = delete;
    BatchWriter &operator=(const BatchWriter &) = delete;

    // Never blocks on storage
    void recordIncrement(const std::string &key, int64_t delta = 1);

    // Runs one flush cycle on the calling thread
    FlushReport flushNow();

    // Delta not yet acknowledged by storage, including one being flushed
    int64_t pendingFor(const std::string &key) const;

    PendingState pendingState(const std::string &key) const;

    /**
     * @brief Forgets at most `amount` buffered increments of a key, oldest first
     *
     * An in-flight delta is only discarded whole, and only if it fits in what
     * is left of `amount`; once discarded it is not re-queued on failure.
     * Increments recorded after the caller measured `amount` survive.
     *
     * @return The number of increments discarded
     */
    int64_t discard(const std::string &key, int64_t amount);

    size_t pendingKeys() const;
    int64_t pendingIncrements() const;
    std::vector<PendingDelta> pendingSnapshot() const;

    void start();

    /**
     * @brief Stops the flush thread and drains the buffer
     *
     * Keys that cannot be flushed within the grace period are dropped and
     * counted in droppedKeys / droppedIncrements.
     *
     * @return true if nothing was dropped
     */
    bool stop(std::chrono::milliseconds grace);

    bool isRunning() const;
    BatchWriterStats stats() const;

private:
    struct InFlight
    {
        int64_t delta{0};
        std::chrono::steady_clock::time_point firstSeenAt;
        bool discarded{false};
        bool applying{false};
    };

    struct Shard
    {
        mutable std::mutex mutex;
        std::unordered_map<std::string, PendingDelta> pending;
        std::unordered_map<std::string, InFlight> inFlight;
        uint64_t settled{0};
    };

    size_t getShardIndex(const std::string &key) const
    {
        return std::hash<std::string>{}(key) & (NUM_SHARDS - 1);
    }

    FlushReport flushUntil(std::optional<std::chrono::steady_clock::time_point> deadline);
    void requeue(Shard &shard, const std::string &key);
    void processFlushCycles();
    size_t dropPending();

    std::shared_ptr<ShardRegistry> m_registry;
    const std::chrono::milliseconds m_flushInterval;
    const size_t m_sizeLimit;

    std::array<Shard, NUM_SHARDS> m_shards;
    std::atomic<size_t> m_pendingKeyCount{0};

    std::mutex m_flushMutex; // one flush cycle at a time

    std::unique_ptr<std::thread> m_flushThread;
    std::atomic<bool> m_running{false};
    std::mutex m_wakeMutex;
    std::condition_variable m_wakeCondition;
    bool m_stopRequested{false};
    bool m_flushRequested{false};

    mutable std::mutex m_statsMutex;
    BatchWriterStats m_stats;
};

#endif
