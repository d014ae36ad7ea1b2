#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "BatchWriter.hpp"
#include "MemoryStore.hpp"
#include "MockStorageConnection.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

class BatchWriterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        cluster = std::make_shared<MemoryCluster>();

        RetryPolicy retryPolicy;
        retryPolicy.maxAttempts = 2;
        retryPolicy.baseDelay = std::chrono::milliseconds(1);

        registry = std::make_shared<ShardRegistry>(
            std::vector<std::string>{"memory://node1", "memory://node2"},
            50,
            cluster->factory(),
            retryPolicy,
            4);
    }

    void TearDown() override
    {
        if (writer)
        {
            writer->stop(std::chrono::milliseconds(0));
        }
        writer.reset();
        registry.reset();
    }

    std::unique_ptr<BatchWriter> makeWriter(std::chrono::milliseconds interval, size_t sizeLimit)
    {
        return std::make_unique<BatchWriter>(registry, interval, sizeLimit);
    }

    std::shared_ptr<MemoryStore> storeFor(const std::string &key)
    {
        std::string address = registry->nodeFor(key);
        return cluster->store(address.substr(std::string(MemoryCluster::SCHEME).size()));
    }

    // Finds a key owned by the given node
    std::string keyOwnedBy(const std::string &address, const std::string &prefix)
    {
        for (int i = 0;; ++i)
        {
            std::string key = prefix + std::to_string(i);
            if (registry->nodeFor(key) == address)
            {
                return key;
            }
        }
    }

    template <typename Predicate>
    bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(2))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }

    std::shared_ptr<MemoryCluster> cluster;
    std::shared_ptr<ShardRegistry> registry;
    std::unique_ptr<BatchWriter> writer;
};

TEST_F(BatchWriterTest, NullRegistryRejected)
{
    EXPECT_THROW(BatchWriter(nullptr, std::chrono::seconds(1), 10), std::invalid_argument);
}

TEST_F(BatchWriterTest, NegativeDeltaRejected)
{
    writer = makeWriter(std::chrono::hours(1), 100);
    EXPECT_THROW(writer->recordIncrement("visits:home", -1), std::invalid_argument);
    EXPECT_EQ(writer->pendingKeys(), 0u);
}

// Many increments of one key collapse into a single pending delta
TEST_F(BatchWriterTest, IncrementsCoalescePerKey)
{
    writer = makeWriter(std::chrono::hours(1), 100);

    for (int i = 0; i < 50; ++i)
    {
        writer->recordIncrement("visits:home");
    }
    writer->recordIncrement("visits:about", 3);

    EXPECT_EQ(writer->pendingKeys(), 2u);
    EXPECT_EQ(writer->pendingIncrements(), 53);
    EXPECT_EQ(writer->pendingFor("visits:home"), 50);
    EXPECT_EQ(writer->pendingFor("visits:about"), 3);
    EXPECT_EQ(writer->pendingFor("visits:other"), 0);
}

TEST_F(BatchWriterTest, PendingSnapshotKeepsFirstSeenTime)
{
    writer = makeWriter(std::chrono::hours(1), 100);
    const std::string down = keyOwnedBy("memory://node1", "visits:down");
    const std::string up = keyOwnedBy("memory://node2", "visits:up");

    auto before = std::chrono::steady_clock::now();
    writer->recordIncrement(down, 2);
    auto after = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    writer->recordIncrement(down, 3);
    writer->recordIncrement(up, 1);

    auto snapshot = writer->pendingSnapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    auto entry = std::find_if(snapshot.begin(), snapshot.end(), [&](const PendingDelta &delta)
                              { return delta.key == down; });
    ASSERT_TRUE(entry != snapshot.end());
    EXPECT_EQ(entry->delta, 5);
    EXPECT_TRUE(entry->firstSeenAt >= before);
    EXPECT_TRUE(entry->firstSeenAt <= after);

    // A requeued delta keeps the time of its first increment
    cluster->store("node1")->setAvailable(false);
    writer->flushNow();
    snapshot = writer->pendingSnapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].key, down);
    EXPECT_EQ(snapshot[0].delta, 5);
    EXPECT_TRUE(snapshot[0].firstSeenAt <= after);
}

TEST_F(BatchWriterTest, FlushWritesOneIncrementPerKey)
{
    writer = makeWriter(std::chrono::hours(1), 100);
    auto store = storeFor("visits:home");

    for (int i = 0; i < 50; ++i)
    {
        writer->recordIncrement("visits:home");
    }
    uint64_t before = store->operationCount();

    FlushReport report = writer->flushNow();

    EXPECT_EQ(report.attemptedKeys, 1u);
    EXPECT_EQ(report.flushedKeys, 1u);
    EXPECT_EQ(report.flushedIncrements, 50);
    EXPECT_FALSE(report.partialFailure());
    EXPECT_EQ(store->operationCount() - before, 1u);
    EXPECT_EQ(store->get("visits:home").value_or(-1), 50);

    EXPECT_EQ(writer->pendingKeys(), 0u);
    EXPECT_EQ(writer->pendingFor("visits:home"), 0);

    auto stats = writer->stats();
    EXPECT_EQ(stats.flushCycles, 1u);
    EXPECT_EQ(stats.flushedIncrements, 50u);
    EXPECT_TRUE(stats.lastSuccessfulFlush.has_value());
}

TEST_F(BatchWriterTest, FlushAddsToExistingCount)
{
    writer = makeWriter(std::chrono::hours(1), 100);
    registry->increment("visits:home", 10);

    writer->recordIncrement("visits:home", 5);
    writer->flushNow();

    EXPECT_EQ(registry->get("visits:home").value_or(-1), 15);
}

// Keys of a failed node stay buffered while the healthy node's keys are written
TEST_F(BatchWriterTest, PartialFailureKeepsFailedDeltas)
{
    writer = makeWriter(std::chrono::hours(1), 100);
    const std::string down = keyOwnedBy("memory://node1", "visits:down");
    const std::string up = keyOwnedBy("memory://node2", "visits:up");

    cluster->store("node1")->setAvailable(false);

    writer->recordIncrement(down, 4);
    writer->recordIncrement(up, 2);

    FlushReport report = writer->flushNow();
    EXPECT_EQ(report.attemptedKeys, 2u);
    EXPECT_EQ(report.flushedKeys, 1u);
    EXPECT_EQ(report.failedKeys, 1u);
    EXPECT_TRUE(report.partialFailure());

    EXPECT_EQ(writer->pendingFor(down), 4);
    EXPECT_EQ(writer->pendingFor(up), 0);
    EXPECT_EQ(cluster->store("node2")->get(up).value_or(-1), 2);

    auto stats = writer->stats();
    EXPECT_EQ(stats.partialFlushCycles, 1u);
    EXPECT_EQ(stats.failedFlushKeys, 1u);

    // More visits arrive during the outage, then the node comes back
    writer->recordIncrement(down, 1);
    EXPECT_EQ(writer->pendingFor(down), 5);

    cluster->store("node1")->setAvailable(true);
    report = writer->flushNow();
    EXPECT_EQ(report.flushedKeys, 1u);
    EXPECT_EQ(cluster->store("node1")->get(down).value_or(-1), 5);
    EXPECT_EQ(writer->pendingKeys(), 0u);
}

TEST_F(BatchWriterTest, DiscardDropsPendingDelta)
{
    writer = makeWriter(std::chrono::hours(1), 100);
    writer->recordIncrement("visits:home", 7);
    writer->recordIncrement("visits:about", 1);

    EXPECT_EQ(writer->discard("visits:home", 7), 7);
    EXPECT_EQ(writer->pendingFor("visits:home"), 0);
    EXPECT_EQ(writer->pendingKeys(), 1u);

    writer->flushNow();
    EXPECT_FALSE(registry->get("visits:home").has_value());
    EXPECT_EQ(registry->get("visits:about").value_or(-1), 1);
}

// Increments recorded after the caller measured the amount are kept
TEST_F(BatchWriterTest, BoundedDiscardKeepsLaterIncrements)
{
    writer = makeWriter(std::chrono::hours(1), 100);
    writer->recordIncrement("visits:home", 3);
    int64_t measured = writer->pendingFor("visits:home");
    writer->recordIncrement("visits:home", 2);

    EXPECT_EQ(writer->discard("visits:home", measured), 3);
    EXPECT_EQ(writer->pendingFor("visits:home"), 2);
    EXPECT_EQ(writer->pendingKeys(), 1u);

    EXPECT_EQ(writer->discard("visits:home", 10), 2);
    EXPECT_EQ(writer->pendingKeys(), 0u);
    EXPECT_EQ(writer->discard("visits:home", 1), 0);
}

// A fault that is not a storage error still puts the delta back
TEST_F(BatchWriterTest, ConnectionFaultRequeuesDelta)
{
    std::atomic<bool> broken{true};
    registry = std::make_shared<ShardRegistry>(
        std::vector<std::string>{"memory://node1"},
        50,
        [this, &broken](const std::string &address) -> std::unique_ptr<StorageConnection>
        {
            if (broken.load())
            {
                throw std::invalid_argument("Invalid address: " + address);
            }
            return cluster->connect(address);
        });
    writer = makeWriter(std::chrono::hours(1), 100);

    writer->recordIncrement("visits:home", 3);
    FlushReport report;
    EXPECT_NO_THROW(report = writer->flushNow());
    EXPECT_EQ(report.failedKeys, 1u);
    EXPECT_EQ(writer->pendingFor("visits:home"), 3);
    EXPECT_EQ(writer->pendingKeys(), 1u);
    EXPECT_EQ(writer->stats().failedFlushKeys, 1u);

    broken.store(false);
    report = writer->flushNow();
    EXPECT_EQ(report.flushedKeys, 1u);
    EXPECT_EQ(cluster->store("node1")->get("visits:home").value_or(-1), 3);
    EXPECT_EQ(writer->pendingKeys(), 0u);
}

// While a key is written to storage its state says so, afterwards the stripe moves on
TEST_F(BatchWriterTest, PendingStateTracksFlushOfKey)
{
    std::atomic<bool> applyingSeen{false};
    registry = std::make_shared<ShardRegistry>(
        std::vector<std::string>{"memory://node1"},
        50,
        [this, &applyingSeen](const std::string &) -> std::unique_ptr<StorageConnection>
        {
            auto connection = std::make_unique<::testing::NiceMock<MockStorageConnection>>();
            ON_CALL(*connection, incrementBy(::testing::_, ::testing::_))
                .WillByDefault([this, &applyingSeen](const std::string &key, int64_t delta)
                               {
                    applyingSeen.store(writer->pendingState(key).applying);
                    return delta; });
            return connection;
        });
    writer = makeWriter(std::chrono::hours(1), 100);

    writer->recordIncrement("visits:home", 4);
    PendingState before = writer->pendingState("visits:home");
    EXPECT_EQ(before.delta, 4);
    EXPECT_FALSE(before.applying);

    writer->flushNow();

    PendingState after = writer->pendingState("visits:home");
    EXPECT_TRUE(applyingSeen.load());
    EXPECT_EQ(after.delta, 0);
    EXPECT_FALSE(after.applying);
    EXPECT_GT(after.settled, before.settled);
    EXPECT_FALSE(PendingState::stable(before, after));
    EXPECT_TRUE(PendingState::stable(after, writer->pendingState("visits:home")));
}

TEST_F(BatchWriterTest, PeriodicFlush)
{
    writer = makeWriter(std::chrono::milliseconds(20), 1000);
    writer->start();
    EXPECT_TRUE(writer->isRunning());

    writer->recordIncrement("visits:home", 3);

    EXPECT_TRUE(waitFor([this]()
                        { return writer->pendingKeys() == 0 && registry->get("visits:home").value_or(0) == 3; }));

    EXPECT_TRUE(writer->stop(std::chrono::milliseconds(100)));
    EXPECT_FALSE(writer->isRunning());
}

// Reaching the size limit triggers a flush before the interval elapses
TEST_F(BatchWriterTest, SizeLimitTriggersEarlyFlush)
{
    writer = makeWriter(std::chrono::hours(1), 5);
    writer->start();

    for (int i = 0; i < 5; ++i)
    {
        writer->recordIncrement("visits:page" + std::to_string(i));
    }

    EXPECT_TRUE(waitFor([this]()
                        { return writer->pendingKeys() == 0; }));
    for (int i = 0; i < 5; ++i)
    {
        EXPECT_EQ(registry->get("visits:page" + std::to_string(i)).value_or(-1), 1);
    }
    EXPECT_GE(writer->stats().overflowFlushes, 1u);
}

TEST_F(BatchWriterTest, StopDrainsPendingDeltas)
{
    writer = makeWriter(std::chrono::hours(1), 1000);
    writer->start();

    writer->recordIncrement("visits:home", 2);
    writer->recordIncrement("visits:about", 1);

    EXPECT_TRUE(writer->stop(std::chrono::seconds(1)));
    EXPECT_EQ(registry->get("visits:home").value_or(-1), 2);
    EXPECT_EQ(registry->get("visits:about").value_or(-1), 1);
    EXPECT_EQ(writer->stats().droppedKeys, 0u);
}

TEST_F(BatchWriterTest, StopDropsUnflushableDeltas)
{
    writer = makeWriter(std::chrono::hours(1), 1000);
    writer->start();

    const std::string down = keyOwnedBy("memory://node1", "visits:down");
    const std::string up = keyOwnedBy("memory://node2", "visits:up");
    cluster->store("node1")->setAvailable(false);

    writer->recordIncrement(down, 4);
    writer->recordIncrement(up, 1);

    EXPECT_FALSE(writer->stop(std::chrono::milliseconds(200)));

    auto stats = writer->stats();
    EXPECT_EQ(stats.droppedKeys, 1u);
    EXPECT_EQ(stats.droppedIncrements, 4u);
    EXPECT_EQ(writer->pendingKeys(), 0u);
    EXPECT_EQ(cluster->store("node2")->get(up).value_or(-1), 1);
}

// The grace period runs out while a slow node is still being written
TEST_F(BatchWriterTest, StopDropsDeltasDeferredPastGrace)
{
    const auto callDuration = std::chrono::milliseconds(300);
    registry = std::make_shared<ShardRegistry>(
        std::vector<std::string>{"memory://slow"},
        50,
        [callDuration](const std::string &) -> std::unique_ptr<StorageConnection>
        {
            auto connection = std::make_unique<::testing::NiceMock<MockStorageConnection>>();
            ON_CALL(*connection, incrementBy(::testing::_, ::testing::_))
                .WillByDefault([callDuration](const std::string &, int64_t delta)
                               {
                    std::this_thread::sleep_for(callDuration);
                    return delta; });
            return connection;
        });
    writer = makeWriter(std::chrono::hours(1), 1000);
    writer->start();

    for (int i = 0; i < 4; ++i)
    {
        writer->recordIncrement("visits:page" + std::to_string(i), 2);
    }

    const auto grace = std::chrono::milliseconds(100);
    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(writer->stop(grace));
    auto elapsed = std::chrono::steady_clock::now() - started;

    // The call under way when the deadline passes is allowed to finish
    EXPECT_LT(elapsed, grace + callDuration + std::chrono::milliseconds(400));

    auto stats = writer->stats();
    EXPECT_EQ(stats.flushedIncrements, 2u);
    EXPECT_EQ(stats.droppedKeys, 3u);
    EXPECT_EQ(stats.droppedIncrements, 6u);
    EXPECT_EQ(writer->pendingKeys(), 0u);
}

TEST_F(BatchWriterTest, ConcurrentProducers)
{
    writer = makeWriter(std::chrono::milliseconds(10), 50);
    writer->start();

    const int numThreads = 4;
    const int incrementsPerThread = 500;
    std::vector<std::thread> producers;
    for (int t = 0; t < numThreads; ++t)
    {
        producers.emplace_back([this, t]()
                               {
            for (int i = 0; i < incrementsPerThread; ++i)
            {
                writer->recordIncrement("visits:page" + std::to_string((t + i) % 20));
            } });
    }
    for (auto &producer : producers)
    {
        producer.join();
    }

    EXPECT_TRUE(writer->stop(std::chrono::seconds(1)));

    int64_t total = 0;
    for (int i = 0; i < 20; ++i)
    {
        total += registry->get("visits:page" + std::to_string(i)).value_or(0);
    }
    EXPECT_EQ(total, numThreads * incrementsPerThread);
}
