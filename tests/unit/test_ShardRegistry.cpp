#include <gtest/gtest.h>
#include "ShardRegistry.hpp"
#include "MemoryStore.hpp"
#include "MockStorageConnection.hpp"
#include <deque>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

class ShardRegistryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        cluster = std::make_shared<MemoryCluster>();
        addresses = {"memory://node1", "memory://node2", "memory://node3"};

        retryPolicy.maxAttempts = 3;
        retryPolicy.baseDelay = std::chrono::milliseconds(1);
        retryPolicy.maxDelay = std::chrono::milliseconds(5);

        registry = std::make_unique<ShardRegistry>(addresses, 50, cluster->factory(), retryPolicy, 4);
    }

    void TearDown() override
    {
        registry.reset();
    }

    std::shared_ptr<MemoryStore> storeFor(const std::string &key)
    {
        std::string address = registry->nodeFor(key);
        return cluster->store(address.substr(std::string(MemoryCluster::SCHEME).size()));
    }

    std::shared_ptr<MemoryCluster> cluster;
    std::vector<std::string> addresses;
    RetryPolicy retryPolicy;
    std::unique_ptr<ShardRegistry> registry;
};

TEST_F(ShardRegistryTest, EmptyNodeListRejected)
{
    EXPECT_THROW(ShardRegistry({}, 50, cluster->factory()), NoAvailableNodeError);
}

TEST_F(ShardRegistryTest, DuplicateNodeRejected)
{
    EXPECT_THROW(ShardRegistry({"memory://a", "memory://a"}, 50, cluster->factory()), std::invalid_argument);
}

TEST_F(ShardRegistryTest, IncrementGoesToOwningNode)
{
    const std::string key = "visits:home";
    EXPECT_EQ(registry->increment(key, 3), 3);
    EXPECT_EQ(registry->increment(key, 2), 5);

    EXPECT_EQ(storeFor(key)->get(key).value_or(-1), 5);

    size_t holders = 0;
    for (const auto &address : addresses)
    {
        auto store = cluster->store(address.substr(std::string(MemoryCluster::SCHEME).size()));
        holders += store->keyCount();
    }
    EXPECT_EQ(holders, 1u);
}

TEST_F(ShardRegistryTest, ReadReportsServingNode)
{
    const std::string key = "visits:about";
    registry->increment(key, 4);

    ShardRead read = registry->read(key);
    ASSERT_TRUE(read.value.has_value());
    EXPECT_EQ(*read.value, 4);
    EXPECT_EQ(read.node, registry->nodeFor(key));
}

TEST_F(ShardRegistryTest, UnknownKeyReadsAsAbsent)
{
    EXPECT_FALSE(registry->get("visits:never").has_value());
}

TEST_F(ShardRegistryTest, ResetDeletesKey)
{
    const std::string key = "visits:home";
    registry->increment(key, 9);

    EXPECT_TRUE(registry->reset(key));
    EXPECT_FALSE(registry->get(key).has_value());
    EXPECT_FALSE(registry->reset(key));
}

TEST_F(ShardRegistryTest, TransientFailuresAreRetried)
{
    const std::string key = "visits:home";
    storeFor(key)->failNextOperations(2);

    EXPECT_EQ(registry->increment(key, 1), 1);
    EXPECT_TRUE(registry->isHealthy(registry->nodeFor(key)));
}

TEST_F(ShardRegistryTest, UnavailableNodeRaisesAndIsMarkedDown)
{
    const std::string key = "visits:home";
    const std::string owner = registry->nodeFor(key);
    storeFor(key)->setAvailable(false);

    try
    {
        registry->get(key);
        FAIL() << "expected StorageUnavailableError";
    }
    catch (const StorageUnavailableError &e)
    {
        EXPECT_EQ(e.node(), owner);
    }

    EXPECT_FALSE(registry->isHealthy(owner));
    auto snapshot = registry->healthSnapshot();
    EXPECT_FALSE(snapshot[owner]);

    RegistryStatus status = registry->status();
    EXPECT_EQ(status.nodes, 3u);
    EXPECT_EQ(status.healthyNodes, 2u);
}

// Keys are never rerouted to another node while their owner is down
TEST_F(ShardRegistryTest, NoReroutingWhileOwnerIsDown)
{
    const std::string key = "visits:home";
    const std::string owner = registry->nodeFor(key);
    storeFor(key)->setAvailable(false);

    EXPECT_THROW(registry->increment(key, 1), StorageUnavailableError);
    EXPECT_EQ(registry->nodeFor(key), owner);

    for (const auto &address : addresses)
    {
        auto store = cluster->store(address.substr(std::string(MemoryCluster::SCHEME).size()));
        store->setAvailable(true);
        EXPECT_FALSE(store->get(key).has_value());
    }
}

TEST_F(ShardRegistryTest, UnhealthyNodeGetsSingleAttempt)
{
    const std::string key = "visits:home";
    auto store = storeFor(key);
    store->setAvailable(false);

    EXPECT_THROW(registry->get(key), StorageUnavailableError);
    uint64_t afterFirst = store->operationCount();
    EXPECT_EQ(afterFirst, retryPolicy.maxAttempts);

    EXPECT_THROW(registry->get(key), StorageUnavailableError);
    EXPECT_EQ(store->operationCount() - afterFirst, 1u);
}

TEST_F(ShardRegistryTest, SuccessfulOperationRestoresHealth)
{
    const std::string key = "visits:home";
    const std::string owner = registry->nodeFor(key);
    auto store = storeFor(key);

    store->setAvailable(false);
    EXPECT_THROW(registry->get(key), StorageUnavailableError);
    EXPECT_FALSE(registry->isHealthy(owner));

    store->setAvailable(true);
    EXPECT_EQ(registry->increment(key, 1), 1);
    EXPECT_TRUE(registry->isHealthy(owner));
}

TEST_F(ShardRegistryTest, ProbeUpdatesHealth)
{
    auto store = cluster->store("node2");
    store->setAvailable(false);

    registry->probeNodes();
    EXPECT_FALSE(registry->isHealthy("memory://node2"));
    EXPECT_TRUE(registry->isHealthy("memory://node1"));

    store->setAvailable(true);
    registry->probeNodes();
    EXPECT_TRUE(registry->isHealthy("memory://node2"));
}

TEST_F(ShardRegistryTest, ManualHealthMarks)
{
    registry->markUnhealthy("memory://node3");
    EXPECT_FALSE(registry->isHealthy("memory://node3"));

    registry->markHealthy("memory://node3");
    EXPECT_TRUE(registry->isHealthy("memory://node3"));

    EXPECT_THROW(registry->markHealthy("memory://unknown"), std::invalid_argument);
}

TEST_F(ShardRegistryTest, NodeHealthDetails)
{
    cluster->store("node1")->setAvailable(false);
    registry->probeNodes();
    registry->probeNodes();

    auto health = registry->nodeHealth();
    ASSERT_EQ(health.size(), 3u);
    EXPECT_EQ(health[0].address, "memory://node1");
    EXPECT_FALSE(health[0].healthy);
    EXPECT_EQ(health[0].consecutiveFailures, 2u);
    EXPECT_TRUE(health[1].healthy);
    EXPECT_EQ(health[1].consecutiveFailures, 0u);
}

TEST_F(ShardRegistryTest, BackgroundProbeDetectsRecovery)
{
    auto store = cluster->store("node1");
    store->setAvailable(false);
    registry->probeNodes();
    ASSERT_FALSE(registry->isHealthy("memory://node1"));

    registry->startHealthProbe(std::chrono::milliseconds(10));
    EXPECT_TRUE(registry->isProbing());

    store->setAvailable(true);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!registry->isHealthy("memory://node1") && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(registry->isHealthy("memory://node1"));

    registry->stopHealthProbe();
    EXPECT_FALSE(registry->isProbing());
}

TEST_F(ShardRegistryTest, StatusReportsDistribution)
{
    RegistryStatus status = registry->status();
    ASSERT_EQ(status.distribution.size(), 3u);
    for (const auto &address : addresses)
    {
        EXPECT_EQ(status.distribution[address], 50u);
        EXPECT_TRUE(status.nodeStatus[address]);
    }
}

using ::testing::Return;
using ::testing::Throw;

// Connections handed out by the factory are scripted mocks, in order
class ShardRegistryMockTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        retryPolicy.maxAttempts = 3;
        retryPolicy.baseDelay = std::chrono::milliseconds(1);
        opened = 0;
    }

    MockStorageConnection &expectConnection()
    {
        scripted.push_back(std::make_unique<MockStorageConnection>());
        return *scripted.back();
    }

    std::unique_ptr<ShardRegistry> makeRegistry()
    {
        return std::make_unique<ShardRegistry>(
            std::vector<std::string>{"redis://only:6379"},
            10,
            [this](const std::string &) -> std::unique_ptr<StorageConnection>
            {
                ++opened;
                if (scripted.empty())
                {
                    throw StorageError("no scripted connection left");
                }
                std::unique_ptr<StorageConnection> connection = std::move(scripted.front());
                scripted.pop_front();
                return connection;
            },
            retryPolicy,
            4);
    }

    RetryPolicy retryPolicy;
    std::deque<std::unique_ptr<MockStorageConnection>> scripted;
    int opened;
};

// A connection that failed is replaced before the retry
TEST_F(ShardRegistryMockTest, RetryUsesFreshConnection)
{
    MockStorageConnection &broken = expectConnection();
    EXPECT_CALL(broken, incrementBy("visits:home", 2)).WillOnce(Throw(StorageError("connection reset")));
    MockStorageConnection &healthy = expectConnection();
    EXPECT_CALL(healthy, incrementBy("visits:home", 2)).WillOnce(Return(12));

    auto registry = makeRegistry();
    EXPECT_EQ(registry->increment("visits:home", 2), 12);
    EXPECT_EQ(opened, 2);
    EXPECT_TRUE(registry->isHealthy("redis://only:6379"));
}

TEST_F(ShardRegistryMockTest, ExhaustedRetriesMarkNodeDown)
{
    for (int i = 0; i < 3; ++i)
    {
        MockStorageConnection &connection = expectConnection();
        EXPECT_CALL(connection, get("visits:home")).WillOnce(Throw(StorageError("timeout")));
    }

    auto registry = makeRegistry();
    EXPECT_THROW(registry->get("visits:home"), StorageUnavailableError);
    EXPECT_EQ(opened, 3);
    EXPECT_FALSE(registry->isHealthy("redis://only:6379"));
}

TEST_F(ShardRegistryMockTest, HealthyConnectionIsReused)
{
    MockStorageConnection &connection = expectConnection();
    EXPECT_CALL(connection, get("visits:home")).WillOnce(Return(std::optional<int64_t>(4)));
    EXPECT_CALL(connection, del("visits:home")).WillOnce(Return(true));
    EXPECT_CALL(connection, ping()).Times(1);

    auto registry = makeRegistry();
    EXPECT_EQ(registry->get("visits:home").value_or(-1), 4);
    EXPECT_TRUE(registry->reset("visits:home"));
    registry->probeNodes();
    EXPECT_EQ(opened, 1);
}

TEST_F(ShardRegistryMockTest, UnreachableNodeFailsDuringProbe)
{
    auto registry = makeRegistry();
    registry->probeNodes();
    EXPECT_FALSE(registry->isHealthy("redis://only:6379"));
    EXPECT_EQ(opened, 1);
}

// A fault outside the storage error family marks the node down instead of escaping
TEST_F(ShardRegistryMockTest, HealthCheckSurvivesConnectionFault)
{
    MockStorageConnection &connection = expectConnection();
    EXPECT_CALL(connection, ping()).WillOnce(Throw(std::invalid_argument("malformed reply")));

    auto registry = makeRegistry();
    EXPECT_NO_THROW(registry->probeNodes());
    EXPECT_FALSE(registry->isHealthy("redis://only:6379"));
}
