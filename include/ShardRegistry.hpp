#ifndef SHARD_REGISTRY_HPP
#define SHARD_REGISTRY_HPP

#include "ConnectionPool.hpp"
#include "Errors.hpp"
#include "HashRing.hpp"
#include "RetryPolicy.hpp"
#include "StorageConnection.hpp"
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
#include <unordered_map>
#include <vector>

struct NodeHealth
{
    std::string address;
    bool healthy{true};
    std::chrono::system_clock::time_point lastChecked;
    size_t consecutiveFailures{0};
};

struct RegistryStatus
{
    size_t nodes{0};
    size_t healthyNodes{0};
    std::map<std::string, bool> nodeStatus;
    std::map<std::string, size_t> distribution; // virtual positions per node
};

// Value read from storage together with the node that served it
struct ShardRead
{
    std::optional<int64_t> value;
    std::string node;
};

/**
 * @brief Storage nodes behind a consistent hash ring
 *
 * Every operation is sent to the node owning the key. There is no fallback
 * to another node: while the owner is down, its keys are unavailable.
 * Healthy nodes get the full retry budget, nodes already marked unhealthy a
 * single attempt. Any success marks a node healthy again.
 */
class ShardRegistry
{
public:
    /**
     * @throws NoAvailableNodeError if addresses is empty
     */
    ShardRegistry(const std::vector<std::string> &addresses,
                  size_t virtualNodes,
                  ConnectionFactory factory,
                  RetryPolicy retryPolicy = RetryPolicy{},
                  size_t maxConnectionsPerNode = 10);

    ~ShardRegistry();

    ShardRegistry(const ShardRegistry &) = delete;
    ShardRegistry &operator=(const ShardRegistry &) = delete;

    // All of these throw StorageUnavailableError once the retry budget is spent
    std::optional<int64_t> get(const std::string &key);
    ShardRead read(const std::string &key);
    int64_t increment(const std::string &key, int64_t delta);
    bool reset(const std::string &key);

    std::string nodeFor(const std::string &key) const;
    std::map<std::string, bool> healthSnapshot() const;
    std::vector<NodeHealth> nodeHealth() const;
    bool isHealthy(const std::string &address) const;
    RegistryStatus status() const;

    // Administrative overrides; the next probe or operation may flip them back
    void markUnhealthy(const std::string &address);
    void markHealthy(const std::string &address);

    // Pings every node once and updates its health
    void probeNodes();

    void startHealthProbe(std::chrono::milliseconds interval);
    void stopHealthProbe();
    bool isProbing() const;

private:
    struct Node
    {
        std::string address;
        std::unique_ptr<ConnectionPool> pool;
        mutable std::mutex mutex; // guards the health fields below
        bool healthy{true};
        std::chrono::system_clock::time_point lastChecked;
        size_t consecutiveFailures{0};
    };

    Node &owner(const std::string &key);
    Node &findNode(const std::string &address) const;
    bool nodeHealthy(const Node &node) const;
    void recordSuccess(Node &node);
    void recordFailure(Node &node, const std::string &reason);
    void probeLoop(std::chrono::milliseconds interval);

    template <typename Op>
    auto execute(Node &node, const char *operation, Op &&op)
    {
        RetryPolicy policy = m_retryPolicy;
        if (!nodeHealthy(node))
        {
            policy.maxAttempts = 1;
        }

        try
        {
            auto result = retryWithBackoff(policy, [&]()
                                           {
                ConnectionPool::Lease lease = node.pool->acquire();
                try
                {
                    return op(*lease);
                }
                catch (const StorageError &)
                {
                    lease.discard();
                    throw;
                } });
            recordSuccess(node);
            return result;
        }
        catch (const StorageError &e)
        {
            recordFailure(node, e.what());
            throw StorageUnavailableError(node.address, std::string(operation) + " failed: " + e.what());
        }
    }

    HashRing m_ring;
    std::unordered_map<std::string, std::unique_ptr<Node>> m_nodes;
    std::vector<std::string> m_addresses;
    RetryPolicy m_retryPolicy;

    std::unique_ptr<std::thread> m_probeThread;
    std::mutex m_probeMutex;
    std::condition_variable m_probeCondition;
    bool m_stopProbe{false};
    std::atomic<bool> m_probing{false};
};

#endif
