#include "ShardRegistry.hpp"
#include <iostream>
#include <stdexcept>

ShardRegistry::ShardRegistry(const std::vector<std::string> &addresses,
                             size_t virtualNodes,
                             ConnectionFactory factory,
                             RetryPolicy retryPolicy,
                             size_t maxConnectionsPerNode)
    : m_addresses(addresses),
      m_retryPolicy(retryPolicy)
{
    if (addresses.empty())
    {
        throw NoAvailableNodeError("ShardRegistry: no storage nodes configured");
    }

    for (const auto &address : addresses)
    {
        if (m_nodes.count(address) != 0)
        {
            throw std::invalid_argument("ShardRegistry: duplicate storage node " + address);
        }

        auto node = std::make_unique<Node>();
        node->address = address;
        node->pool = std::make_unique<ConnectionPool>(address, factory, maxConnectionsPerNode);
        node->lastChecked = std::chrono::system_clock::now();
        m_nodes.emplace(address, std::move(node));

        m_ring.addNode(address, virtualNodes);
    }
}

ShardRegistry::~ShardRegistry()
{
    stopHealthProbe();
}

ShardRegistry::Node &ShardRegistry::owner(const std::string &key)
{
    return findNode(m_ring.route(key));
}

ShardRegistry::Node &ShardRegistry::findNode(const std::string &address) const
{
    auto it = m_nodes.find(address);
    if (it == m_nodes.end())
    {
        throw std::invalid_argument("ShardRegistry: unknown storage node " + address);
    }
    return *it->second;
}

std::optional<int64_t> ShardRegistry::get(const std::string &key)
{
    return read(key).value;
}

ShardRead ShardRegistry::read(const std::string &key)
{
    Node &node = owner(key);
    auto value = execute(node, "get", [&key](StorageConnection &connection)
                         { return connection.get(key); });
    return ShardRead{value, node.address};
}

int64_t ShardRegistry::increment(const std::string &key, int64_t delta)
{
    Node &node = owner(key);
    return execute(node, "increment", [&key, delta](StorageConnection &connection)
                   { return connection.incrementBy(key, delta); });
}

bool ShardRegistry::reset(const std::string &key)
{
    Node &node = owner(key);
    return execute(node, "reset", [&key](StorageConnection &connection)
                   { return connection.del(key); });
}

std::string ShardRegistry::nodeFor(const std::string &key) const
{
    return m_ring.route(key);
}

bool ShardRegistry::nodeHealthy(const Node &node) const
{
    std::lock_guard<std::mutex> lock(node.mutex);
    return node.healthy;
}

void ShardRegistry::recordSuccess(Node &node)
{
    bool recovered = false;
    {
        std::lock_guard<std::mutex> lock(node.mutex);
        recovered = !node.healthy;
        node.healthy = true;
        node.consecutiveFailures = 0;
        node.lastChecked = std::chrono::system_clock::now();
    }

    if (recovered)
    {
        std::cout << "ShardRegistry: Storage node " << node.address << " is back online" << std::endl;
    }
}

void ShardRegistry::recordFailure(Node &node, const std::string &reason)
{
    bool wentDown = false;
    {
        std::lock_guard<std::mutex> lock(node.mutex);
        wentDown = node.healthy;
        node.healthy = false;
        ++node.consecutiveFailures;
        node.lastChecked = std::chrono::system_clock::now();
    }

    // Idle connections were opened against a node that just failed
    node.pool->clear();

    if (wentDown)
    {
        std::cerr << "ShardRegistry: Storage node " << node.address << " is down: " << reason << std::endl;
    }
}

std::map<std::string, bool> ShardRegistry::healthSnapshot() const
{
    std::map<std::string, bool> snapshot;
    for (const auto &address : m_addresses)
    {
        snapshot[address] = nodeHealthy(findNode(address));
    }
    return snapshot;
}

std::vector<NodeHealth> ShardRegistry::nodeHealth() const
{
    std::vector<NodeHealth> result;
    result.reserve(m_addresses.size());
    for (const auto &address : m_addresses)
    {
        const Node &node = findNode(address);
        std::lock_guard<std::mutex> lock(node.mutex);
        result.push_back(NodeHealth{node.address, node.healthy, node.lastChecked, node.consecutiveFailures});
    }
    return result;
}

bool ShardRegistry::isHealthy(const std::string &address) const
{
    return nodeHealthy(findNode(address));
}

RegistryStatus ShardRegistry::status() const
{
    RegistryStatus status;
    status.nodes = m_addresses.size();
    status.nodeStatus = healthSnapshot();
    for (const auto &pair : status.nodeStatus)
    {
        if (pair.second)
        {
            ++status.healthyNodes;
        }
    }
    status.distribution = m_ring.distribution();
    return status;
}

void ShardRegistry::markUnhealthy(const std::string &address)
{
    Node &node = findNode(address);
    std::lock_guard<std::mutex> lock(node.mutex);
    node.healthy = false;
    node.lastChecked = std::chrono::system_clock::now();
}

void ShardRegistry::markHealthy(const std::string &address)
{
    Node &node = findNode(address);
    std::lock_guard<std::mutex> lock(node.mutex);
    node.healthy = true;
    node.consecutiveFailures = 0;
    node.lastChecked = std::chrono::system_clock::now();
}

void ShardRegistry::probeNodes()
{
    for (const auto &address : m_addresses)
    {
        Node &node = findNode(address);
        try
        {
            ConnectionPool::Lease lease = node.pool->acquire();
            try
            {
                lease->ping();
            }
            catch (const std::exception &)
            {
                lease.discard();
                throw;
            }
            recordSuccess(node);
        }
        catch (const std::exception &e)
        {
            // A factory or client fault must not escape the probe thread
            recordFailure(node, e.what());
        }
    }
}

void ShardRegistry::startHealthProbe(std::chrono::milliseconds interval)
{
    if (m_probing.exchange(true))
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_probeMutex);
        m_stopProbe = false;
    }
    m_probeThread.reset(new std::thread(&ShardRegistry::probeLoop, this, interval));
}

void ShardRegistry::stopHealthProbe()
{
    if (!m_probing.exchange(false))
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_probeMutex);
        m_stopProbe = true;
    }
    m_probeCondition.notify_all();

    if (m_probeThread && m_probeThread->joinable())
    {
        m_probeThread->join();
    }
    m_probeThread.reset();
}

bool ShardRegistry::isProbing() const
{
    return m_probing.load();
}

void ShardRegistry::probeLoop(std::chrono::milliseconds interval)
{
    std::unique_lock<std::mutex> lock(m_probeMutex);
    while (!m_stopProbe)
    {
        if (m_probeCondition.wait_for(lock, interval, [this]
                                      { return m_stopProbe; }))
        {
            break;
        }

        lock.unlock();
        probeNodes();
        lock.lock();
    }
}
