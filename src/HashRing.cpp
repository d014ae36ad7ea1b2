#include "HashRing.hpp"
#include "Digest.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

uint64_t HashRing::hashKey(const std::string &key)
{
    return Digest::ringPosition(key);
}

void HashRing::addNode(const std::string &node, size_t virtualCount)
{
    if (virtualCount == 0)
    {
        throw std::invalid_argument("HashRing: virtual node count must be positive");
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);

    removePositions(node);

    std::unordered_set<uint64_t> taken;
    taken.reserve(m_ring.size() + virtualCount);
    for (const auto &entry : m_ring)
    {
        taken.insert(entry.position);
    }

    std::vector<uint64_t> positions;
    positions.reserve(virtualCount);
    for (size_t i = 0; i < virtualCount; ++i)
    {
        std::string label = node + ":" + std::to_string(i);
        uint64_t position = hashKey(label);

        // Positions must stay unique so that ownership is unambiguous
        while (taken.count(position) != 0)
        {
            label += "#";
            position = hashKey(label);
        }

        taken.insert(position);
        positions.push_back(position);
        m_ring.push_back(RingEntry{position, node});
    }

    m_nodePositions[node] = std::move(positions);

    std::sort(m_ring.begin(), m_ring.end(),
              [](const RingEntry &a, const RingEntry &b)
              { return a.position < b.position; });
}

bool HashRing::removeNode(const std::string &node)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    if (m_nodePositions.find(node) == m_nodePositions.end())
    {
        return false;
    }

    removePositions(node);
    return true;
}

void HashRing::removePositions(const std::string &node)
{
    auto it = m_nodePositions.find(node);
    if (it == m_nodePositions.end())
    {
        return;
    }

    m_ring.erase(std::remove_if(m_ring.begin(), m_ring.end(),
                                [&node](const RingEntry &entry)
                                { return entry.node == node; }),
                 m_ring.end());
    m_nodePositions.erase(it);
}

std::string HashRing::route(const std::string &key) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    if (m_ring.empty())
    {
        throw NoAvailableNodeError("HashRing: ring is empty, no node can own key '" + key + "'");
    }

    uint64_t position = hashKey(key);
    auto it = std::lower_bound(m_ring.begin(), m_ring.end(), position,
                               [](const RingEntry &entry, uint64_t value)
                               { return entry.position < value; });
    if (it == m_ring.end())
    {
        it = m_ring.begin();
    }

    return it->node;
}

bool HashRing::hasNode(const std::string &node) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_nodePositions.find(node) != m_nodePositions.end();
}

std::vector<std::string> HashRing::nodes() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::vector<std::string> result;
    result.reserve(m_nodePositions.size());
    for (const auto &pair : m_nodePositions)
    {
        result.push_back(pair.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t HashRing::nodeCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_nodePositions.size();
}

size_t HashRing::ringSize() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_ring.size();
}

bool HashRing::empty() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_ring.empty();
}

void HashRing::clear()
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_ring.clear();
    m_nodePositions.clear();
}

std::map<std::string, size_t> HashRing::distribution() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::map<std::string, size_t> result;
    for (const auto &pair : m_nodePositions)
    {
        result[pair.first] = pair.second.size();
    }
    return result;
}
