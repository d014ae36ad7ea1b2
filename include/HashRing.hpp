#ifndef HASH_RING_HPP
#define HASH_RING_HPP

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Consistent hash ring mapping keys to storage nodes
 *
 * Every node owns a number of virtual positions derived from
 * "node-id:replica-index". A key belongs to the first position that is
 * greater than or equal to its own hash, wrapping around at the end.
 * Adding or removing a node only moves the keys whose successor changed.
 *
 * Thread-safe: routing takes a shared lock, topology changes an exclusive one.
 */
class HashRing
{
public:
    HashRing() = default;

    HashRing(const HashRing &) = delete;
    HashRing &operator=(const HashRing &) = delete;

    /**
     * @brief Adds a node with the given number of virtual positions
     *
     * Adding a node that is already present replaces its positions.
     *
     * @throws std::invalid_argument if virtualCount is zero
     */
    void addNode(const std::string &node, size_t virtualCount);

    /**
     * @brief Removes a node and all of its virtual positions
     *
     * @return true if the node was present
     */
    bool removeNode(const std::string &node);

    /**
     * @brief Returns the node owning the key
     *
     * @throws NoAvailableNodeError if the ring is empty
     */
    std::string route(const std::string &key) const;

    bool hasNode(const std::string &node) const;
    std::vector<std::string> nodes() const;
    size_t nodeCount() const;
    size_t ringSize() const;
    bool empty() const;
    void clear();

    // Number of virtual positions held by each node
    std::map<std::string, size_t> distribution() const;

    static uint64_t hashKey(const std::string &key);

private:
    struct RingEntry
    {
        uint64_t position;
        std::string node;
    };

    std::vector<RingEntry> m_ring; // sorted by position
    std::unordered_map<std::string, std::vector<uint64_t>> m_nodePositions;
    mutable std::shared_mutex m_mutex;

    void removePositions(const std::string &node); // m_mutex held exclusively
};

#endif
