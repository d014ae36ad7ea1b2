#ifndef MEMORY_STORE_HPP
#define MEMORY_STORE_HPP

#include "StorageConnection.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/**
 * @brief In-process counter store standing in for one storage node
 *
 * Backs "memory://" node addresses. Availability can be switched off to
 * simulate an unreachable node.
 */
class MemoryStore
{
public:
    MemoryStore() = default;

    int64_t incrementBy(const std::string &key, int64_t delta);
    std::optional<int64_t> get(const std::string &key) const;
    bool del(const std::string &key);
    void ping() const;

    void setAvailable(bool available);
    bool isAvailable() const;

    // The next `count` operations fail even while available
    void failNextOperations(size_t count);

    size_t keyCount() const;
    uint64_t operationCount() const;

private:
    void checkAvailable() const;

    std::unordered_map<std::string, int64_t> m_values;
    mutable std::mutex m_mutex;
    std::atomic<bool> m_available{true};
    mutable std::atomic<size_t> m_failuresToInject{0};
    mutable std::atomic<uint64_t> m_operations{0};
};

class MemoryConnection : public StorageConnection
{
public:
    explicit MemoryConnection(std::shared_ptr<MemoryStore> store);

    int64_t incrementBy(const std::string &key, int64_t delta) override;
    std::optional<int64_t> get(const std::string &key) override;
    bool del(const std::string &key) override;
    void ping() override;

private:
    std::shared_ptr<MemoryStore> m_store;
};

/**
 * @brief Named memory stores, one per "memory://name" address
 */
class MemoryCluster
{
public:
    // Returns the store for a name, creating it on first use
    std::shared_ptr<MemoryStore> store(const std::string &name);

    std::unique_ptr<StorageConnection> connect(const std::string &address);

    ConnectionFactory factory();

    static constexpr const char *SCHEME = "memory://";

private:
    std::unordered_map<std::string, std::shared_ptr<MemoryStore>> m_stores;
    std::mutex m_mutex;
};

#endif
