#include "MemoryStore.hpp"
#include <stdexcept>

void MemoryStore::checkAvailable() const
{
    m_operations.fetch_add(1, std::memory_order_relaxed);

    if (!m_available.load(std::memory_order_acquire))
    {
        throw StorageError("connection refused");
    }

    size_t pending = m_failuresToInject.load(std::memory_order_acquire);
    while (pending > 0)
    {
        if (m_failuresToInject.compare_exchange_weak(pending, pending - 1, std::memory_order_acq_rel))
        {
            throw StorageError("connection reset by peer");
        }
    }
}

int64_t MemoryStore::incrementBy(const std::string &key, int64_t delta)
{
    checkAvailable();
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values[key] += delta;
}

std::optional<int64_t> MemoryStore::get(const std::string &key) const
{
    checkAvailable();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryStore::del(const std::string &key)
{
    checkAvailable();
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values.erase(key) > 0;
}

void MemoryStore::ping() const
{
    checkAvailable();
}

void MemoryStore::setAvailable(bool available)
{
    m_available.store(available, std::memory_order_release);
}

bool MemoryStore::isAvailable() const
{
    return m_available.load(std::memory_order_acquire);
}

void MemoryStore::failNextOperations(size_t count)
{
    m_failuresToInject.store(count, std::memory_order_release);
}

size_t MemoryStore::keyCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values.size();
}

uint64_t MemoryStore::operationCount() const
{
    return m_operations.load(std::memory_order_relaxed);
}

MemoryConnection::MemoryConnection(std::shared_ptr<MemoryStore> store)
    : m_store(std::move(store))
{
    if (!m_store)
    {
        throw std::invalid_argument("MemoryConnection: null store");
    }
}

int64_t MemoryConnection::incrementBy(const std::string &key, int64_t delta)
{
    return m_store->incrementBy(key, delta);
}

std::optional<int64_t> MemoryConnection::get(const std::string &key)
{
    return m_store->get(key);
}

bool MemoryConnection::del(const std::string &key)
{
    return m_store->del(key);
}

void MemoryConnection::ping()
{
    m_store->ping();
}

std::shared_ptr<MemoryStore> MemoryCluster::store(const std::string &name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto &slot = m_stores[name];
    if (!slot)
    {
        slot = std::make_shared<MemoryStore>();
    }
    return slot;
}

std::unique_ptr<StorageConnection> MemoryCluster::connect(const std::string &address)
{
    const std::string scheme(SCHEME);
    if (address.compare(0, scheme.size(), scheme) != 0)
    {
        throw std::invalid_argument("MemoryCluster: not a memory address: " + address);
    }
    return std::make_unique<MemoryConnection>(store(address.substr(scheme.size())));
}

ConnectionFactory MemoryCluster::factory()
{
    return [this](const std::string &address)
    { return connect(address); };
}
