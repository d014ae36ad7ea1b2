#include "ConnectionPool.hpp"
#include <stdexcept>

ConnectionPool::Lease::Lease(ConnectionPool *pool, std::unique_ptr<StorageConnection> connection)
    : m_pool(pool), m_connection(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease &&other) noexcept
    : m_pool(other.m_pool), m_connection(std::move(other.m_connection))
{
    other.m_pool = nullptr;
}

ConnectionPool::Lease::~Lease()
{
    if (m_pool && m_connection)
    {
        m_pool->release(std::move(m_connection));
    }
}

void ConnectionPool::Lease::discard()
{
    m_connection.reset();
}

ConnectionPool::ConnectionPool(std::string address, ConnectionFactory factory, size_t maxIdle)
    : m_address(std::move(address)),
      m_factory(std::move(factory)),
      m_maxIdle(maxIdle),
      m_idle(maxIdle)
{
    if (!m_factory)
    {
        throw std::invalid_argument("ConnectionPool: null connection factory for " + m_address);
    }
}

ConnectionPool::Lease ConnectionPool::acquire()
{
    std::unique_ptr<StorageConnection> connection;
    if (m_idle.try_dequeue(connection) && connection)
    {
        return Lease(this, std::move(connection));
    }

    connection = m_factory(m_address);
    if (!connection)
    {
        throw StorageError("no connection could be opened to " + m_address);
    }
    m_opened.fetch_add(1, std::memory_order_relaxed);
    return Lease(this, std::move(connection));
}

void ConnectionPool::release(std::unique_ptr<StorageConnection> connection)
{
    // size_approx may overshoot under contention, which only costs a reconnect
    if (m_idle.size_approx() >= m_maxIdle)
    {
        return;
    }
    m_idle.enqueue(std::move(connection));
}

void ConnectionPool::clear()
{
    std::unique_ptr<StorageConnection> connection;
    while (m_idle.try_dequeue(connection))
    {
        connection.reset();
    }
}

size_t ConnectionPool::idleCount() const
{
    return m_idle.size_approx();
}
