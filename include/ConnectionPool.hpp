#ifndef CONNECTION_POOL_HPP
#define CONNECTION_POOL_HPP

#include "StorageConnection.hpp"
#include "concurrentqueue.h"
#include <atomic>
#include <memory>
#include <string>

/**
 * @brief Idle connections to one storage node
 *
 * Connections are borrowed through a Lease and handed back when the lease
 * goes out of scope. A lease whose connection failed is discarded so the
 * next borrower opens a fresh one. At most maxIdle connections are kept.
 */
class ConnectionPool
{
public:
    class Lease
    {
    public:
        Lease(ConnectionPool *pool, std::unique_ptr<StorageConnection> connection);
        ~Lease();

        Lease(Lease &&other) noexcept;
        Lease &operator=(Lease &&) = delete;
        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;

        StorageConnection &operator*() const { return *m_connection; }
        StorageConnection *operator->() const { return m_connection.get(); }

        // Drop the connection instead of returning it to the pool
        void discard();

    private:
        ConnectionPool *m_pool;
        std::unique_ptr<StorageConnection> m_connection;
    };

    ConnectionPool(std::string address, ConnectionFactory factory, size_t maxIdle);

    ConnectionPool(const ConnectionPool &) = delete;
    ConnectionPool &operator=(const ConnectionPool &) = delete;

    /**
     * @brief Borrows an idle connection or opens a new one
     *
     * @throws StorageError if a new connection cannot be opened
     */
    Lease acquire();

    // Closes every idle connection
    void clear();

    size_t idleCount() const;
    uint64_t openedCount() const { return m_opened.load(std::memory_order_relaxed); }
    const std::string &address() const { return m_address; }

private:
    void release(std::unique_ptr<StorageConnection> connection);

    const std::string m_address;
    ConnectionFactory m_factory;
    const size_t m_maxIdle;
    moodycamel::ConcurrentQueue<std::unique_ptr<StorageConnection>> m_idle;
    std::atomic<uint64_t> m_opened{0};
};

#endif
