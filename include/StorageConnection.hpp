#ifndef STORAGE_CONNECTION_HPP
#define STORAGE_CONNECTION_HPP

#include "Errors.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

/**
 * @brief One connection to a storage node
 *
 * The primitives the counter needs from a backing store. Every method throws
 * StorageError when the node cannot be reached or answers with an error.
 * A connection is used by one thread at a time.
 */
class StorageConnection
{
public:
    virtual ~StorageConnection() = default;

    // Atomically adds delta and returns the new value
    virtual int64_t incrementBy(const std::string &key, int64_t delta) = 0;

    // Current value, std::nullopt if the key was never written
    virtual std::optional<int64_t> get(const std::string &key) = 0;

    // Deletes the key, returns true if it existed
    virtual bool del(const std::string &key) = 0;

    // Lightweight liveness probe
    virtual void ping() = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<StorageConnection>(const std::string &address)>;

#endif
