#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Ring has no nodes to route to. Raised at startup for an empty node list.
class NoAvailableNodeError : public std::runtime_error
{
public:
    explicit NoAvailableNodeError(const std::string &message)
        : std::runtime_error(message) {}
};

// One failed attempt against a storage connection (transport or protocol).
// Retried by retryWithBackoff, never surfaced past the ShardRegistry.
class StorageError : public std::runtime_error
{
public:
    explicit StorageError(const std::string &message)
        : std::runtime_error(message) {}
};

// The node owning a key could not be reached within the retry budget.
class StorageUnavailableError : public std::runtime_error
{
public:
    StorageUnavailableError(const std::string &node, const std::string &message)
        : std::runtime_error("storage node " + node + " unavailable: " + message),
          m_node(node) {}

    const std::string &node() const { return m_node; }

private:
    std::string m_node;
};

#endif
