#ifndef CONNECTION_FACTORY_HPP
#define CONNECTION_FACTORY_HPP

#include "Config.hpp"
#include "MemoryStore.hpp"
#include "StorageConnection.hpp"
#include <memory>

// Opens RedisConnections for redis:// addresses and MemoryConnections for
// memory:// addresses. Password and database from the URL take precedence
// over the ones in the config. A cluster is created when none is given.
ConnectionFactory makeConnectionFactory(const CounterConfig &config,
                                        std::shared_ptr<MemoryCluster> memoryCluster = nullptr);

#endif
