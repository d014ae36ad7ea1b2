#include "ConnectionFactory.hpp"
#include "RedisConnection.hpp"
#include <stdexcept>

ConnectionFactory makeConnectionFactory(const CounterConfig &config,
                                        std::shared_ptr<MemoryCluster> memoryCluster)
{
    if (!memoryCluster)
    {
        memoryCluster = std::make_shared<MemoryCluster>();
    }

    std::string password = config.password;
    int database = config.database;
    std::chrono::milliseconds timeout = config.storageTimeout;

    return [memoryCluster, password, database, timeout](const std::string &address) -> std::unique_ptr<StorageConnection>
    {
        const std::string memoryScheme(MemoryCluster::SCHEME);
        if (address.compare(0, memoryScheme.size(), memoryScheme) == 0)
        {
            return memoryCluster->connect(address);
        }

        RedisAddress redis = RedisAddress::parse(address);
        if (redis.password.empty())
        {
            redis.password = password;
        }
        if (redis.database == 0)
        {
            redis.database = database;
        }
        return std::make_unique<RedisConnection>(std::move(redis), timeout);
    };
}
