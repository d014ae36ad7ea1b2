#include "Config.hpp"
#include "RedisConnection.hpp"
#include <algorithm>
#include <iterator>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace
{
    const char *const SETTING_KEYS[] = {
        "REDIS_NODES", "REDIS_PASSWORD", "REDIS_DB", "REDIS_TIMEOUT", "REDIS_RETRY_ATTEMPTS",
        "REDIS_RETRY_DELAY_MS", "REDIS_MAX_CONNECTIONS", "HEALTH_CHECK_INTERVAL_SECONDS",
        "VIRTUAL_NODES", "CACHE_TTL_SECONDS", "CACHE_CAPACITY", "BATCH_INTERVAL_SECONDS",
        "BATCH_SIZE_LIMIT", "SHUTDOWN_GRACE_SECONDS", "KEY_PREFIX"};

    std::string trim(const std::string &value)
    {
        const char *whitespace = " \t\r\n";
        size_t begin = value.find_first_not_of(whitespace);
        if (begin == std::string::npos)
        {
            return "";
        }
        size_t end = value.find_last_not_of(whitespace);
        return value.substr(begin, end - begin + 1);
    }

    size_t parseSize(const std::string &key, const std::string &value)
    {
        try
        {
            size_t consumed = 0;
            long long parsed = std::stoll(value, &consumed);
            if (consumed != value.size() || parsed < 0)
            {
                throw std::invalid_argument(value);
            }
            return static_cast<size_t>(parsed);
        }
        catch (const std::logic_error &)
        {
            throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
        }
    }

    std::chrono::milliseconds parseSeconds(const std::string &key, const std::string &value)
    {
        try
        {
            size_t consumed = 0;
            double seconds = std::stod(value, &consumed);
            if (consumed != value.size() || seconds < 0)
            {
                throw std::invalid_argument(value);
            }
            return std::chrono::milliseconds(std::llround(seconds * 1000.0));
        }
        catch (const std::logic_error &)
        {
            throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
        }
    }

    bool hasPrefix(const std::string &value, const std::string &prefix)
    {
        return value.compare(0, prefix.size(), prefix) == 0;
    }
}

std::vector<std::string> parseNodeList(const std::string &value)
{
    std::vector<std::string> nodes;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ','))
    {
        item = trim(item);
        if (!item.empty())
        {
            nodes.push_back(item);
        }
    }
    return nodes;
}

bool applySetting(CounterConfig &config, const std::string &key, const std::string &rawValue)
{
    std::string value = trim(rawValue);

    if (key == "REDIS_NODES")
        config.nodes = parseNodeList(value);
    else if (key == "REDIS_PASSWORD")
        config.password = value;
    else if (key == "REDIS_DB")
        config.database = static_cast<int>(parseSize(key, value));
    else if (key == "REDIS_TIMEOUT")
        config.storageTimeout = parseSeconds(key, value);
    else if (key == "REDIS_RETRY_ATTEMPTS")
        config.retryAttempts = parseSize(key, value);
    else if (key == "REDIS_RETRY_DELAY_MS")
        config.baseRetryDelay = std::chrono::milliseconds(parseSize(key, value));
    else if (key == "REDIS_MAX_CONNECTIONS")
        config.maxConnectionsPerNode = parseSize(key, value);
    else if (key == "HEALTH_CHECK_INTERVAL_SECONDS")
        config.healthCheckInterval = parseSeconds(key, value);
    else if (key == "VIRTUAL_NODES")
        config.virtualNodes = parseSize(key, value);
    else if (key == "CACHE_TTL_SECONDS")
        config.cacheTtl = parseSeconds(key, value);
    else if (key == "CACHE_CAPACITY")
        config.cacheCapacity = parseSize(key, value);
    else if (key == "BATCH_INTERVAL_SECONDS")
        config.batchInterval = parseSeconds(key, value);
    else if (key == "BATCH_SIZE_LIMIT")
        config.batchSizeLimit = parseSize(key, value);
    else if (key == "SHUTDOWN_GRACE_SECONDS")
        config.shutdownGrace = parseSeconds(key, value);
    else if (key == "KEY_PREFIX")
        config.keyPrefix = value;
    else
        return false;

    return true;
}

CounterConfig loadConfigFile(const std::string &configFilePath)
{
    std::ifstream file(configFilePath);
    if (!file)
    {
        throw std::runtime_error("Failed to load config file: " + configFilePath);
    }

    CounterConfig config;
    std::string line;
    while (std::getline(file, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#')
        {
            continue;
        }

        std::istringstream iss(line);
        std::string key, value;
        if (std::getline(iss, key, '=') && std::getline(iss, value))
        {
            if (!applySetting(config, trim(key), value))
            {
                std::cerr << "Config: Ignoring unknown setting " << trim(key) << std::endl;
            }
        }
    }
    return config;
}

void applyEnvironment(CounterConfig &config)
{
    for (const char *key : SETTING_KEYS)
    {
        const char *value = std::getenv(key);
        if (value != nullptr)
        {
            applySetting(config, key, value);
        }
    }
}

void validateConfig(const CounterConfig &config)
{
    if (config.nodes.empty())
    {
        throw std::invalid_argument("At least one storage node must be configured");
    }

    for (const auto &node : config.nodes)
    {
        if (hasPrefix(node, "redis://"))
        {
            try
            {
                RedisAddress::parse(node);
            }
            catch (const std::invalid_argument &e)
            {
                throw std::invalid_argument("Invalid storage node URL " + node + ": " + e.what());
            }
        }
        else if (hasPrefix(node, "memory://"))
        {
            if (node == "memory://")
            {
                throw std::invalid_argument("Memory storage node needs a name: " + node);
            }
        }
        else
        {
            throw std::invalid_argument("Invalid storage node URL format: " + node);
        }
    }

    for (auto it = config.nodes.begin(); it != config.nodes.end(); ++it)
    {
        if (std::find(std::next(it), config.nodes.end(), *it) != config.nodes.end())
        {
            throw std::invalid_argument("Duplicate storage node: " + *it);
        }
    }

    if (config.virtualNodes == 0)
        throw std::invalid_argument("VIRTUAL_NODES must be positive");
    if (config.cacheCapacity == 0)
        throw std::invalid_argument("CACHE_CAPACITY must be positive");
    if (config.batchSizeLimit == 0)
        throw std::invalid_argument("BATCH_SIZE_LIMIT must be positive");
    if (config.retryAttempts == 0)
        throw std::invalid_argument("REDIS_RETRY_ATTEMPTS must be positive");
    if (config.batchInterval.count() <= 0)
        throw std::invalid_argument("BATCH_INTERVAL_SECONDS must be positive");
    if (config.cacheTtl.count() <= 0)
        throw std::invalid_argument("CACHE_TTL_SECONDS must be positive");
    if (config.healthCheckInterval.count() <= 0)
        throw std::invalid_argument("HEALTH_CHECK_INTERVAL_SECONDS must be positive");
}
