#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <string>
#include <vector>

struct CounterConfig
{
    // storage nodes
    std::vector<std::string> nodes = {"redis://redis1:6379", "redis://redis2:6379", "redis://redis3:6379"};
    std::string password;
    int database = 0;
    std::chrono::milliseconds storageTimeout = std::chrono::milliseconds(5000);
    size_t retryAttempts = 3;
    std::chrono::milliseconds baseRetryDelay = std::chrono::milliseconds(100);
    size_t maxConnectionsPerNode = 10;
    std::chrono::milliseconds healthCheckInterval = std::chrono::milliseconds(30000);
    // hash ring
    size_t virtualNodes = 100;
    // cache
    std::chrono::milliseconds cacheTtl = std::chrono::milliseconds(5000);
    size_t cacheCapacity = 1000;
    // batch writer
    std::chrono::milliseconds batchInterval = std::chrono::milliseconds(5000);
    size_t batchSizeLimit = 1000; // pending keys before an out-of-cycle flush
    std::chrono::milliseconds shutdownGrace = std::chrono::milliseconds(5000);
    // storage key namespace
    std::string keyPrefix = "visits:";
};

// Splits a comma separated node list, trimming whitespace and dropping empty items
std::vector<std::string> parseNodeList(const std::string &value);

/**
 * @brief Applies one setting by its environment name (e.g. CACHE_TTL_SECONDS)
 *
 * @return false if the key is not a known setting
 * @throws std::invalid_argument if the value cannot be parsed
 */
bool applySetting(CounterConfig &config, const std::string &key, const std::string &value);

// Reads KEY=value lines; blank lines and lines starting with '#' are skipped
CounterConfig loadConfigFile(const std::string &configFilePath);

// Overrides every known setting present in the process environment
void applyEnvironment(CounterConfig &config);

// Throws std::invalid_argument describing the first invalid setting
void validateConfig(const CounterConfig &config);

#endif
