#include "BenchmarkUtils.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <vector>
#include <future>
#include <functional>
#include <utility>

struct MixResult
{
    int producers;
    double elapsedSeconds;
    LatencySummary record;
    LatencySummary read;
    CounterCache::Stats cacheStats;
};

MixResult runMix(int numProducers, int operationsPerProducer, int numPages)
{
    CounterConfig config = benchmarkConfig(3);
    config.batchInterval = std::chrono::milliseconds(200);
    config.cacheTtl = std::chrono::milliseconds(1000);

    CounterService service(config);
    service.start();

    std::vector<std::vector<std::string>> writeKeys;
    std::vector<std::vector<std::string>> readKeys;
    for (int p = 0; p < numProducers; p++)
    {
        writeKeys.push_back(generateVisitKeys(operationsPerProducer, numPages, 7 + p));
        readKeys.push_back(generateVisitKeys(operationsPerProducer / 10, numPages, 1007 + p));
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    std::vector<std::future<LatencySamples>> writers;
    std::vector<std::future<LatencySamples>> readers;
    for (int p = 0; p < numProducers; p++)
    {
        writers.push_back(std::async(std::launch::async, recordVisits, std::ref(service), std::cref(writeKeys[p])));
        readers.push_back(std::async(std::launch::async, readCounts, std::ref(service), std::cref(readKeys[p])));
    }

    LatencySamples recordSamples;
    LatencySamples readSamples;
    for (auto &future : writers)
    {
        LatencySamples samples = future.get();
        recordSamples.insert(recordSamples.end(), samples.begin(), samples.end());
    }
    for (auto &future : readers)
    {
        LatencySamples samples = future.get();
        readSamples.insert(readSamples.end(), samples.begin(), samples.end());
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    service.shutdown();

    MixResult result;
    result.producers = numProducers;
    result.elapsedSeconds = std::chrono::duration<double>(endTime - startTime).count();
    result.record = summarizeLatencies(std::move(recordSamples));
    result.read = summarizeLatencies(std::move(readSamples));
    result.cacheStats = service.metrics().cache;
    return result;
}

int main()
{
    // benchmark parameters
    const std::vector<int> producerCounts = {1, 2, 4, 8, 16};
    const int operationsPerProducer = 100000;
    const int numPages = 5000;

    std::vector<MixResult> results;
    for (int producers : producerCounts)
    {
        std::cout << "Running read/write mix with " << producers << " producers..." << std::endl;
        results.push_back(runMix(producers, operationsPerProducer, numPages));
    }

    std::cout << "============== Read/Write Mix Results ==============" << std::endl;
    std::cout << std::setw(10) << "Producers" << std::setw(14) << "Visits/s"
              << std::setw(16) << "Record p99 us" << std::setw(14) << "Read p99 us"
              << std::setw(12) << "Hit rate" << std::endl;
    for (const auto &result : results)
    {
        double visitsPerSecond = result.producers * operationsPerProducer / result.elapsedSeconds;
        uint64_t lookups = result.cacheStats.hits + result.cacheStats.misses;
        double hitRate = lookups > 0 ? static_cast<double>(result.cacheStats.hits) / lookups : 0.0;
        std::cout << std::setw(10) << result.producers << std::setw(14) << std::fixed << std::setprecision(0)
                  << visitsPerSecond << std::setw(16) << std::setprecision(2) << result.record.p99Us
                  << std::setw(14) << result.read.p99Us << std::setw(12) << std::setprecision(3)
                  << hitRate << std::endl;
    }
    std::cout << "===============================================" << std::endl;

    return 0;
}
