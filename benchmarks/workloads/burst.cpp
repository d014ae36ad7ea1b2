#include "BenchmarkUtils.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <future>
#include <functional>
#include <utility>

int main()
{
    // system parameters
    CounterConfig config = benchmarkConfig(3);
    config.batchInterval = std::chrono::milliseconds(500);
    config.batchSizeLimit = 5000;
    config.cacheCapacity = 10000;

    // benchmark parameters
    const int numBursts = 5;
    const int numProducers = 8;
    const int visitsPerProducer = 200000;
    const int numPages = 20000;
    const int waitBetweenBurstsSec = 2;

    std::cout << "Generating visit keys for burst-pattern benchmark...";
    std::vector<std::vector<std::string>> producerKeys;
    for (int p = 0; p < numProducers; p++)
    {
        producerKeys.push_back(generateVisitKeys(visitsPerProducer, numPages, 42 + p));
    }
    std::cout << " Done." << std::endl;

    CounterService service(config);
    service.start();
    auto startTime = std::chrono::high_resolution_clock::now();

    LatencySamples recordSamples;
    for (int burst = 0; burst < numBursts; burst++)
    {
        std::vector<std::future<LatencySamples>> futures;
        for (int p = 0; p < numProducers; p++)
        {
            futures.push_back(std::async(std::launch::async, recordVisits, std::ref(service), std::cref(producerKeys[p])));
        }
        for (auto &future : futures)
        {
            LatencySamples samples = future.get();
            recordSamples.insert(recordSamples.end(), samples.begin(), samples.end());
        }

        if (burst < numBursts - 1)
        {
            std::this_thread::sleep_for(std::chrono::seconds(waitBetweenBurstsSec));
        }
    }

    bool drained = service.shutdown();
    auto endTime = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = endTime - startTime;

    ServiceMetrics metrics = service.metrics();
    double elapsedSeconds = elapsed.count();
    const size_t totalVisits = static_cast<size_t>(numBursts) * numProducers * visitsPerProducer;
    double visitsThroughput = totalVisits / elapsedSeconds;
    double writeReduction = metrics.writer.flushCycles > 0
                                ? static_cast<double>(totalVisits) / metrics.writer.flushCycles
                                : 0.0;

    std::cout << "============== Burst Benchmark Results ==============" << std::endl;
    std::cout << "Execution time: " << elapsedSeconds << " seconds" << std::endl;
    std::cout << "Number of bursts: " << numBursts << std::endl;
    std::cout << "Total visits recorded: " << totalVisits << std::endl;
    std::cout << "Flushed increments: " << metrics.writer.flushedIncrements << std::endl;
    std::cout << "Flush cycles: " << metrics.writer.flushCycles << " (" << metrics.writer.overflowFlushes
              << " triggered by size limit)" << std::endl;
    std::cout << "Visits per flush cycle: " << writeReduction << std::endl;
    std::cout << "Drained on shutdown: " << (drained ? "yes" : "no") << std::endl;
    std::cout << "Throughput: " << visitsThroughput << " visits/second" << std::endl;
    std::cout << "===============================================" << std::endl;

    printLatencySummary("Record", summarizeLatencies(std::move(recordSamples)));

    return 0;
}
