#include "CounterService.hpp"
#include "Errors.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <future>
#include <functional>
#include <exception>

void recordVisits(CounterService &service, int producerId, int visitsPerProducer, int numPages)
{
    for (int i = 0; i < visitsPerProducer; i++)
    {
        std::string page = "page" + std::to_string((producerId + i) % numPages);
        if (!service.recordVisit(page))
        {
            std::cerr << "Producer " << producerId << ": visit to " << page << " rejected" << std::endl;
            return;
        }
    }
}

void printStatus(const ServiceStatus &status)
{
    const ServiceMetrics &metrics = status.metrics;

    std::cout << "================ Service Status ================" << std::endl;
    std::cout << "Status: " << status.status << " (" << status.healthyNodes << "/"
              << status.nodes << " nodes healthy)" << std::endl;
    for (const auto &pair : metrics.nodeHealth)
    {
        auto positions = status.distribution.find(pair.first);
        std::cout << "  " << pair.first << ": " << (pair.second ? "up" : "down") << ", "
                  << (positions != status.distribution.end() ? positions->second : 0)
                  << " ring positions" << std::endl;
    }
    std::cout << "Cache: " << metrics.cache.size << " entries, " << metrics.cache.hits << " hits, "
              << metrics.cache.misses << " misses" << std::endl;
    std::cout << "Pending: " << metrics.pendingIncrements << " increments over "
              << metrics.pendingKeys << " keys" << std::endl;
    std::cout << "Flushed: " << metrics.writer.flushedIncrements << " increments in "
              << metrics.writer.flushCycles << " cycles (" << metrics.writer.partialFlushCycles
              << " partial)" << std::endl;
    if (metrics.lastSuccessfulFlush)
    {
        auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - *metrics.lastSuccessfulFlush);
        std::cout << "Last successful flush: " << age.count() << " ms ago" << std::endl;
    }
    std::cout << "================================================" << std::endl;
}

int main(int argc, char **argv)
{
    // workload parameters
    const int numProducerThreads = 8;
    const int visitsPerProducer = 10000;
    const int numPages = 20;

    CounterConfig config;
    try
    {
        if (argc > 1)
        {
            config = loadConfigFile(argv[1]);
        }
        applyEnvironment(config);
        validateConfig(config);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    try
    {
        CounterService service(config);
        service.start();

        auto startTime = std::chrono::steady_clock::now();

        std::vector<std::future<void>> futures;
        for (int i = 0; i < numProducerThreads; i++)
        {
            futures.push_back(std::async(
                std::launch::async,
                recordVisits,
                std::ref(service),
                i,
                visitsPerProducer,
                numPages));
        }

        for (auto &future : futures)
        {
            future.wait();
        }

        auto endTime = std::chrono::steady_clock::now();
        std::chrono::duration<double> elapsed = endTime - startTime;

        const int totalVisits = numProducerThreads * visitsPerProducer;
        std::cout << "Recorded " << totalVisits << " visits in " << elapsed.count() << " seconds ("
                  << totalVisits / elapsed.count() << " visits/second)" << std::endl;

        FlushReport report = service.flushNow();
        std::cout << "Flushed " << report.flushedKeys << "/" << report.attemptedKeys << " keys" << std::endl;

        for (int page = 0; page < numPages; page++)
        {
            std::string key = "page" + std::to_string(page);
            try
            {
                CountResult count = service.getCount(key);
                std::cout << key << ": " << count.value << " (" << toString(count.source);
                if (!count.node.empty())
                {
                    std::cout << " " << count.node;
                }
                std::cout << ")" << std::endl;
            }
            catch (const StorageUnavailableError &e)
            {
                std::cerr << key << ": unavailable (" << e.what() << ")" << std::endl;
            }
        }

        printStatus(service.status());

        if (!service.shutdown())
        {
            std::cerr << "Some increments could not be flushed before shutdown" << std::endl;
            return 1;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Counter service failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
