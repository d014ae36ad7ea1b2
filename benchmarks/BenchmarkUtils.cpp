#include "BenchmarkUtils.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <random>

namespace
{
    template <typename Call>
    LatencySamples timeEach(const std::vector<std::string> &keys, Call call)
    {
        LatencySamples samples;
        samples.reserve(keys.size());
        for (const auto &key : keys)
        {
            auto started = std::chrono::steady_clock::now();
            call(key);
            samples.push_back(std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - started));
        }
        return samples;
    }

    double toMicros(std::chrono::nanoseconds duration)
    {
        return std::chrono::duration<double, std::micro>(duration).count();
    }

    // Nearest-rank percentile; moves the selected element into place
    double percentile(LatencySamples &samples, double fraction)
    {
        size_t rank = static_cast<size_t>(fraction * (samples.size() - 1));
        std::nth_element(samples.begin(), samples.begin() + rank, samples.end());
        return toMicros(samples[rank]);
    }
}

LatencySamples recordVisits(CounterService &service, const std::vector<std::string> &keys)
{
    size_t rejected = 0;
    LatencySamples samples = timeEach(keys, [&](const std::string &key)
                                      {
        if (!service.recordVisit(key))
        {
            ++rejected;
        } });
    if (rejected > 0)
    {
        std::cerr << "Benchmark: " << rejected << " visits rejected" << std::endl;
    }
    return samples;
}

LatencySamples readCounts(CounterService &service, const std::vector<std::string> &keys)
{
    size_t unavailable = 0;
    LatencySamples samples = timeEach(keys, [&](const std::string &key)
                                      {
        try
        {
            service.getCount(key);
        }
        catch (const StorageUnavailableError &)
        {
            ++unavailable;
        } });
    if (unavailable > 0)
    {
        std::cerr << "Benchmark: " << unavailable << " reads hit an unavailable node" << std::endl;
    }
    return samples;
}

std::vector<std::string> generateVisitKeys(int numVisits, int numPages, unsigned seed)
{
    std::mt19937 rng(seed);

    // Zipfian popularity: a few pages get most of the traffic
    std::vector<double> weights;
    weights.reserve(numPages);
    for (int k = 0; k < numPages; ++k)
    {
        weights.push_back(1.0 / (k + 1.0));
    }
    std::discrete_distribution<int> pageDist(weights.begin(), weights.end());

    std::vector<std::string> keys;
    keys.reserve(numVisits);
    for (int i = 0; i < numVisits; ++i)
    {
        keys.push_back("page/" + std::to_string(pageDist(rng)));
    }
    return keys;
}

CounterConfig benchmarkConfig(int numNodes)
{
    CounterConfig config;
    config.nodes.clear();
    for (int i = 0; i < numNodes; ++i)
    {
        config.nodes.push_back("memory://bench" + std::to_string(i + 1));
    }
    applyEnvironment(config);
    validateConfig(config);
    return config;
}

LatencySummary summarizeLatencies(LatencySamples samples)
{
    LatencySummary summary;
    if (samples.empty())
    {
        return summary;
    }

    summary.calls = samples.size();
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds worst{0};
    for (auto sample : samples)
    {
        total += sample;
        worst = std::max(worst, sample);
    }
    summary.meanUs = toMicros(total) / samples.size();
    summary.worstUs = toMicros(worst);
    summary.p50Us = percentile(samples, 0.50);
    summary.p99Us = percentile(samples, 0.99);
    return summary;
}

void printLatencySummary(const std::string &operation, const LatencySummary &summary)
{
    std::cout << std::fixed << std::setprecision(2)
              << operation << " latency over " << summary.calls << " calls (us): mean " << summary.meanUs
              << ", p50 " << summary.p50Us << ", p99 " << summary.p99Us << ", worst " << summary.worstUs
              << std::endl;
}
