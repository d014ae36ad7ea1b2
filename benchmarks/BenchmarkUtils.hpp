#ifndef BENCHMARK_UTILS_HPP
#define BENCHMARK_UTILS_HPP

#include "CounterService.hpp"
#include <chrono>
#include <string>
#include <vector>

// Per-call latencies of one producer, concatenated across producers
using LatencySamples = std::vector<std::chrono::nanoseconds>;

struct LatencySummary
{
    size_t calls{0};
    double meanUs{0.0};
    double p50Us{0.0};
    double p99Us{0.0};
    double worstUs{0.0};
};

// Takes the samples by value, percentile selection reorders them
LatencySummary summarizeLatencies(LatencySamples samples);

// Records one visit per key, timing each call
LatencySamples recordVisits(CounterService &service, const std::vector<std::string> &keys);

// Reads every key, timing each call
LatencySamples readCounts(CounterService &service, const std::vector<std::string> &keys);

// Page keys drawn from a Zipf-like distribution over numPages pages
std::vector<std::string> generateVisitKeys(int numVisits, int numPages, unsigned seed);

// In-memory nodes unless REDIS_NODES points at real servers
CounterConfig benchmarkConfig(int numNodes);

void printLatencySummary(const std::string &operation, const LatencySummary &summary);

#endif
