#include "CounterService.hpp"
#include "ConnectionFactory.hpp"
#include <iostream>
#include <memory>

int main()
{
    // system parameters
    CounterConfig config;
    config.nodes = {"memory://node1", "memory://node2", "memory://node3"};
    config.cacheTtl = std::chrono::milliseconds(500);
    config.cacheCapacity = 100;
    config.batchInterval = std::chrono::milliseconds(200);
    config.batchSizeLimit = 50;
    config.healthCheckInterval = std::chrono::seconds(1);

    auto cluster = std::make_shared<MemoryCluster>();
    CounterService counterService(config, makeConnectionFactory(config, cluster));
    counterService.start();

    counterService.recordVisit("home");
    counterService.recordVisit("home");
    counterService.recordVisit("about");

    CountResult home = counterService.getCount("home");
    std::cout << "home: " << home.value << " from " << toString(home.source) << std::endl;

    counterService.flushNow();
    counterService.resetCount("about");

    CountResult about = counterService.getCount("about");
    std::cout << "about: " << about.value << " from " << toString(about.source)
              << " " << about.node << std::endl;

    counterService.shutdown();

    return 0;
}
