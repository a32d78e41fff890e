#include "LogCollectorHttpServer.hpp"
#include <iostream>

int main() {
    try {
        auto config = logcollector::CollectorConfig::fromEnvironment();
        LogCollectorHttpServer app(config);
        std::cout << "Starting log collector...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
