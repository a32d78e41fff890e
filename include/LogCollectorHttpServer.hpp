#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "LogCollector.hpp"

// HTTP front for queue deliveries: POST /v1/deliver/<routing_key> with the
// message as the body. Deliveries are dispatched one at a time.
class LogCollectorHttpServer {
public:
    explicit LogCollectorHttpServer(const logcollector::CollectorConfig& config);
    void run();
    void stop();

    // Blocks until run() is accepting connections.
    void waitUntilReady() const;

private:
    void setupRoutes();

    std::string host_;
    int port_;
    httplib::Server server_;
    logcollector::LogCollector collector_;
};
