#include "logcollector/Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace logcollector {

CollectorConfig CollectorConfig::fromEnvironment() {
    CollectorConfig config;
    if (const char* envRoot = std::getenv("LOGCOLLECTOR_ROOT")) {
        if (*envRoot != '\0') config.logRoot = envRoot;
    }
    if (const char* envMaxOpen = std::getenv("LOGCOLLECTOR_MAX_OPEN")) {
        try {
            // stoull accepts "-1" and wraps it.
            if (std::string(envMaxOpen).find('-') != std::string::npos) throw std::invalid_argument("negative");
            config.maxOpen = std::max<std::size_t>(1, static_cast<std::size_t>(std::stoull(envMaxOpen)));
        } catch (const std::exception&) {
            std::cerr << "Config: ignoring LOGCOLLECTOR_MAX_OPEN=" << envMaxOpen << "\n";
        }
    }
    if (const char* envHost = std::getenv("LOGCOLLECTOR_HOST")) {
        if (*envHost != '\0') config.host = envHost;
    }
    if (const char* envPort = std::getenv("LOGCOLLECTOR_PORT")) {
        try {
            int port = std::stoi(envPort);
            if (port > 0 && port <= 65535) {
                config.port = port;
            } else {
                std::cerr << "Config: ignoring out-of-range LOGCOLLECTOR_PORT=" << envPort << "\n";
            }
        } catch (const std::exception&) {
            std::cerr << "Config: ignoring LOGCOLLECTOR_PORT=" << envPort << "\n";
        }
    }
    return config;
}

} // namespace logcollector
