#pragma once

#include <cstddef>
#include <string>

namespace logcollector {

struct CollectorConfig {
    std::string logRoot = "logs";
    std::size_t maxOpen = 64;

    // Ingest server bind address.
    std::string host = "0.0.0.0";
    int port = 8080;

    // Defaults overridden by LOGCOLLECTOR_ROOT, LOGCOLLECTOR_MAX_OPEN,
    // LOGCOLLECTOR_HOST and LOGCOLLECTOR_PORT. Unparsable numbers keep the
    // default.
    static CollectorConfig fromEnvironment();
};

} // namespace logcollector
