//LogCollector.hpp
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "logcollector/Config.hpp"
#include "logcollector/HandleCache.hpp"
#include "logcollector/LogEvent.hpp"
#include "logcollector/PathResolver.hpp"

namespace logcollector {

enum class Action { Ack };
using Actions = std::vector<Action>;

const char* actionName(Action action);

// Turns build log deliveries into files under a log root:
//   <root>/<routing_key>/<attempt_id>                 assembled log
//   <root>/<routing_key>/<attempt_id>.metadata.json   start metadata
// Processes one message at a time; callers serialize access.
class LogCollector {
public:
    LogCollector(const std::filesystem::path& logRoot, std::size_t maxOpen);
    explicit LogCollector(const CollectorConfig& config);
    ~LogCollector();

    LogCollector(const LogCollector&) = delete;
    LogCollector& operator=(const LogCollector&) = delete;

    // Decode a delivery. Throws DecodeError; no side effects.
    LogMessage classify(const std::string& routingKey, const std::string& body) const;

    // Dispatch a decoded message. Returns exactly one Ack on success and
    // throws PathValidationError, IoError or SerializationError otherwise.
    Actions consume(const LogMessage& message);

    // classify() followed by consume().
    Actions handleDelivery(const std::string& routingKey, const std::string& body);

    void writeMetadata(const StreamKey& from, const BuildLogStart& start);
    LineWriter& handleFor(const StreamKey& from);

    std::filesystem::path pathForLog(const StreamKey& from) const { return resolver_.resolveLog(from); }
    std::filesystem::path pathForMetadata(const StreamKey& from) const { return resolver_.resolveMetadata(from); }

    const std::filesystem::path& logRoot() const { return resolver_.root(); }
    std::size_t maxOpen() const { return handles_.capacity(); }
    std::size_t openHandles() const { return handles_.size(); }

    bool flush() { return handles_.flushAll(); }

private:
    PathResolver resolver_;
    HandleCache handles_;
};

} // namespace logcollector
