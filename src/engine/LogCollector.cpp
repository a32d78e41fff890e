//LogCollector.cpp
#include "LogCollector.hpp"

#include <iostream>
#include <type_traits>
#include "logcollector/MetadataWriter.hpp"

namespace logcollector {

const char* actionName(Action action) {
    switch (action) {
    case Action::Ack: return "ack";
    }
    return "unknown";
}

LogCollector::LogCollector(const std::filesystem::path& logRoot, std::size_t maxOpen)
    : resolver_(logRoot), handles_(resolver_, maxOpen) {
    std::cerr << "LogCollector: logRoot=" << resolver_.root().string() << " maxOpen=" << maxOpen << "\n";
}

LogCollector::LogCollector(const CollectorConfig& config)
    : LogCollector(config.logRoot, config.maxOpen) {}

LogCollector::~LogCollector() {
    handles_.clear();
}

LogMessage LogCollector::classify(const std::string& routingKey, const std::string& body) const {
    return logcollector::classify(routingKey, body);
}

void LogCollector::writeMetadata(const StreamKey& from, const BuildLogStart& start) {
    logcollector::writeMetadata(resolver_.resolveMetadata(from), start);
}

LineWriter& LogCollector::handleFor(const StreamKey& from) {
    return handles_.getOrCreate(from);
}

Actions LogCollector::consume(const LogMessage& message) {
    std::visit([this, &message](const auto& event) {
        using T = std::decay_t<decltype(event)>;
        if constexpr (std::is_same_v<T, BuildLogStart>) {
            writeMetadata(message.from, event);
        } else if constexpr (std::is_same_v<T, BuildLogMsg>) {
            // Wire line numbers are 1-based, as is LineWriter.
            handleFor(message.from).writeToLine(event.lineNumber, event.output);
        } else {
            // Results are acknowledged but not persisted yet.
        }
    }, message.event);

    return Actions{Action::Ack};
}

Actions LogCollector::handleDelivery(const std::string& routingKey, const std::string& body) {
    return consume(classify(routingKey, body));
}

} // namespace logcollector
