#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "logcollector/StreamKey.hpp"

namespace logcollector {

// Sent once when a build attempt starts.
struct BuildLogStart {
    std::string system;
    std::string identity;
    std::string attemptId;
    std::optional<std::vector<std::string>> attemptedAttrs;
    std::optional<std::vector<std::string>> skippedAttrs;
};

// One line of build output. lineNumber is 1-based.
struct BuildLogMsg {
    std::string system;
    std::string identity;
    std::string attemptId;
    uint64_t lineNumber = 0;
    std::string output;
};

// Terminal result of an attempt. Only attemptId is interpreted; the rest is
// kept as received.
struct BuildResult {
    std::string attemptId;
    std::string system;
    nlohmann::json raw;
};

using LogEvent = std::variant<BuildLogMsg, BuildLogStart, BuildResult>;

struct LogMessage {
    StreamKey from;
    LogEvent event;
};

// "chunk", "start" or "finish".
const char* kindName(const LogEvent& event);

// Trial-decodes `body` as a chunk, then a start, then a finish message. The
// wire format has no discriminator and the shapes overlap, so the order is
// part of the contract. Throws DecodeError if nothing matches.
LogMessage classify(const std::string& routingKey, const std::string& body);

// Per-shape decoders; std::nullopt when the document does not fit.
std::optional<BuildLogMsg> decodeChunk(const nlohmann::json& doc);
std::optional<BuildLogStart> decodeStart(const nlohmann::json& doc);
std::optional<BuildResult> decodeFinish(const nlohmann::json& doc);

} // namespace logcollector
