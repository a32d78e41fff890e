#include "logcollector/StreamKey.hpp"

#include <nlohmann/json.hpp>

namespace logcollector {

std::string describe(const StreamKey& key) {
    // Keys are untrusted; quote and escape them before they reach a log line.
    auto quote = [](const std::string& s) {
        return nlohmann::json(s).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    };
    return "{routing_key=" + quote(key.routingKey) + ", attempt_id=" + quote(key.attemptId) + "}";
}

} // namespace logcollector
