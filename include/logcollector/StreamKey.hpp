#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace logcollector {

// Identifies one log destination: the delivery routing key plus the
// producer's attempt id. Both halves are untrusted input.
struct StreamKey {
    std::string routingKey;
    std::string attemptId;

    bool operator==(const StreamKey& other) const {
        return routingKey == other.routingKey && attemptId == other.attemptId;
    }
    bool operator!=(const StreamKey& other) const { return !(*this == other); }
};

struct StreamKeyHash {
    std::size_t operator()(const StreamKey& key) const {
        std::size_t h = std::hash<std::string>{}(key.routingKey);
        h ^= std::hash<std::string>{}(key.attemptId) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        return h;
    }
};

std::string describe(const StreamKey& key);

} // namespace logcollector
