#pragma once

#include <stdexcept>
#include <string>

namespace logcollector {

// Base for every failure surfaced by the collector.
class CollectorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Payload matched none of the known message shapes.
class DecodeError : public CollectorError {
public:
    using CollectorError::CollectorError;
};

// routing_key / attempt_id rejected, or the joined path escaped the root.
class PathValidationError : public CollectorError {
public:
    using CollectorError::CollectorError;
};

class IoError : public CollectorError {
public:
    using CollectorError::CollectorError;
};

class SerializationError : public CollectorError {
public:
    using CollectorError::CollectorError;
};

} // namespace logcollector
