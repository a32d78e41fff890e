#include "logcollector/PathResolver.hpp"

#include <algorithm>
#include <iostream>
#include "logcollector/Errors.hpp"

namespace fs = std::filesystem;

namespace logcollector {

PathResolver::PathResolver(const fs::path& root) {
    if (root.empty()) {
        throw std::invalid_argument("PathResolver: log root must not be empty");
    }
    root_ = fs::absolute(root).lexically_normal();
    // "/var/log/builds/" -> "/var/log/builds"
    if (!root_.has_filename() && root_.has_relative_path()) {
        root_ = root_.parent_path();
    }
}

fs::path PathResolver::validateSegment(const std::string& segment) {
    if (segment.empty()) {
        throw PathValidationError("Segment has no components");
    }
    if (segment.find('\0') != std::string::npos) {
        throw PathValidationError("Segment contains a NUL byte");
    }
    if (segment.front() == '/') {
        throw PathValidationError("Segment is an absolute path: " + segment);
    }

    fs::path relative;
    size_t pos = 0;
    bool first = true;
    while (pos <= segment.size()) {
        size_t next = segment.find('/', pos);
        if (next == std::string::npos) next = segment.size();
        std::string part = segment.substr(pos, next - pos);
        pos = next + 1;

        if (part.empty()) {
            first = false;
            continue;
        }
        if (part == "..") {
            std::cerr << "PathResolver: invalid path component '..' in " << segment << "\n";
            throw PathValidationError("Path contained invalid components: " + segment);
        }
        if (part == ".") {
            // Only a leading "." survives component parsing; interior ones collapse.
            if (first) {
                std::cerr << "PathResolver: invalid path component '.' in " << segment << "\n";
                throw PathValidationError("Path contained invalid components: " + segment);
            }
            continue;
        }
        relative /= part;
        first = false;
    }

    if (relative.empty()) {
        throw PathValidationError("Segment has no components");
    }
    return relative;
}

bool PathResolver::isWithin(const fs::path& root, const fs::path& candidate) {
    auto r = root.begin();
    auto c = candidate.begin();
    for (; r != root.end(); ++r, ++c) {
        if (c == candidate.end() || *r != *c) return false;
    }
    return true;
}

fs::path PathResolver::resolveLog(const StreamKey& key) const {
    fs::path location = root_;
    location /= validateSegment(key.routingKey);
    location /= validateSegment(key.attemptId);

    if (!isWithin(root_, location)) {
        throw PathValidationError("Calculating the log location for " + describe(key) +
                                  " resulted in an invalid path " + location.string());
    }
    return location;
}

fs::path PathResolver::resolveMetadata(const StreamKey& key) const {
    fs::path path = resolveLog(key);
    path.replace_extension(kMetadataExtension);
    return path;
}

} // namespace logcollector
